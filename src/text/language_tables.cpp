#include "internal/text/language_tables.hpp"

#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace numwords {
namespace text {

// =============================================================================
// Word tables
// =============================================================================

namespace {

const LanguageWordTable ENGLISH_TABLE = {
    Language::ENGLISH, "en", "eng", "English",
    {
        "Zero", "One", "Two", "Three", "Four", "Five",
        "Six", "Seven", "Eight", "Nine", "Ten",
        "Eleven", "Twelve", "Thirteen", "Fourteen", "Fifteen",
        "Sixteen", "Seventeen", "Eighteen", "Nineteen"
    },
    {
        "", "", "Twenty", "Thirty", "Forty", "Fifty",
        "Sixty", "Seventy", "Eighty", "Ninety"
    },
    "Hundred",
    "Hundred",
    " Hundred",
    "",
    {"", "", "", "", "", "", "", "", "", ""},
    "Thousand",
    "Zero",
    "Minus",
    "and",
};

const LanguageWordTable SPANISH_TABLE = {
    Language::SPANISH, "es", "spa", "Spanish",
    {
        "Cero", "Uno", "Dos", "Tres", "Cuatro", "Cinco",
        "Seis", "Siete", "Ocho", "Nueve", "Diez",
        "Once", "Doce", "Trece", "Catorce", "Quince",
        "Dieciséis", "Diecisiete", "Dieciocho", "Diecinueve"
    },
    {
        "", "", "Veinte", "Treinta", "Cuarenta", "Cincuenta",
        "Sesenta", "Setenta", "Ochenta", "Noventa"
    },
    "Cien",
    "Ciento",
    "cientos",
    "",
    {"", "", "", "", "", "Quinientos", "", "Setecientos", "", "Novecientos"},
    "Mil",
    "Cero",
    "Menos",
    "y",
};

const LanguageWordTable ARABIC_TABLE = {
    Language::ARABIC, "ar", "ara", "Arabic",
    {
        "صفر", "واحد", "اثنان", "ثلاثة", "أربعة", "خمسة",
        "ستة", "سبعة", "ثمانية", "تسعة", "عشرة",
        "أحد عشر", "اثنا عشر", "ثلاثة عشر", "أربعة عشر", "خمسة عشر",
        "ستة عشر", "سبعة عشر", "ثمانية عشر", "تسعة عشر"
    },
    {
        "", "", "عشرون", "ثلاثون", "أربعون", "خمسون",
        "ستون", "سبعون", "ثمانون", "تسعون"
    },
    "مائة",
    "مائة",
    "مائة",
    "ة",
    {"", "", "مئتان", "", "", "", "", "", "", ""},
    "ألف",
    "صفر",
    "سالب",
    "و",
};

}  // namespace

// =============================================================================
// Lookup
// =============================================================================

const LanguageWordTable& getLanguageTable(Language lang) {
    switch (lang) {
        case Language::SPANISH: return SPANISH_TABLE;
        case Language::ARABIC:  return ARABIC_TABLE;
        case Language::ENGLISH:
        default:                return ENGLISH_TABLE;
    }
}

const LanguageWordTable* findLanguageTable(const std::string& code) {
    std::string key = toLowerAscii(trim(code));
    if (key.empty()) return nullptr;

    for (const LanguageWordTable* table : getSupportedLanguages()) {
        if (key == table->code ||
            key == table->iso3 ||
            key == toLowerAscii(table->name)) {
            return table;
        }
    }
    return nullptr;
}

std::vector<const LanguageWordTable*> getSupportedLanguages() {
    return {&ENGLISH_TABLE, &SPANISH_TABLE, &ARABIC_TABLE};
}

}  // namespace text
}  // namespace numwords
