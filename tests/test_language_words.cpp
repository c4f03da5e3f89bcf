// File: tests/test_language_words.cpp
// Purpose: Verify table-driven cardinal words for Spanish and Arabic and the
//          language lookup by code, ISO 639-2 code and English name.
// Key invariants: Spanish joins tens and units with "y", Arabic reads units
//                 before tens and joins every group with "و", English
//                 delegates to the core converter.

#include <gtest/gtest.h>

#include <cstdint>

#include <limits>
#include <string>

#include "internal/numwords_types.hpp"
#include "internal/text/language_tables.hpp"
#include "internal/text/language_words.hpp"
#include "internal/text/number_words.hpp"

using namespace numwords;
using namespace numwords::text;

namespace {

std::string lang(int64_t number, const std::string& code) {
    std::string out;
    ErrorInfo err = numberToTextLang(number, code, out);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

}  // namespace

// =============================================================================
// Spanish
// =============================================================================

TEST(SpanishWordsTest, TensAndUnits) {
    EXPECT_EQ(lang(0, "es"), "Cero");
    EXPECT_EQ(lang(15, "es"), "Quince");
    EXPECT_EQ(lang(16, "es"), "Dieciséis");
    EXPECT_EQ(lang(20, "es"), "Veinte");
    EXPECT_EQ(lang(21, "es"), "Veinte y Uno");
    EXPECT_EQ(lang(99, "es"), "Noventa y Nueve");
}

TEST(SpanishWordsTest, HundredsAgreeWithRemainder) {
    EXPECT_EQ(lang(100, "es"), "Cien");
    EXPECT_EQ(lang(101, "es"), "Ciento Uno");
    EXPECT_EQ(lang(200, "es"), "Doscientos");
    EXPECT_EQ(lang(300, "es"), "Trescientos");
    EXPECT_EQ(lang(600, "es"), "Seiscientos");
}

TEST(SpanishWordsTest, IrregularHundreds) {
    EXPECT_EQ(lang(500, "es"), "Quinientos");
    EXPECT_EQ(lang(700, "es"), "Setecientos");
    EXPECT_EQ(lang(900, "es"), "Novecientos");
}

TEST(SpanishWordsTest, ThousandsDropLeadingOne) {
    EXPECT_EQ(lang(1000, "es"), "Mil");
    EXPECT_EQ(lang(2000, "es"), "Dos Mil");
    EXPECT_EQ(lang(1999, "es"), "Mil Novecientos Noventa y Nueve");
    EXPECT_EQ(lang(2500, "es"), "Dos Mil Quinientos");
}

TEST(SpanishWordsTest, MillionsNestThousands) {
    EXPECT_EQ(lang(2000000, "es"), "Dos Mil Mil");
}

TEST(SpanishWordsTest, Negative) {
    EXPECT_EQ(lang(-5, "es"), "Menos Cinco");
    EXPECT_EQ(lang(-21, "es"), "Menos Veinte y Uno");
}

// =============================================================================
// Arabic
// =============================================================================

TEST(ArabicWordsTest, UnitsBeforeTens) {
    EXPECT_EQ(lang(0, "ar"), "صفر");
    EXPECT_EQ(lang(3, "ar"), "ثلاثة");
    EXPECT_EQ(lang(20, "ar"), "عشرون");
    EXPECT_EQ(lang(21, "ar"), "واحد و عشرون");
}

TEST(ArabicWordsTest, Hundreds) {
    EXPECT_EQ(lang(100, "ar"), "مائة");
    EXPECT_EQ(lang(200, "ar"), "مئتان");
    EXPECT_EQ(lang(300, "ar"), "ثلاثمائة");
    EXPECT_EQ(lang(125, "ar"), "مائة و خمسة و عشرون");
}

TEST(ArabicWordsTest, ConjunctionBetweenGroups) {
    EXPECT_EQ(lang(1000, "ar"), "ألف");
    EXPECT_EQ(lang(1100, "ar"), "ألف و مائة");
    EXPECT_EQ(lang(2021, "ar"), "اثنان ألف و واحد و عشرون");
}

TEST(ArabicWordsTest, Negative) {
    EXPECT_EQ(lang(-3, "ar"), "سالب ثلاثة");
}

// =============================================================================
// Language lookup
// =============================================================================

TEST(LanguageLookupTest, AcceptsCodesAndNamesCaseInsensitively) {
    EXPECT_EQ(lang(21, "SPA"), "Veinte y Uno");
    EXPECT_EQ(lang(21, "Spanish"), "Veinte y Uno");
    EXPECT_EQ(lang(21, " es "), "Veinte y Uno");
    EXPECT_EQ(lang(21, "ara"), "واحد و عشرون");
}

TEST(LanguageLookupTest, UnknownCodeIsUnsupported) {
    std::string out = "unchanged";
    EXPECT_EQ(numberToTextLang(21, "fr", out).code, ErrorCode::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(numberToTextLang(21, "", out).code, ErrorCode::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(out, "unchanged");
    EXPECT_EQ(findLanguageTable("klingon"), nullptr);
}

TEST(LanguageLookupTest, EnglishDelegatesToCoreConverter) {
    for (int64_t n : {0LL, 21LL, 1000LL, -1234LL, 1234567LL}) {
        std::string expected;
        ASSERT_TRUE(numberToText(n, expected).isOk());
        EXPECT_EQ(lang(n, "en"), expected);
        EXPECT_EQ(lang(n, "english"), expected);
    }
}

TEST(LanguageLookupTest, SupportedLanguagesListsAllTables) {
    auto languages = getSupportedLanguages();
    ASSERT_EQ(languages.size(), 3u);
    EXPECT_STREQ(languages[0]->code, "en");
    EXPECT_STREQ(languages[1]->code, "es");
    EXPECT_STREQ(languages[2]->code, "ar");
}

// =============================================================================
// Shared guards
// =============================================================================

TEST(LanguageGuardTest, RangeChecksMatchEnglish) {
    std::string out;
    EXPECT_EQ(numberToTextLang(std::numeric_limits<int64_t>::min(), "es", out).code,
        ErrorCode::INVALID_INPUT);
    EXPECT_EQ(numberToTextLang(std::numeric_limits<int64_t>::max() / 2, "ar", out).code,
        ErrorCode::VALUE_TOO_LARGE);
}

TEST(LanguageGuardTest, HundredsWordOutOfRangeIsEmpty) {
    const LanguageWordTable& spanish = getLanguageTable(Language::SPANISH);
    EXPECT_EQ(hundredsWord(0, spanish), "");
    EXPECT_EQ(hundredsWord(10, spanish), "");
    EXPECT_EQ(hundredsWord(1, spanish), "Cien");
    EXPECT_EQ(hundredsWord(4, spanish), "Cuatrocientos");
}
