#include "internal/text/language_words.hpp"

#include <cstdint>

#include <limits>
#include <string>
#include <vector>

#include "internal/text/number_words.hpp"
#include "internal/text/scale_units.hpp"
#include "internal/text/text_utils.hpp"

namespace numwords {
namespace text {

namespace {

void pushConjunction(const LanguageWordTable& table, std::vector<std::string>& words) {
    if (table.conjunction[0] != '\0') {
        words.push_back(table.conjunction);
    }
}

// =============================================================================
// Tens and units
// =============================================================================

void renderTensUnits(int64_t number, const LanguageWordTable& table,
                     std::vector<std::string>& words) {
    if (number < 20) {
        words.push_back(table.units[number]);
        return;
    }

    int64_t tens = number / 10;
    int64_t units = number % 10;
    if (units == 0) {
        words.push_back(table.tens[tens]);
        return;
    }

    if (table.language == Language::ARABIC) {
        // 阿拉伯语先读个位: واحد و عشرون
        words.push_back(table.units[units]);
        pushConjunction(table, words);
        words.push_back(table.tens[tens]);
    } else {
        words.push_back(table.tens[tens]);
        pushConjunction(table, words);
        words.push_back(table.units[units]);
    }
}

// =============================================================================
// Group rendering (thousands -> hundreds -> tens/units)
// =============================================================================

void renderGroups(int64_t number, const LanguageWordTable& table,
                  std::vector<std::string>& words) {
    bool is_arabic = table.language == Language::ARABIC;
    bool emitted = false;

    if (number >= kThousand) {
        int64_t quotient = number / kThousand;
        number %= kThousand;
        // "Mil" 而不是 "Uno Mil"
        if (quotient > 1) {
            renderGroups(quotient, table, words);
        }
        words.push_back(table.thousand);
        emitted = true;
    }

    if (number >= kHundred) {
        int64_t digit = number / kHundred;
        number %= kHundred;
        if (is_arabic && emitted) {
            pushConjunction(table, words);
        }
        if (digit == 1) {
            words.push_back(number > 0 ? table.hundred_compound : table.hundred);
        } else {
            words.push_back(hundredsWord(digit, table));
        }
        emitted = true;
    }

    if (number > 0) {
        if (is_arabic && emitted) {
            pushConjunction(table, words);
        }
        renderTensUnits(number, table, words);
    }
}

}  // namespace

// =============================================================================
// Public conversion
// =============================================================================

std::string hundredsWord(int64_t digit, const LanguageWordTable& table) {
    if (digit < 1 || digit > 9) return "";
    if (digit == 1) return table.hundred;

    const char* irregular = table.hundreds_irregular[digit];
    if (irregular[0] != '\0') {
        return irregular;
    }

    std::string stem = toLowerAscii(table.units[digit]);
    std::string trim_suffix = table.hundreds_stem_trim;
    if (!trim_suffix.empty() && endsWith(stem, trim_suffix)) {
        stem.erase(stem.length() - trim_suffix.length());
    }
    return capitalizeAscii(stem + table.hundreds_suffix);
}

ErrorInfo numberToTextLang(int64_t number, const std::string& lang_code, std::string& out) {
    const LanguageWordTable* table = findLanguageTable(lang_code);
    if (!table) {
        return ErrorInfo::error(ErrorCode::UNSUPPORTED_LANGUAGE,
            "Unsupported language: " + lang_code);
    }
    return numberToTextLang(number, *table, out);
}

ErrorInfo numberToTextLang(int64_t number, const LanguageWordTable& table, std::string& out) {
    if (table.language == Language::ENGLISH) {
        return numberToText(number, out);
    }

    if (number == 0) {
        out = table.zero;
        return ErrorInfo::ok();
    }
    if (number == std::numeric_limits<int64_t>::min()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Cannot negate the minimum 64-bit integer", std::to_string(number));
    }

    int64_t magnitude = number < 0 ? -number : number;
    if (magnitude >= kMaxMagnitude) {
        return ErrorInfo::error(ErrorCode::VALUE_TOO_LARGE,
            "Number is too large to convert", std::to_string(number));
    }

    std::vector<std::string> words;
    if (number < 0) {
        words.push_back(table.minus);
    }
    renderGroups(magnitude, table, words);

    out = joinWords(words);
    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace numwords
