#include "internal/text/number_words.hpp"

#include <cstdint>

#include <limits>
#include <string>
#include <vector>

#include "internal/text/language_tables.hpp"
#include "internal/text/scale_units.hpp"
#include "internal/text/text_utils.hpp"

namespace numwords {
namespace text {

namespace {

ErrorInfo convertWords(int64_t number, std::vector<std::string>& words);

// Quotient is always < 1000 because adjacent divisors differ by 1000x
ErrorInfo convertLargeNumber(int64_t number, const ScaleUnit& unit,
                             std::vector<std::string>& words) {
    int64_t quotient = number / unit.divisor;
    int64_t remainder = number % unit.divisor;

    if (quotient != 0) {
        auto err = renderSmall(quotient, words);
        if (!err.isOk()) {
            return ErrorInfo::wrap(std::string("Failed to render ") + unit.name + " group", err);
        }
        words.push_back(unit.name);
    }

    if (remainder != 0) {
        return convertWords(remainder, words);
    }
    return ErrorInfo::ok();
}

ErrorInfo convertWords(int64_t number, std::vector<std::string>& words) {
    for (const auto& unit : kScaleUnits) {
        if (number >= unit.divisor) {
            return convertLargeNumber(number, unit, words);
        }
    }
    return renderSmall(number, words);
}

}  // namespace

// =============================================================================
// English cardinal conversion
// =============================================================================

ErrorInfo numberToText(int64_t number, std::string& out) {
    const LanguageWordTable& table = getLanguageTable(Language::ENGLISH);

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

    auto err = convertWords(magnitude, words);
    if (!err.isOk()) {
        return err;
    }

    out = joinWords(words);
    return ErrorInfo::ok();
}

ErrorInfo renderSmall(int64_t number, std::vector<std::string>& words) {
    if (number < 0 || number >= kThousand) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "renderSmall expects a value in [0, 1000)", std::to_string(number));
    }

    const LanguageWordTable& table = getLanguageTable(Language::ENGLISH);
    bool has_hundreds = false;

    if (number >= kHundred) {
        words.push_back(table.units[number / kHundred]);
        words.push_back(table.hundred);
        has_hundreds = true;
    }

    int64_t remainder = number % kHundred;
    if (remainder > 0) {
        if (has_hundreds) {
            words.push_back(table.conjunction);
        }

        if (remainder < 20) {
            words.push_back(table.units[remainder]);
        } else {
            words.push_back(table.tens[remainder / 10]);
            if (remainder % 10 > 0) {
                words.push_back(table.units[remainder % 10]);
            }
        }
    }

    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace numwords
