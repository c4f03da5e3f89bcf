#include "internal/text/number_formatters.hpp"

#include <cmath>
#include <cstdint>

#include <string>
#include <vector>

#include "internal/text/language_tables.hpp"
#include "internal/text/number_words.hpp"
#include "internal/text/text_utils.hpp"

namespace numwords {
namespace text {

namespace {

struct HundredthsParts {
    bool negative = false;
    int64_t whole = 0;
    int64_t fraction = 0;   // 0-99
};

// Rounds half away from zero on the hundredths representation (std::llround)
ErrorInfo splitHundredths(double value, HundredthsParts& parts) {
    if (!std::isfinite(value)) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Number must be finite", std::to_string(value));
    }

    double scaled = value * 100.0;
    if (std::fabs(scaled) >= static_cast<double>(kMaxMagnitude)) {
        return ErrorInfo::error(ErrorCode::VALUE_TOO_LARGE,
            "Number is too large to convert", std::to_string(value));
    }

    int64_t total = std::llround(scaled);
    parts.negative = total < 0;
    int64_t magnitude = parts.negative ? -total : total;
    parts.whole = magnitude / 100;
    parts.fraction = magnitude % 100;
    return ErrorInfo::ok();
}

ErrorInfo appendPart(int64_t value, const std::string& context, std::vector<std::string>& words) {
    std::string text;
    auto err = numberToText(value, text);
    if (!err.isOk()) {
        return ErrorInfo::wrap(context, err);
    }
    words.push_back(text);
    return ErrorInfo::ok();
}

}  // namespace

// =============================================================================
// Ordinal
// =============================================================================

const char* ordinalSuffix(int64_t number) {
    // % on a negative value keeps the sign; fold it away first
    int64_t last_two = number % 100;
    if (last_two < 0) last_two = -last_two;

    if (last_two >= 11 && last_two <= 13) {
        return "th";
    }
    switch (last_two % 10) {
        case 1:  return "st";
        case 2:  return "nd";
        case 3:  return "rd";
        default: return "th";
    }
}

ErrorInfo toOrdinal(int64_t number, std::string& out) {
    std::string words;
    auto err = numberToText(number, words);
    if (!err.isOk()) {
        return err;
    }

    out = words + " (" + std::to_string(number) + ordinalSuffix(number) + ")";
    return ErrorInfo::ok();
}

// =============================================================================
// Currency
// =============================================================================

ErrorInfo toCurrency(double amount, std::string& out) {
    HundredthsParts parts;
    auto err = splitHundredths(amount, parts);
    if (!err.isOk()) {
        return err;
    }

    std::vector<std::string> words;
    if (parts.negative) {
        words.push_back(getLanguageTable(Language::ENGLISH).minus);
    }

    err = appendPart(parts.whole, "Failed to convert dollars", words);
    if (!err.isOk()) {
        return err;
    }
    words.push_back(parts.whole == 1 ? "Dollar" : "Dollars");

    if (parts.fraction != 0) {
        words.push_back(getLanguageTable(Language::ENGLISH).conjunction);
        err = appendPart(parts.fraction, "Failed to convert cents", words);
        if (!err.isOk()) {
            return err;
        }
        words.push_back(parts.fraction == 1 ? "Cent" : "Cents");
    }

    out = joinWords(words);
    return ErrorInfo::ok();
}

// =============================================================================
// Decimal point
// =============================================================================

ErrorInfo decimalToText(double value, std::string& out) {
    HundredthsParts parts;
    auto err = splitHundredths(value, parts);
    if (!err.isOk()) {
        return err;
    }

    std::vector<std::string> words;
    if (parts.negative) {
        words.push_back(getLanguageTable(Language::ENGLISH).minus);
    }

    err = appendPart(parts.whole, "Failed to convert integer part", words);
    if (!err.isOk()) {
        return err;
    }
    words.push_back("point");

    // TODO: read leading-zero fractions digit by digit (".05" -> "Zero Five") once the wording is settled
    err = appendPart(parts.fraction, "Failed to convert fractional part", words);
    if (!err.isOk()) {
        return err;
    }

    out = joinWords(words);
    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace numwords
