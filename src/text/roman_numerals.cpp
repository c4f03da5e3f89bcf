#include "internal/text/roman_numerals.hpp"

#include <cctype>
#include <cstdint>

#include <string>
#include <utility>

#include "internal/text/text_utils.hpp"

namespace numwords {
namespace text {

namespace {

const std::pair<int64_t, const char*> ROMAN_NUMERALS[] = {
    {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"},
    {100, "C"},  {90, "XC"},  {50, "L"},  {40, "XL"},
    {10, "X"},   {9, "IX"},   {5, "V"},   {4, "IV"},
    {1, "I"},
};

int romanCharValue(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'I': return 1;
        case 'V': return 5;
        case 'X': return 10;
        case 'L': return 50;
        case 'C': return 100;
        case 'D': return 500;
        case 'M': return 1000;
        default:  return 0;
    }
}

}  // namespace

// =============================================================================
// Integer to Roman
// =============================================================================

ErrorInfo toRoman(int64_t number, std::string& out, bool lower) {
    if (number <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Roman numerals require a positive number", std::to_string(number));
    }
    if (number > kMaxRomanValue) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Roman numerals only cover 1 to 3999", std::to_string(number));
    }

    std::string result;
    for (const auto& numeral : ROMAN_NUMERALS) {
        while (number >= numeral.first) {
            number -= numeral.first;
            result += numeral.second;
        }
    }

    out = lower ? toLowerAscii(result) : result;
    return ErrorInfo::ok();
}

// =============================================================================
// Roman numeral parsing
// =============================================================================

bool isRomanNumeralChar(char c) {
    return romanCharValue(c) != 0;
}

bool isRomanNumeral(const std::string& str) {
    // Require at least 2 characters to avoid treating single letters like "I" as Roman numerals
    if (str.length() < 2) return false;
    for (char c : str) {
        if (!isRomanNumeralChar(c)) return false;
    }
    return true;
}

ErrorInfo fromRoman(const std::string& roman, int64_t& value) {
    std::string input = toUpperAscii(trim(roman));
    if (input.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT, "Empty Roman numeral");
    }

    int64_t result = 0;
    for (size_t i = 0; i < input.length(); i++) {
        int current = romanCharValue(input[i]);
        if (current == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Invalid Roman numeral character", input);
        }

        if (i + 1 < input.length() && current < romanCharValue(input[i + 1])) {
            result -= current;
        } else {
            result += current;
        }
    }

    std::string canonical;
    if (result <= 0 || !toRoman(result, canonical).isOk() || canonical != input) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Not a canonical Roman numeral", input);
    }

    value = result;
    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace numwords
