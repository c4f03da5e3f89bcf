#include "internal/text/text_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>

#include <stdexcept>
#include <string>
#include <vector>

namespace numwords {
namespace text {

// =============================================================================
// Word joining
// =============================================================================

std::string joinWords(const std::vector<std::string>& words, const std::string& separator) {
    std::string result;
    for (const auto& word : words) {
        if (word.empty()) continue;
        if (!result.empty()) {
            result += separator;
        }
        result += word;
    }
    return result;
}

// =============================================================================
// Case and whitespace
// =============================================================================

std::string toLowerAscii(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) {
            c = static_cast<char>(std::tolower(uc));
        }
    }
    return result;
}

std::string toUpperAscii(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) {
            c = static_cast<char>(std::toupper(uc));
        }
    }
    return result;
}

std::string capitalizeAscii(const std::string& str) {
    if (str.empty()) return str;
    std::string result = str;
    unsigned char first = static_cast<unsigned char>(result[0]);
    if (first < 0x80) {
        result[0] = static_cast<char>(std::toupper(first));
    }
    return result;
}

std::string trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.length();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(begin, end - begin);
}

bool endsWith(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

// =============================================================================
// Number parsing
// =============================================================================

std::string stripDigitSeparators(const std::string& str) {
    std::string result;
    result.reserve(str.length());
    for (char c : str) {
        if (c == ',' || c == '_') continue;
        result += c;
    }
    return result;
}

bool looksLikeDecimal(const std::string& str) {
    return str.find_first_of(".eE") != std::string::npos;
}

bool hasValidDigitGrouping(const std::string& str) {
    size_t start = (!str.empty() && (str[0] == '+' || str[0] == '-')) ? 1 : 0;
    size_t end = str.find_first_of(".eE", start);
    if (end == std::string::npos) end = str.length();

    if (str.find(',', end) != std::string::npos) return false;
    if (str.find(',', start) == std::string::npos) return true;

    size_t group = 0;
    bool first = true;
    for (size_t i = start; i < end; ++i) {
        char c = str[i];
        if (c == '_') continue;
        if (c != ',') {
            ++group;
            continue;
        }
        if (first ? (group == 0 || group > 3) : group != 3) return false;
        first = false;
        group = 0;
    }
    return group == 3;
}

ErrorInfo parseInteger(const std::string& str, int64_t& value) {
    std::string input = trim(str);
    if (input.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT, "Empty input");
    }

    // std::stoll 会跳过前导空白并接受部分匹配, 这里要求整串都是数字
    size_t start = (input[0] == '+' || input[0] == '-') ? 1 : 0;
    if (start == input.length()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT, "Please enter a valid integer number", input);
    }
    for (size_t i = start; i < input.length(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(input[i]))) {
            return ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Please enter a valid integer number", input);
        }
    }

    try {
        size_t pos = 0;
        long long parsed = std::stoll(input, &pos);
        if (pos != input.length()) {
            return ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Please enter a valid integer number", input);
        }
        value = static_cast<int64_t>(parsed);
    } catch (const std::out_of_range&) {
        return ErrorInfo::error(ErrorCode::VALUE_TOO_LARGE,
            "Number does not fit in a 64-bit integer", input);
    } catch (const std::invalid_argument&) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Please enter a valid integer number", input);
    }

    return ErrorInfo::ok();
}

ErrorInfo parseDecimal(const std::string& str, double& value) {
    std::string input = trim(str);
    if (input.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT, "Empty input");
    }

    try {
        size_t pos = 0;
        double parsed = std::stod(input, &pos);
        if (pos != input.length()) {
            return ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Please enter a valid decimal number", input);
        }
        value = parsed;
    } catch (const std::out_of_range&) {
        // stod 在下溢时同样抛出 out_of_range, 用 strtod 的结果区分
        char* end = nullptr;
        double approx = std::strtod(input.c_str(), &end);
        if (end != input.c_str() + input.length()) {
            return ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Please enter a valid decimal number", input);
        }
        if (std::fabs(approx) >= 1.0) {
            return ErrorInfo::error(ErrorCode::VALUE_TOO_LARGE,
                "Number is outside the representable range", input);
        }
        value = 0.0;
    } catch (const std::invalid_argument&) {
        return ErrorInfo::error(ErrorCode::INVALID_INPUT,
            "Please enter a valid decimal number", input);
    }

    return ErrorInfo::ok();
}

}  // namespace text
}  // namespace numwords
