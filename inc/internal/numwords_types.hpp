#ifndef NUMWORDS_TYPES_HPP
#define NUMWORDS_TYPES_HPP

#include <cstdint>

#include <limits>
#include <string>

namespace numwords {

// =============================================================================
// Number Mode (输出模式)
// =============================================================================

enum class NumberMode {
    CARDINAL,       // 基数词: 42 -> "Forty Two"
    ORDINAL,        // 序数:   21 -> "Twenty One (21st)"
    CURRENCY,       // 货币:   2.45 -> "Two Dollars and Forty Five Cents"
    DECIMAL,        // 小数:   3.14 -> "Three point Fourteen"
    ROMAN,          // 罗马数字: 49 -> "XLIX"
};

inline const char* numberModeToString(NumberMode mode) {
    switch (mode) {
        case NumberMode::CARDINAL: return "cardinal";
        case NumberMode::ORDINAL:  return "ordinal";
        case NumberMode::CURRENCY: return "currency";
        case NumberMode::DECIMAL:  return "decimal";
        case NumberMode::ROMAN:    return "roman";
        default:                   return "unknown";
    }
}

// =============================================================================
// 数值范围
// =============================================================================

// 绝对值上限: int64 最大值的一半, 为取负和乘法留出余量
constexpr int64_t kMaxMagnitude = std::numeric_limits<int64_t>::max() / 2;

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 输入错误 (1xx)
    INVALID_INPUT = 100,
    UNSUPPORTED_LANGUAGE = 101,
    INVALID_CONFIG = 102,

    // 范围错误 (2xx)
    VALUE_TOO_LARGE = 200,

    // 转换错误 (3xx) - 包装嵌套调用的失败
    CONVERSION_ERROR = 300,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                   return "OK";
        case ErrorCode::INVALID_INPUT:        return "INVALID_INPUT";
        case ErrorCode::UNSUPPORTED_LANGUAGE: return "UNSUPPORTED_LANGUAGE";
        case ErrorCode::INVALID_CONFIG:       return "INVALID_CONFIG";
        case ErrorCode::VALUE_TOO_LARGE:      return "VALUE_TOO_LARGE";
        case ErrorCode::CONVERSION_ERROR:     return "CONVERSION_ERROR";
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
        default:                              return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }

    /// @brief 将嵌套调用的错误包装为 CONVERSION_ERROR, 保留原始原因
    /// @param context 上下文描述
    /// @param cause 原始错误
    static ErrorInfo wrap(const std::string& context, const ErrorInfo& cause) {
        std::string detail = std::string(errorCodeToString(cause.code)) + ": " + cause.message;
        if (!cause.detail.empty()) {
            detail += " (" + cause.detail + ")";
        }
        return {ErrorCode::CONVERSION_ERROR, context + ": " + cause.message, detail};
    }

    /// @brief 显示文本, 如 "[VALUE_TOO_LARGE] Number is too large to convert"
    std::string toString() const {
        if (isOk()) return "OK";
        return "[" + std::string(errorCodeToString(code)) + "] " + message;
    }
};

}  // namespace numwords

#endif  // NUMWORDS_TYPES_HPP
