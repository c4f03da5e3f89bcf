#ifndef NUMWORDS_CONFIG_HPP
#define NUMWORDS_CONFIG_HPP

#include <string>

#include "internal/numwords_types.hpp"
#include "internal/text/language_tables.hpp"

namespace numwords {

// =============================================================================
// Convert Config (转换配置 - 内部使用)
// =============================================================================

struct ConvertConfig {
    // -------------------------------------------------------------------------
    // 输出模式
    // -------------------------------------------------------------------------

    NumberMode mode = NumberMode::CARDINAL;     ///< 输出模式
    std::string language = "en";                ///< 语言代码 (仅基数词模式支持非英语)

    // -------------------------------------------------------------------------
    // 罗马数字
    // -------------------------------------------------------------------------

    bool lowercase_roman = false;       ///< 罗马数字输出小写
    bool accept_roman_input = true;     ///< 接受罗马数字输入 (如 "XLII")

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 是否为英语
    bool isEnglish() const {
        const auto* table = text::findLanguageTable(language);
        return table && table->language == text::Language::ENGLISH;
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (!text::findLanguageTable(language)) {
            return ErrorInfo::error(ErrorCode::UNSUPPORTED_LANGUAGE,
                "Unsupported language: " + language);
        }
        if (mode != NumberMode::CARDINAL && !isEnglish()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                std::string("Mode '") + numberModeToString(mode) + "' is only available in English");
        }
        return ErrorInfo::ok();
    }
};

}  // namespace numwords

#endif  // NUMWORDS_CONFIG_HPP
