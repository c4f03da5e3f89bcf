#ifndef NUMWORDS_API_HPP
#define NUMWORDS_API_HPP

/**
 * NumWords - Number to Words SDK
 *
 * 数字转文字引擎，提供统一的 C++ 接口。
 *
 * 使用示例 1 - 基数词:
 *
 *   NumWords::Converter converter;
 *   auto result = converter.Call("1234567");
 *   if (result->IsSuccess()) {
 *       std::cout << result->GetText() << std::endl;
 *   }
 *
 * 使用示例 2 - 带配置的初始化:
 *
 *   NumWords::ConvertConfig config = NumWords::ConvertConfig::Currency();
 *   NumWords::Converter converter(config);
 *   auto result = converter.Call("2.45");  // "Two Dollars and Forty Five Cents"
 *
 * 使用示例 3 - 指定语言:
 *
 *   NumWords::Converter converter(NumWords::ConvertConfig::Language("es"));
 *   auto result = converter.NumberToText(21);  // "Veinte y Uno"
 *
 * 使用示例 4 - 罗马数字:
 *
 *   auto result = converter.ToRoman(1994);  // "MCMXCIV"
 */

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

namespace NumWords {

// =============================================================================
// NumberMode - 输出模式
// =============================================================================

enum class NumberMode {
    CARDINAL,   ///< 基数词 (整数) 或小数读法 (含小数点的输入)
    ORDINAL,    ///< 基数词 + 序数标记, 如 "Eleven (11th)"
    CURRENCY,   ///< 美元金额
    DECIMAL,    ///< 小数, 保留两位
    ROMAN,      ///< 罗马数字
};

// =============================================================================
// LanguageInfo - 语言信息
// =============================================================================

struct LanguageInfo {
    std::string code;   ///< 短代码, 如 "es"
    std::string iso3;   ///< ISO 639-2 代码, 如 "spa"
    std::string name;   ///< 英文名, 如 "Spanish"
};

// =============================================================================
// ConvertConfig - 转换配置
// =============================================================================

/**
 * @brief 转换器配置
 */
struct ConvertConfig {
    // -------------------------------------------------------------------------
    // 输出模式
    // -------------------------------------------------------------------------

    NumberMode mode = NumberMode::CARDINAL;     ///< 输出模式
    std::string language = "en";                ///< 语言代码 (en/es/ar, 仅基数词支持非英语)

    // -------------------------------------------------------------------------
    // 罗马数字
    // -------------------------------------------------------------------------

    bool lowercase_roman = false;       ///< 罗马数字输出小写
    bool accept_roman_input = true;     ///< 接受罗马数字输入 (如 "XLII")

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置 (英文基数词)
    static ConvertConfig Default() {
        return ConvertConfig();
    }

    /// @brief 创建序数配置
    static ConvertConfig Ordinal() {
        ConvertConfig config;
        config.mode = NumberMode::ORDINAL;
        return config;
    }

    /// @brief 创建货币配置
    static ConvertConfig Currency() {
        ConvertConfig config;
        config.mode = NumberMode::CURRENCY;
        return config;
    }

    /// @brief 创建小数配置
    static ConvertConfig Decimal() {
        ConvertConfig config;
        config.mode = NumberMode::DECIMAL;
        return config;
    }

    /// @brief 创建罗马数字配置
    /// @param lower 是否输出小写
    static ConvertConfig Roman(bool lower = false) {
        ConvertConfig config;
        config.mode = NumberMode::ROMAN;
        config.lowercase_roman = lower;
        return config;
    }

    /// @brief 创建指定语言的基数词配置
    /// @param code 语言代码 (en/eng/english, es/spa/spanish, ar/ara/arabic)
    static ConvertConfig Language(const std::string& code) {
        ConvertConfig config;
        config.language = code;
        return config;
    }

    // 链式配置
    ConvertConfig withMode(NumberMode m) const {
        auto c = *this;
        c.mode = m;
        return c;
    }

    ConvertConfig withLanguage(const std::string& code) const {
        auto c = *this;
        c.language = code;
        return c;
    }

    ConvertConfig withLowercaseRoman(bool lower) const {
        auto c = *this;
        c.lowercase_roman = lower;
        return c;
    }
};

// =============================================================================
// ConvertResult - 转换结果
// =============================================================================

class ConvertResult {
public:
    ConvertResult();
    ~ConvertResult();

    // 禁止拷贝，允许移动
    ConvertResult(const ConvertResult&) = delete;
    ConvertResult& operator=(const ConvertResult&) = delete;
    ConvertResult(ConvertResult&&) noexcept;
    ConvertResult& operator=(ConvertResult&&) noexcept;

    /// @brief 获取转换结果文本
    /// @return 单词文本, 失败时为空
    std::string GetText() const;

    /// @brief 获取原始输入
    std::string GetInput() const;

    /// @brief 获取实际使用的模式
    NumberMode GetMode() const;

    // -------------------------------------------------------------------------
    // 状态检查
    // -------------------------------------------------------------------------

    /// @brief 是否转换成功
    bool IsSuccess() const;

    /// @brief 获取错误码
    /// @return 错误码名称, 如 "OK", "VALUE_TOO_LARGE"
    std::string GetCode() const;

    /// @brief 获取错误信息
    std::string GetMessage() const;

    /// @brief 获取错误详情 (调试用)
    std::string GetDetail() const;

    /// @brief 用于显示的文本: 成功时为结果, 失败时为 "[CODE] message"
    std::string ToDisplayString() const;

private:
    friend class ResultBuilder;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Converter - 转换器
// =============================================================================

class Converter {
public:
    /// @brief 构造转换器 (默认配置: 英文基数词)
    Converter();

    /// @brief 构造转换器
    /// @param config 配置对象
    explicit Converter(const ConvertConfig& config);

    ~Converter();

    // 禁止拷贝
    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    // =========================================================================
    // 字符串输入
    // =========================================================================

    /// @brief 解析输入字符串并按当前配置转换
    /// @param input 整数 / 小数 / 罗马数字字符串, 允许 ',' 和 '_' 分组
    /// @return 转换结果 (不会为 nullptr)
    std::shared_ptr<ConvertResult> Call(const std::string& input) const;

    /// @brief 使用临时配置转换
    std::shared_ptr<ConvertResult> Call(const std::string& input, const ConvertConfig& config) const;

    // =========================================================================
    // 类型化接口
    // =========================================================================

    std::shared_ptr<ConvertResult> NumberToText(int64_t number) const;
    std::shared_ptr<ConvertResult> NumberToTextLang(int64_t number, const std::string& language) const;
    std::shared_ptr<ConvertResult> ToOrdinal(int64_t number) const;
    std::shared_ptr<ConvertResult> ToCurrency(double amount) const;
    std::shared_ptr<ConvertResult> DecimalToText(double value) const;
    std::shared_ptr<ConvertResult> ToRoman(int64_t number) const;

    /// @brief 解析罗马数字
    /// @param roman 罗马数字字符串
    /// @return 成功时 GetText() 为十进制数字符串, 如 "XLII" -> "42"
    std::shared_ptr<ConvertResult> FromRoman(const std::string& roman) const;

    // =========================================================================
    // 动态配置
    // =========================================================================

    /// @brief 设置输出模式
    void SetMode(NumberMode mode);

    /// @brief 设置语言
    /// @param language 语言代码
    /// @return 语言是否受支持 (不支持时保持原配置)
    bool SetLanguage(const std::string& language);

    /// @brief 获取当前配置
    ConvertConfig GetConfig() const;

    /// @brief 当前配置是否有效
    bool IsValid() const;

    // =========================================================================
    // 辅助方法
    // =========================================================================

    /// @brief 获取支持的语言列表
    static std::vector<LanguageInfo> GetSupportedLanguages();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace NumWords

#endif  // NUMWORDS_API_HPP
