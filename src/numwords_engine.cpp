#include "numwords_api.hpp"

#include <cstdint>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/numwords_config.hpp"
#include "internal/numwords_types.hpp"
#include "internal/text/language_tables.hpp"
#include "internal/text/language_words.hpp"
#include "internal/text/number_formatters.hpp"
#include "internal/text/number_words.hpp"
#include "internal/text/roman_numerals.hpp"
#include "internal/text/text_utils.hpp"

namespace NumWords {

// =============================================================================
// ConvertResult 实现
// =============================================================================

struct ConvertResult::Impl {
    std::string text;
    std::string input;
    NumberMode mode = NumberMode::CARDINAL;
    numwords::ErrorInfo error = numwords::ErrorInfo::ok();
};

ConvertResult::ConvertResult() : impl_(std::make_unique<Impl>()) {}
ConvertResult::~ConvertResult() = default;

ConvertResult::ConvertResult(ConvertResult&&) noexcept = default;
ConvertResult& ConvertResult::operator=(ConvertResult&&) noexcept = default;

std::string ConvertResult::GetText() const {
    return impl_->text;
}

std::string ConvertResult::GetInput() const {
    return impl_->input;
}

NumberMode ConvertResult::GetMode() const {
    return impl_->mode;
}

bool ConvertResult::IsSuccess() const {
    return impl_->error.isOk();
}

std::string ConvertResult::GetCode() const {
    return numwords::errorCodeToString(impl_->error.code);
}

std::string ConvertResult::GetMessage() const {
    return impl_->error.message;
}

std::string ConvertResult::GetDetail() const {
    return impl_->error.detail;
}

std::string ConvertResult::ToDisplayString() const {
    if (IsSuccess()) {
        return impl_->text;
    }
    return impl_->error.toString();
}

// =============================================================================
// Converter 实现
// =============================================================================

// 转换 NumWords::NumberMode 到 numwords::NumberMode
static numwords::NumberMode convertMode(NumberMode mode) {
    switch (mode) {
        case NumberMode::ORDINAL:
            return numwords::NumberMode::ORDINAL;
        case NumberMode::CURRENCY:
            return numwords::NumberMode::CURRENCY;
        case NumberMode::DECIMAL:
            return numwords::NumberMode::DECIMAL;
        case NumberMode::ROMAN:
            return numwords::NumberMode::ROMAN;
        case NumberMode::CARDINAL:
        default:
            return numwords::NumberMode::CARDINAL;
    }
}

static numwords::ConvertConfig convertConfig(const ConvertConfig& cfg) {
    numwords::ConvertConfig internal_config;
    internal_config.mode = convertMode(cfg.mode);
    internal_config.language = cfg.language;
    internal_config.lowercase_roman = cfg.lowercase_roman;
    internal_config.accept_roman_input = cfg.accept_roman_input;
    return internal_config;
}

class ResultBuilder {
public:
    static std::shared_ptr<ConvertResult> make(const std::string& input, NumberMode mode,
                                               const numwords::ErrorInfo& error,
                                               std::string text) {
        auto result = std::make_shared<ConvertResult>();
        result->impl_->input = input;
        result->impl_->mode = mode;
        result->impl_->error = error;
        if (error.isOk()) {
            result->impl_->text = std::move(text);
        }
        return result;
    }
};

static std::shared_ptr<ConvertResult> makeResult(const std::string& input, NumberMode mode,
                                                 const numwords::ErrorInfo& error,
                                                 std::string text) {
    return ResultBuilder::make(input, mode, error, std::move(text));
}

struct Converter::Impl {
    ConvertConfig config;
    bool valid = false;

    void init(const ConvertConfig& cfg) {
        config = cfg;

        auto error = convertConfig(cfg).validate();
        if (!error.isOk()) {
            std::cerr << "Error: invalid converter config: " << error.message << std::endl;
            valid = false;
            return;
        }
        valid = true;
    }
};

Converter::Converter() : impl_(std::make_unique<Impl>()) {
    impl_->init(ConvertConfig());
}

Converter::Converter(const ConvertConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config);
}

Converter::~Converter() = default;

std::shared_ptr<ConvertResult> Converter::Call(const std::string& input) const {
    return Call(input, impl_->config);
}

std::shared_ptr<ConvertResult> Converter::Call(const std::string& input,
                                               const ConvertConfig& config) const {
    using numwords::ErrorCode;
    using numwords::ErrorInfo;
    namespace text = numwords::text;

    auto internal_config = convertConfig(config);
    auto error = internal_config.validate();
    if (!error.isOk()) {
        return makeResult(input, config.mode, error, "");
    }

    std::string trimmed = text::trim(input);
    if (trimmed.empty()) {
        return makeResult(input, config.mode,
            ErrorInfo::error(ErrorCode::INVALID_INPUT, "Empty input"), "");
    }
    if (!text::hasValidDigitGrouping(trimmed)) {
        return makeResult(input, config.mode,
            ErrorInfo::error(ErrorCode::INVALID_INPUT,
                "Digit groups after ',' must have exactly three digits", trimmed), "");
    }
    std::string cleaned = text::stripDigitSeparators(trimmed);

    std::string output;

    // 货币 / 小数 / 罗马数字: 输入格式固定
    switch (config.mode) {
        case NumberMode::CURRENCY:
        case NumberMode::DECIMAL: {
            double value = 0.0;
            error = text::parseDecimal(cleaned, value);
            if (error.isOk()) {
                error = (config.mode == NumberMode::CURRENCY)
                    ? text::toCurrency(value, output)
                    : text::decimalToText(value, output);
            }
            return makeResult(input, config.mode, error, output);
        }
        case NumberMode::ROMAN: {
            int64_t number = 0;
            error = text::parseInteger(cleaned, number);
            if (error.isOk()) {
                error = text::toRoman(number, output, config.lowercase_roman);
            }
            return makeResult(input, config.mode, error, output);
        }
        default:
            break;
    }

    // 基数词 / 序数: 接受整数、罗马数字, 基数词模式下还接受小数
    int64_t number = 0;
    if (config.accept_roman_input && text::isRomanNumeral(cleaned)) {
        error = text::fromRoman(cleaned, number);
    } else if (config.mode == NumberMode::CARDINAL && text::looksLikeDecimal(cleaned)) {
        if (!internal_config.isEnglish()) {
            return makeResult(input, NumberMode::DECIMAL,
                ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                    "Decimal input is only available in English"), "");
        }
        double value = 0.0;
        error = text::parseDecimal(cleaned, value);
        if (error.isOk()) {
            error = text::decimalToText(value, output);
        }
        return makeResult(input, NumberMode::DECIMAL, error, output);
    } else {
        error = text::parseInteger(cleaned, number);
    }

    if (!error.isOk()) {
        return makeResult(input, config.mode, error, "");
    }

    if (config.mode == NumberMode::ORDINAL) {
        error = text::toOrdinal(number, output);
    } else {
        error = text::numberToTextLang(number, internal_config.language, output);
    }
    return makeResult(input, config.mode, error, output);
}

std::shared_ptr<ConvertResult> Converter::NumberToText(int64_t number) const {
    std::string output;
    auto error = numwords::text::numberToTextLang(number, impl_->config.language, output);
    return makeResult(std::to_string(number), NumberMode::CARDINAL, error, output);
}

std::shared_ptr<ConvertResult> Converter::NumberToTextLang(int64_t number,
                                                           const std::string& language) const {
    std::string output;
    auto error = numwords::text::numberToTextLang(number, language, output);
    return makeResult(std::to_string(number), NumberMode::CARDINAL, error, output);
}

std::shared_ptr<ConvertResult> Converter::ToOrdinal(int64_t number) const {
    std::string output;
    auto error = numwords::text::toOrdinal(number, output);
    return makeResult(std::to_string(number), NumberMode::ORDINAL, error, output);
}

std::shared_ptr<ConvertResult> Converter::ToCurrency(double amount) const {
    std::string output;
    auto error = numwords::text::toCurrency(amount, output);
    return makeResult(std::to_string(amount), NumberMode::CURRENCY, error, output);
}

std::shared_ptr<ConvertResult> Converter::DecimalToText(double value) const {
    std::string output;
    auto error = numwords::text::decimalToText(value, output);
    return makeResult(std::to_string(value), NumberMode::DECIMAL, error, output);
}

std::shared_ptr<ConvertResult> Converter::ToRoman(int64_t number) const {
    std::string output;
    auto error = numwords::text::toRoman(number, output, impl_->config.lowercase_roman);
    return makeResult(std::to_string(number), NumberMode::ROMAN, error, output);
}

std::shared_ptr<ConvertResult> Converter::FromRoman(const std::string& roman) const {
    int64_t value = 0;
    auto error = numwords::text::fromRoman(roman, value);
    return makeResult(roman, NumberMode::CARDINAL, error, std::to_string(value));
}

void Converter::SetMode(NumberMode mode) {
    auto config = impl_->config;
    config.mode = mode;
    impl_->init(config);
}

bool Converter::SetLanguage(const std::string& language) {
    if (!numwords::text::findLanguageTable(language)) {
        std::cerr << "Warning: unsupported language '" << language
            << "', keeping '" << impl_->config.language << "'" << std::endl;
        return false;
    }
    auto config = impl_->config;
    config.language = language;
    impl_->init(config);
    return true;
}

ConvertConfig Converter::GetConfig() const {
    return impl_->config;
}

bool Converter::IsValid() const {
    return impl_->valid;
}

std::vector<LanguageInfo> Converter::GetSupportedLanguages() {
    std::vector<LanguageInfo> languages;
    for (const auto* table : numwords::text::getSupportedLanguages()) {
        languages.push_back({table->code, table->iso3, table->name});
    }
    return languages;
}

}  // namespace NumWords
