#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

#include "numwords_api.hpp"

namespace py = pybind11;

// =============================================================================
// 模块级函数辅助
// =============================================================================

/**
 * @brief 取出结果文本, 失败时抛出 ValueError
 *
 * Python 侧的模块级函数不返回 ConvertResult, 失败直接映射为异常
 */
static std::string unwrapText(const std::shared_ptr<NumWords::ConvertResult>& result) {
    if (!result) {
        throw py::value_error("[INTERNAL_ERROR] conversion returned no result");
    }
    if (!result->IsSuccess()) {
        throw py::value_error(result->ToDisplayString());
    }
    return result->GetText();
}

// 模块级函数共享的默认转换器 (只读, 无状态)
static const NumWords::Converter& defaultConverter() {
    static const NumWords::Converter converter;
    return converter;
}

// =============================================================================
// pybind11 模块定义
// =============================================================================

PYBIND11_MODULE(_numwords, m) {
    m.doc() = "NumWords - Number to Words Python bindings";

    // =========================================================================
    // 枚举类型
    // =========================================================================

    py::enum_<NumWords::NumberMode>(m, "NumberMode", "Output modes")
        .value("CARDINAL", NumWords::NumberMode::CARDINAL, "Cardinal words (decimal input reads as decimal)")
        .value("ORDINAL", NumWords::NumberMode::ORDINAL, "Cardinal words with ordinal marker")
        .value("CURRENCY", NumWords::NumberMode::CURRENCY, "US dollar amount")
        .value("DECIMAL", NumWords::NumberMode::DECIMAL, "Decimal with two fraction digits")
        .value("ROMAN", NumWords::NumberMode::ROMAN, "Roman numeral (1-3999)")
        .export_values();

    // =========================================================================
    // LanguageInfo
    // =========================================================================

    py::class_<NumWords::LanguageInfo>(m, "LanguageInfo", "Supported language")
        .def_readonly("code", &NumWords::LanguageInfo::code, "Short code, e.g. 'es'")
        .def_readonly("iso3", &NumWords::LanguageInfo::iso3, "ISO 639-2 code, e.g. 'spa'")
        .def_readonly("name", &NumWords::LanguageInfo::name, "English name, e.g. 'Spanish'")
        .def("__repr__", [](const NumWords::LanguageInfo& info) {
            return "<LanguageInfo code='" + info.code + "' name='" + info.name + "'>";
        });

    // =========================================================================
    // ConvertConfig - 配置结构
    // =========================================================================

    py::class_<NumWords::ConvertConfig>(m, "ConvertConfig", "Converter configuration")
        .def(py::init<>(), "Create default configuration")

        // 字段（readwrite）
        .def_readwrite("mode", &NumWords::ConvertConfig::mode, "Output mode")
        .def_readwrite("language", &NumWords::ConvertConfig::language, "Language code")
        .def_readwrite("lowercase_roman", &NumWords::ConvertConfig::lowercase_roman,
            "Render Roman numerals in lower case")
        .def_readwrite("accept_roman_input", &NumWords::ConvertConfig::accept_roman_input,
            "Accept Roman numeral input such as 'XLII'")

        // 静态工厂方法
        .def_static("Default", &NumWords::ConvertConfig::Default,
                    "Create default configuration (English cardinal)")
        .def_static("Ordinal", &NumWords::ConvertConfig::Ordinal,
                    "Create ordinal configuration")
        .def_static("Currency", &NumWords::ConvertConfig::Currency,
                    "Create currency configuration")
        .def_static("Decimal", &NumWords::ConvertConfig::Decimal,
                    "Create decimal configuration")
        .def_static("Roman", &NumWords::ConvertConfig::Roman,
                    py::arg("lower") = false,
                    "Create Roman numeral configuration")
        .def_static("Language", &NumWords::ConvertConfig::Language,
                    py::arg("code"),
                    "Create cardinal configuration for a language")

        // Builder 方法（链式调用）
        .def("withMode", &NumWords::ConvertConfig::withMode,
            py::arg("mode"),
            "Set output mode (chainable)")
        .def("withLanguage", &NumWords::ConvertConfig::withLanguage,
            py::arg("code"),
            "Set language (chainable)")
        .def("withLowercaseRoman", &NumWords::ConvertConfig::withLowercaseRoman,
            py::arg("lower"),
            "Set lower-case Roman output (chainable)")

        .def("__repr__", [](const NumWords::ConvertConfig& config) {
            return "<ConvertConfig mode=" + std::to_string(static_cast<int>(config.mode)) +
                " language='" + config.language + "'>";
        });

    // =========================================================================
    // ConvertResult - 转换结果
    // =========================================================================

    py::class_<NumWords::ConvertResult, std::shared_ptr<NumWords::ConvertResult>>(
        m, "ConvertResult", "Conversion result")
        .def("get_text", &NumWords::ConvertResult::GetText,
            "Get converted text (empty on failure)")
        .def("get_input", &NumWords::ConvertResult::GetInput,
            "Get original input")
        .def("get_mode", &NumWords::ConvertResult::GetMode,
            "Get mode actually used")

        // 状态检查
        .def("is_success", &NumWords::ConvertResult::IsSuccess,
            "Check if conversion succeeded")
        .def("get_code", &NumWords::ConvertResult::GetCode,
            "Get error code name")
        .def("get_message", &NumWords::ConvertResult::GetMessage,
            "Get error message")
        .def("get_detail", &NumWords::ConvertResult::GetDetail,
            "Get error detail")

        .def("__bool__", &NumWords::ConvertResult::IsSuccess)
        .def("__str__", &NumWords::ConvertResult::ToDisplayString)
        .def("__repr__", [](const NumWords::ConvertResult& r) {
            return "<ConvertResult " + r.GetCode() + " '" + r.ToDisplayString() + "'>";
        });

    // =========================================================================
    // Converter - 转换器
    // =========================================================================

    py::class_<NumWords::Converter>(m, "Converter", "Number to words converter")
        .def(py::init<>(), "Create converter with default configuration")
        .def(py::init<const NumWords::ConvertConfig&>(),
            py::arg("config"),
            "Create converter with configuration")

        .def("call", py::overload_cast<const std::string&>(
                &NumWords::Converter::Call, py::const_),
            py::arg("input"),
            "Parse and convert input with the current configuration")
        .def("call_with_config", py::overload_cast<const std::string&, const NumWords::ConvertConfig&>(
                &NumWords::Converter::Call, py::const_),
            py::arg("input"), py::arg("config"),
            "Parse and convert input with a custom configuration")

        // 类型化接口
        .def("number_to_text", &NumWords::Converter::NumberToText, py::arg("number"))
        .def("number_to_text_lang", &NumWords::Converter::NumberToTextLang,
            py::arg("number"), py::arg("language"))
        .def("to_ordinal", &NumWords::Converter::ToOrdinal, py::arg("number"))
        .def("to_currency", &NumWords::Converter::ToCurrency, py::arg("amount"))
        .def("decimal_to_text", &NumWords::Converter::DecimalToText, py::arg("value"))
        .def("to_roman", &NumWords::Converter::ToRoman, py::arg("number"))
        .def("from_roman", &NumWords::Converter::FromRoman, py::arg("roman"))

        // 动态配置
        .def("set_mode", &NumWords::Converter::SetMode,
            py::arg("mode"),
            "Set output mode")
        .def("set_language", &NumWords::Converter::SetLanguage,
            py::arg("language"),
            "Set language, returns False if unsupported")
        .def("get_config", &NumWords::Converter::GetConfig,
            "Get current configuration")
        .def("is_valid", &NumWords::Converter::IsValid,
            "Check if the current configuration is valid")
        .def_static("get_supported_languages", &NumWords::Converter::GetSupportedLanguages,
            "List supported languages")

        .def("__repr__", [](const NumWords::Converter& converter) {
            auto config = converter.GetConfig();
            return "<Converter language='" + config.language + "'" +
                " valid=" + (converter.IsValid() ? "true" : "false") + ">";
        });

    // =========================================================================
    // 模块级函数 (失败时抛出 ValueError)
    // =========================================================================

    m.def("number_to_text", [](int64_t number) {
        return unwrapText(defaultConverter().NumberToText(number));
    }, py::arg("number"), "English cardinal words");

    m.def("number_to_text_lang", [](int64_t number, const std::string& language) {
        return unwrapText(defaultConverter().NumberToTextLang(number, language));
    }, py::arg("number"), py::arg("language"), "Cardinal words in the given language");

    m.def("to_ordinal", [](int64_t number) {
        return unwrapText(defaultConverter().ToOrdinal(number));
    }, py::arg("number"), "Cardinal words with ordinal marker, e.g. 'Eleven (11th)'");

    m.def("to_currency", [](double amount) {
        return unwrapText(defaultConverter().ToCurrency(amount));
    }, py::arg("amount"), "US dollar amount in words");

    m.def("decimal_to_text", [](double value) {
        return unwrapText(defaultConverter().DecimalToText(value));
    }, py::arg("value"), "Decimal reading with two fraction digits");

    m.def("to_roman", [](int64_t number, bool lower) {
        NumWords::Converter converter(NumWords::ConvertConfig::Roman(lower));
        return unwrapText(converter.ToRoman(number));
    }, py::arg("number"), py::arg("lower") = false, "Roman numeral (1-3999)");

    m.def("from_roman", [](const std::string& roman) {
        return std::stoll(unwrapText(defaultConverter().FromRoman(roman)));
    }, py::arg("roman"), "Parse a canonical Roman numeral");

    // =========================================================================
    // 模块级属性
    // =========================================================================

    m.attr("__version__") = "1.0.0";
}
