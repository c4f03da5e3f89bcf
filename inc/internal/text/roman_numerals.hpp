#ifndef ROMAN_NUMERALS_HPP
#define ROMAN_NUMERALS_HPP

/**
 * RomanNumerals - 罗马数字处理模块
 *
 * 提供整数转罗马数字、罗马数字解析等功能。
 */

#include <cstdint>

#include <string>

#include "internal/numwords_types.hpp"

namespace numwords {
namespace text {

constexpr int64_t kMaxRomanValue = 3999;

// =============================================================================
// 整数转罗马数字
// =============================================================================

/**
 * @brief 将整数转换为罗马数字
 * @param number 1 到 3999 之间的整数
 * @param out [out] 罗马数字, 如 49 -> "XLIX"
 * @param lower 是否输出小写
 * @return 超出范围返回 INVALID_INPUT
 *
 * 从 13 项降序表 (含减法对 CM/CD/XC/XL/IX/IV) 中贪心匹配最大值。
 */
ErrorInfo toRoman(int64_t number, std::string& out, bool lower = false);

// =============================================================================
// 罗马数字解析
// =============================================================================

/**
 * @brief 判断字符是否为罗马数字字符
 * @param c 要检查的字符
 * @return true 如果是 I, V, X, L, C, D, M 之一 (大小写不敏感)
 */
bool isRomanNumeralChar(char c);

/**
 * @brief 判断字符串是否像罗马数字
 * @param str 要检查的字符串
 * @return true 如果全部是罗马数字字符且至少2个字符
 *
 * 注意：要求至少2个字符，避免将单字母如 "I" 误判为罗马数字
 */
bool isRomanNumeral(const std::string& str);

/**
 * @brief 将罗马数字转换为整数
 * @param roman 罗马数字字符串 (大小写不敏感)
 * @param value [out] 对应的整数值
 * @return 空串、非法字符或非规范写法 (如 "IIII", "IC") 返回 INVALID_INPUT
 *
 * 规范写法定义为: 用 toRoman 重新生成的结果与输入 (大写后) 一致。
 */
ErrorInfo fromRoman(const std::string& roman, int64_t& value);

}  // namespace text
}  // namespace numwords

#endif  // ROMAN_NUMERALS_HPP
