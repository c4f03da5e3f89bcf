#ifndef NUMBER_FORMATTERS_HPP
#define NUMBER_FORMATTERS_HPP

/**
 * NumberFormatters - 派生格式
 *
 * 基于英文基数词的序数、货币和小数读法。
 */

#include <cstdint>

#include <string>

#include "internal/numwords_types.hpp"

namespace numwords {
namespace text {

// =============================================================================
// 序数
// =============================================================================

/**
 * @brief 英文序数后缀
 * @param number 整数
 * @return "st" / "nd" / "rd" / "th"; 末两位为 11-13 时总是 "th"
 */
const char* ordinalSuffix(int64_t number);

/**
 * @brief 基数词加序数标记
 * @param number 整数
 * @param out [out] 如 21 -> "Twenty One (21st)"
 * @return 错误信息 (与 numberToText 相同)
 */
ErrorInfo toOrdinal(int64_t number, std::string& out);

// =============================================================================
// 货币
// =============================================================================

/**
 * @brief 美元金额读法
 * @param amount 金额
 * @param out [out] 如 2.45 -> "Two Dollars and Forty Five Cents"
 * @return 非有限值返回 INVALID_INPUT, 超出范围返回 VALUE_TOO_LARGE
 *
 * 先按分四舍五入 (远离零), 再拆分为元和分; 数值恰为 1 时用单数。
 */
ErrorInfo toCurrency(double amount, std::string& out);

// =============================================================================
// 小数
// =============================================================================

/**
 * @brief 小数读法, 保留两位小数
 * @param value 数值
 * @param out [out] 如 3.14 -> "Three point Fourteen"
 * @return 非有限值返回 INVALID_INPUT, 超出范围返回 VALUE_TOO_LARGE
 *
 * 小数部分按基数读, 不补零: 0.05 读作 "Zero point Five"。
 */
ErrorInfo decimalToText(double value, std::string& out);

}  // namespace text
}  // namespace numwords

#endif  // NUMBER_FORMATTERS_HPP
