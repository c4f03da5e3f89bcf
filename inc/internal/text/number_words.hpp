#ifndef NUMBER_WORDS_HPP
#define NUMBER_WORDS_HPP

/**
 * NumberWords - 英文数字转单词
 *
 * 按数量级表递归分解整数, 每组小于 1000 的数由 renderSmall 读出。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/numwords_types.hpp"

namespace numwords {
namespace text {

// =============================================================================
// 英文基数词
// =============================================================================

/**
 * @brief 将整数转换为英文单词
 * @param number 要转换的整数
 * @param out [out] 英文读法, 如 42 -> "Forty Two"
 * @return 错误信息
 *
 * 特殊处理：
 * - 0 -> "Zero"
 * - 负数前缀 "Minus"
 * - INT64_MIN 无法取负, 返回 INVALID_INPUT
 * - 绝对值 >= kMaxMagnitude 返回 VALUE_TOO_LARGE
 * - 百位与十位/个位之间插入 "and", 数量级之间不插入
 */
ErrorInfo numberToText(int64_t number, std::string& out);

/**
 * @brief 读出 0-999 之间的数, 追加到 words
 * @param number 0 <= number < 1000
 * @param words [out] 追加的单词
 * @return 超出范围返回 INVALID_INPUT, 且不追加任何单词
 *
 * 11-19 作为整体查表, 不拆成 "Ten" + 个位。0 不产生任何单词。
 */
ErrorInfo renderSmall(int64_t number, std::vector<std::string>& words);

}  // namespace text
}  // namespace numwords

#endif  // NUMBER_WORDS_HPP
