#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供单词拼接、ASCII 大小写转换、空白处理以及数字字符串解析等功能。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/numwords_types.hpp"

namespace numwords {
namespace text {

// =============================================================================
// 单词拼接
// =============================================================================

/**
 * @brief 用分隔符拼接单词, 跳过空单词
 * @param words 单词序列
 * @param separator 分隔符 (默认空格)
 * @return 拼接后的字符串
 */
std::string joinWords(const std::vector<std::string>& words, const std::string& separator = " ");

// =============================================================================
// 大小写与空白
// =============================================================================

/**
 * @brief ASCII 小写 (非 ASCII 字节保持不变, 可安全用于 UTF-8)
 */
std::string toLowerAscii(const std::string& str);

/**
 * @brief ASCII 大写 (非 ASCII 字节保持不变)
 */
std::string toUpperAscii(const std::string& str);

/**
 * @brief 首字母大写 (仅当首字节为 ASCII 字母时)
 */
std::string capitalizeAscii(const std::string& str);

/**
 * @brief 去除首尾空白
 */
std::string trim(const std::string& str);

/**
 * @brief 判断 str 是否以 suffix 结尾 (按字节比较)
 */
bool endsWith(const std::string& str, const std::string& suffix);

// =============================================================================
// 数字解析
// =============================================================================

/**
 * @brief 去掉数字分组符 (',' 和 '_'), 如 "1,234,567" -> "1234567"
 */
std::string stripDigitSeparators(const std::string& str);

/**
 * @brief 判断字符串是否像小数 (含 '.' 或指数符号)
 */
bool looksLikeDecimal(const std::string& str);

/**
 * @brief 检查 ',' 分组是否合法
 *
 * 整数部分含 ',' 时, 首组 1-3 位, 其余每组恰好 3 位; 小数部分不允许 ','。
 * 不含 ',' 的输入总是合法, '_' 不受限制。
 */
bool hasValidDigitGrouping(const std::string& str);

/**
 * @brief 严格解析 int64 整数, 必须完整消费输入
 * @param str 输入字符串
 * @param value [out] 解析结果
 * @return INVALID_INPUT 格式错误, VALUE_TOO_LARGE 超出 int64 范围
 */
ErrorInfo parseInteger(const std::string& str, int64_t& value);

/**
 * @brief 严格解析浮点数, 必须完整消费输入
 * @param str 输入字符串
 * @param value [out] 解析结果 (可能为 inf/nan, 由调用方判断); 下溢时为 0
 * @return INVALID_INPUT 格式错误, VALUE_TOO_LARGE 超出 double 范围
 */
ErrorInfo parseDecimal(const std::string& str, double& value);

}  // namespace text
}  // namespace numwords

#endif  // TEXT_UTILS_HPP
