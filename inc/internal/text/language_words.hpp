#ifndef LANGUAGE_WORDS_HPP
#define LANGUAGE_WORDS_HPP

/**
 * LanguageWords - 多语言数字转单词
 *
 * 英语走 number_words 的数量级分解; 西班牙语和阿拉伯语按词表逐组读出
 * (千 / 百 / 十和个位), 语法差异:
 * - 阿拉伯语: 个位在十位之前 ("واحد و عشرون"), 每组之间插入连接词,
 *   100/200 为独立词, 300-900 为 "数字词干 + مائة"
 * - 西班牙语: "Cien" / "Ciento", 2-9 百为复合词 ("Doscientos"),
 *   不规则形式查表 ("Quinientos")
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/numwords_types.hpp"
#include "internal/text/language_tables.hpp"

namespace numwords {
namespace text {

/**
 * @brief 将整数转换为指定语言的单词
 * @param number 要转换的整数
 * @param lang_code 语言代码 ("es" / "spa" / "spanish", 大小写不敏感)
 * @param out [out] 读法
 * @return 错误信息; 未知代码返回 UNSUPPORTED_LANGUAGE
 */
ErrorInfo numberToTextLang(int64_t number, const std::string& lang_code, std::string& out);

/**
 * @brief 使用已选定的词表转换
 * @param number 要转换的整数
 * @param table 语言词表
 * @param out [out] 读法
 * @return 错误信息
 */
ErrorInfo numberToTextLang(int64_t number, const LanguageWordTable& table, std::string& out);

/**
 * @brief 计算整百的词
 * @param digit 百位数字 1-9, 超出范围返回空串
 * @param table 语言词表
 * @return 如 Spanish 2 -> "Doscientos", Arabic 3 -> "ثلاثمائة"
 *
 * 1 返回正好 100 时的词; 后面还有余数时调用方改用 hundred_compound。
 */
std::string hundredsWord(int64_t digit, const LanguageWordTable& table);

}  // namespace text
}  // namespace numwords

#endif  // LANGUAGE_WORDS_HPP
