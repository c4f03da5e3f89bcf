#ifndef LANGUAGE_TABLES_HPP
#define LANGUAGE_TABLES_HPP

/**
 * LanguageTables - 多语言数字词表
 *
 * 每种语言一张只读词表 (个位 0-19, 整十 20-90, 百/千单位, 零/负号/连接词),
 * 通过语言代码查找。语法差异由 language_words.cpp 中的分支处理。
 */

#include <string>
#include <vector>

namespace numwords {
namespace text {

// =============================================================================
// Language (语言)
// =============================================================================

enum class Language {
    ENGLISH,
    SPANISH,
    ARABIC,
};

// =============================================================================
// LanguageWordTable (词表)
// =============================================================================

struct LanguageWordTable {
    Language language;
    const char* code;           // 短代码: "es"
    const char* iso3;           // ISO 639-2: "spa"
    const char* name;           // 英文名: "Spanish"

    const char* units[20];      // 下标即数值
    const char* tens[10];       // 下标为十位数字, 0 和 1 为空

    // 英文由 number_words.cpp 的分解算法处理, 只使用 units/tens/hundred/zero/minus/conjunction
    const char* hundred;             // 正好 100: "Cien"; 英文为百位单位词 "Hundred"
    const char* hundred_compound;    // 1xx 且后面还有数: "Ciento"
    const char* hundreds_suffix;     // 2-9 百的复合后缀: "cientos"
    const char* hundreds_stem_trim;  // 复合前从个位词尾去掉的部分 (阿拉伯语 "ة")
    const char* hundreds_irregular[10];  // 不规则百位词, 空串表示使用复合形式

    const char* thousand;
    const char* zero;
    const char* minus;
    const char* conjunction;    // 空串表示不插入连接词
};

/**
 * @brief 获取指定语言的词表
 */
const LanguageWordTable& getLanguageTable(Language lang);

/**
 * @brief 按代码查找词表 (大小写不敏感, 忽略首尾空白)
 * @param code 短代码 / ISO-3 代码 / 英文名, 如 "es", "SPA", "Spanish"
 * @return 找到返回词表指针, 否则返回 nullptr
 */
const LanguageWordTable* findLanguageTable(const std::string& code);

/**
 * @brief 所有支持的语言词表
 */
std::vector<const LanguageWordTable*> getSupportedLanguages();

}  // namespace text
}  // namespace numwords

#endif  // LANGUAGE_TABLES_HPP
