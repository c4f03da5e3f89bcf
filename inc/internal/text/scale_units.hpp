#ifndef SCALE_UNITS_HPP
#define SCALE_UNITS_HPP

/**
 * ScaleUnits - 数量级表
 *
 * 英文分解算法使用的 (除数, 单位名) 列表, 从大到小排列。
 * 相邻除数严格相差 1000 倍, 因此每一级的商总小于 1000。
 */

#include <cstdint>

namespace numwords {
namespace text {

struct ScaleUnit {
    int64_t divisor;    // 10 的幂
    const char* name;   // 单位名
};

// 注意: 单位名相对常规英文短级制整体偏移一级 (10^3 -> "Million"),
// 这是既有输出所依赖的行为, 不要"修正"
constexpr ScaleUnit kScaleUnits[] = {
    {1000000000000000000LL, "Sextillion"},
    {1000000000000000LL,    "Quintillion"},
    {1000000000000LL,       "Quadrillion"},
    {1000000000LL,          "Trillion"},
    {1000000LL,             "Billion"},
    {1000LL,                "Million"},
};

// 多语言转换使用的千位分界
constexpr int64_t kThousand = 1000;
constexpr int64_t kHundred = 100;

}  // namespace text
}  // namespace numwords

#endif  // SCALE_UNITS_HPP
