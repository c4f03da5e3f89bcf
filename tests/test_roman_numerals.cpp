// File: tests/test_roman_numerals.cpp
// Purpose: Verify greedy Roman numeral rendering and canonical parsing.
// Key invariants: Only 1..3999 render; parsing accepts exactly the strings
//                 that toRoman would produce, in either case.

#include <gtest/gtest.h>

#include <cstdint>

#include <string>

#include "internal/numwords_types.hpp"
#include "internal/text/roman_numerals.hpp"

using namespace numwords;
using namespace numwords::text;

namespace {

std::string roman(int64_t number, bool lower = false) {
    std::string out;
    ErrorInfo err = toRoman(number, out, lower);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

}  // namespace

TEST(ToRomanTest, SubtractiveForms) {
    EXPECT_EQ(roman(1), "I");
    EXPECT_EQ(roman(4), "IV");
    EXPECT_EQ(roman(9), "IX");
    EXPECT_EQ(roman(49), "XLIX");
    EXPECT_EQ(roman(1994), "MCMXCIV");
    EXPECT_EQ(roman(3999), "MMMCMXCIX");
}

TEST(ToRomanTest, LowerCase) {
    EXPECT_EQ(roman(1994, true), "mcmxciv");
    EXPECT_EQ(roman(4, true), "iv");
}

TEST(ToRomanTest, RejectsOutOfRange) {
    std::string out = "unchanged";
    EXPECT_EQ(toRoman(0, out).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(toRoman(-1, out).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(toRoman(4000, out).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(out, "unchanged");
}

TEST(FromRomanTest, ParsesCanonicalNumerals) {
    int64_t value = 0;
    ASSERT_TRUE(fromRoman("XLII", value).isOk());
    EXPECT_EQ(value, 42);
    ASSERT_TRUE(fromRoman("mcmxciv", value).isOk());
    EXPECT_EQ(value, 1994);
    ASSERT_TRUE(fromRoman(" I ", value).isOk());
    EXPECT_EQ(value, 1);
}

TEST(FromRomanTest, RejectsNonCanonicalAndInvalid) {
    int64_t value = 7;
    EXPECT_EQ(fromRoman("IIII", value).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(fromRoman("IC", value).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(fromRoman("VX", value).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(fromRoman("ABC", value).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(fromRoman("", value).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(value, 7);
}

TEST(IsRomanNumeralTest, RequiresTwoRomanCharacters) {
    EXPECT_TRUE(isRomanNumeral("XL"));
    EXPECT_TRUE(isRomanNumeral("mix"));
    EXPECT_FALSE(isRomanNumeral("I"));
    EXPECT_FALSE(isRomanNumeral("12"));
    EXPECT_FALSE(isRomanNumeral("XLA"));
}
