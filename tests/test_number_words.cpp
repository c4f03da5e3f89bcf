// File: tests/test_number_words.cpp
// Purpose: Verify English cardinal conversion through the scale-unit table and
//          the sub-1000 renderer.
// Key invariants: Scale names are shifted one step (10^3 reads "Million"),
//                 "and" follows a hundreds word only, magnitude limit is
//                 INT64_MAX / 2.

#include <gtest/gtest.h>

#include <cstdint>

#include <limits>
#include <string>
#include <vector>

#include "internal/numwords_types.hpp"
#include "internal/text/number_words.hpp"

using namespace numwords;
using namespace numwords::text;

namespace {

std::string words(int64_t number) {
    std::string out;
    ErrorInfo err = numberToText(number, out);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

}  // namespace

// =============================================================================
// Small values
// =============================================================================

TEST(NumberWordsTest, ZeroAndUnits) {
    const char* const kUnits[] = {
        "Zero", "One", "Two", "Three", "Four", "Five", "Six", "Seven", "Eight", "Nine",
        "Ten", "Eleven", "Twelve", "Thirteen", "Fourteen", "Fifteen", "Sixteen",
        "Seventeen", "Eighteen", "Nineteen",
    };
    for (int64_t n = 0; n < 20; ++n) {
        EXPECT_EQ(words(n), kUnits[n]) << n;
    }
}

TEST(NumberWordsTest, TensWithoutUnitsOmitTrailingWord) {
    EXPECT_EQ(words(20), "Twenty");
    EXPECT_EQ(words(21), "Twenty One");
    EXPECT_EQ(words(90), "Ninety");
    EXPECT_EQ(words(99), "Ninety Nine");
}

TEST(NumberWordsTest, HundredsUseAndOnlyBeforeRemainder) {
    EXPECT_EQ(words(100), "One Hundred");
    EXPECT_EQ(words(105), "One Hundred and Five");
    EXPECT_EQ(words(110), "One Hundred and Ten");
    EXPECT_EQ(words(999), "Nine Hundred and Ninety Nine");
}

// =============================================================================
// Scale units
// =============================================================================

TEST(NumberWordsTest, ThousandReadsAsMillion) {
    EXPECT_EQ(words(1000), "One Million");
    EXPECT_EQ(words(1001), "One Million One");
    EXPECT_EQ(words(20000), "Twenty Million");
}

TEST(NumberWordsTest, MultipleGroups) {
    EXPECT_EQ(words(1234567),
        "One Billion Two Hundred and Thirty Four Million Five Hundred and Sixty Seven");
    EXPECT_EQ(words(1000000), "One Billion");
    EXPECT_EQ(words(1000000000), "One Trillion");
    EXPECT_EQ(words(1000000000000000000LL), "One Sextillion");
}

TEST(NumberWordsTest, ZeroGroupsAreSkipped) {
    EXPECT_EQ(words(1000001), "One Billion One");
    EXPECT_EQ(words(5000000100LL), "Five Trillion One Hundred");
}

TEST(NumberWordsTest, LargestEighteenDigitValue) {
    std::string out;
    ErrorInfo err = numberToText(999999999999999999LL, out);
    ASSERT_TRUE(err.isOk()) << err.toString();
    const std::string tail = "Million Nine Hundred and Ninety Nine";
    EXPECT_EQ(out.rfind("Nine Hundred and Ninety Nine Quintillion", 0), 0u);
    ASSERT_GE(out.length(), tail.length());
    EXPECT_EQ(out.substr(out.length() - tail.length()), tail);
}

// =============================================================================
// Negative values
// =============================================================================

TEST(NumberWordsTest, NegativeIsMinusPrefixed) {
    EXPECT_EQ(words(-1234), "Minus One Million Two Hundred and Thirty Four");

    for (int64_t n : {1LL, 42LL, 1000LL, 123456789LL}) {
        EXPECT_EQ(words(-n), "Minus " + words(n));
    }
}

TEST(NumberWordsTest, MinimumIntegerIsRejected) {
    std::string out = "unchanged";
    ErrorInfo err = numberToText(std::numeric_limits<int64_t>::min(), out);
    EXPECT_EQ(err.code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(out, "unchanged");
}

// =============================================================================
// Overflow guard
// =============================================================================

TEST(NumberWordsTest, ValueTooLargeAtHalfMaximum) {
    std::string out;
    const int64_t limit = std::numeric_limits<int64_t>::max() / 2;

    EXPECT_EQ(numberToText(limit, out).code, ErrorCode::VALUE_TOO_LARGE);
    EXPECT_EQ(numberToText(-limit, out).code, ErrorCode::VALUE_TOO_LARGE);
    EXPECT_EQ(numberToText(std::numeric_limits<int64_t>::max(), out).code,
        ErrorCode::VALUE_TOO_LARGE);
    EXPECT_TRUE(numberToText(limit - 1, out).isOk());
}

// =============================================================================
// renderSmall
// =============================================================================

TEST(RenderSmallTest, AppendsWordsForSubThousand) {
    std::vector<std::string> out;
    ASSERT_TRUE(renderSmall(342, out).isOk());
    std::vector<std::string> expected = {"Three", "Hundred", "and", "Forty", "Two"};
    EXPECT_EQ(out, expected);
}

TEST(RenderSmallTest, ZeroAppendsNothing) {
    std::vector<std::string> out;
    ASSERT_TRUE(renderSmall(0, out).isOk());
    EXPECT_TRUE(out.empty());
}

TEST(RenderSmallTest, RejectsOutOfRange) {
    std::vector<std::string> out;
    EXPECT_EQ(renderSmall(1000, out).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(renderSmall(-1, out).code, ErrorCode::INVALID_INPUT);
    EXPECT_TRUE(out.empty());
}
