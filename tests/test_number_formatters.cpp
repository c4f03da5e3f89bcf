// File: tests/test_number_formatters.cpp
// Purpose: Verify ordinal, currency and decimal readings built on the English
//          cardinal converter.
// Key invariants: Amounts are rounded to hundredths (half away from zero)
//                 before splitting; singular unit words only for exactly 1.

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>

#include <limits>
#include <string>

#include "internal/numwords_types.hpp"
#include "internal/text/number_formatters.hpp"

using namespace numwords;
using namespace numwords::text;

namespace {

std::string ordinal(int64_t number) {
    std::string out;
    ErrorInfo err = toOrdinal(number, out);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

std::string currency(double amount) {
    std::string out;
    ErrorInfo err = toCurrency(amount, out);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

std::string decimal(double value) {
    std::string out;
    ErrorInfo err = decimalToText(value, out);
    EXPECT_TRUE(err.isOk()) << err.toString();
    return out;
}

}  // namespace

// =============================================================================
// Ordinal
// =============================================================================

TEST(OrdinalTest, SuffixByLastDigits) {
    EXPECT_STREQ(ordinalSuffix(1), "st");
    EXPECT_STREQ(ordinalSuffix(2), "nd");
    EXPECT_STREQ(ordinalSuffix(3), "rd");
    EXPECT_STREQ(ordinalSuffix(4), "th");
    EXPECT_STREQ(ordinalSuffix(0), "th");
    EXPECT_STREQ(ordinalSuffix(101), "st");
}

TEST(OrdinalTest, TeensAlwaysTakeTh) {
    EXPECT_STREQ(ordinalSuffix(11), "th");
    EXPECT_STREQ(ordinalSuffix(12), "th");
    EXPECT_STREQ(ordinalSuffix(13), "th");
    EXPECT_STREQ(ordinalSuffix(111), "th");
    EXPECT_STREQ(ordinalSuffix(-12), "th");
}

TEST(OrdinalTest, WordsWithMarker) {
    EXPECT_EQ(ordinal(11), "Eleven (11th)");
    EXPECT_EQ(ordinal(21), "Twenty One (21st)");
    EXPECT_EQ(ordinal(22), "Twenty Two (22nd)");
    EXPECT_EQ(ordinal(23), "Twenty Three (23rd)");
    EXPECT_EQ(ordinal(112), "One Hundred and Twelve (112th)");
}

TEST(OrdinalTest, NegativeKeepsSign) {
    EXPECT_EQ(ordinal(-1), "Minus One (-1st)");
}

TEST(OrdinalTest, PropagatesCardinalErrorUnchanged) {
    std::string out;
    ErrorInfo err = toOrdinal(std::numeric_limits<int64_t>::max(), out);
    EXPECT_EQ(err.code, ErrorCode::VALUE_TOO_LARGE);
}

// =============================================================================
// Currency
// =============================================================================

TEST(CurrencyTest, WholeDollars) {
    EXPECT_EQ(currency(1.0), "One Dollar");
    EXPECT_EQ(currency(0.0), "Zero Dollars");
    EXPECT_EQ(currency(20.0), "Twenty Dollars");
}

TEST(CurrencyTest, DollarsAndCents) {
    EXPECT_EQ(currency(2.45), "Two Dollars and Forty Five Cents");
    EXPECT_EQ(currency(0.01), "Zero Dollars and One Cent");
    EXPECT_EQ(currency(1.5), "One Dollar and Fifty Cents");
}

TEST(CurrencyTest, RoundsToHundredths) {
    EXPECT_EQ(currency(1.234), "One Dollar and Twenty Three Cents");
    EXPECT_EQ(currency(0.999), "One Dollar");
}

TEST(CurrencyTest, NegativeAmount) {
    EXPECT_EQ(currency(-1.5), "Minus One Dollar and Fifty Cents");
}

TEST(CurrencyTest, RejectsNonFinite) {
    std::string out;
    EXPECT_EQ(toCurrency(std::nan(""), out).code, ErrorCode::INVALID_INPUT);
    EXPECT_EQ(toCurrency(std::numeric_limits<double>::infinity(), out).code,
        ErrorCode::INVALID_INPUT);
}

TEST(CurrencyTest, RejectsOutOfRange) {
    std::string out;
    EXPECT_EQ(toCurrency(1e17, out).code, ErrorCode::VALUE_TOO_LARGE);
    EXPECT_EQ(toCurrency(-1e17, out).code, ErrorCode::VALUE_TOO_LARGE);
}

// =============================================================================
// Decimal
// =============================================================================

TEST(DecimalTest, TwoFractionDigits) {
    EXPECT_EQ(decimal(3.14), "Three point Fourteen");
    EXPECT_EQ(decimal(0.5), "Zero point Fifty");
    EXPECT_EQ(decimal(2.0), "Two point Zero");
}

TEST(DecimalTest, LeadingZeroFractionReadAsCardinal) {
    EXPECT_EQ(decimal(0.05), "Zero point Five");
}

TEST(DecimalTest, Negative) {
    EXPECT_EQ(decimal(-3.14), "Minus Three point Fourteen");
}

TEST(DecimalTest, RejectsNonFinite) {
    std::string out;
    EXPECT_EQ(decimalToText(std::numeric_limits<double>::quiet_NaN(), out).code,
        ErrorCode::INVALID_INPUT);
}
