// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#include "utils/string.h" // The file under test.

#include <gtest/gtest.h>

#include <string>
#include <tuple>

// NOLINTBEGIN(*-magic-numbers)
namespace flowscale
{

TEST(ParseDecimalTest, Integer)
{
    const auto number = parseDecimal("42");
    ASSERT_TRUE(number.has_value());
    EXPECT_DOUBLE_EQ(42.0, number->value);
    EXPECT_EQ(size_t{ 0 }, number->decimals);
}

TEST(ParseDecimalTest, Fraction)
{
    const auto number = parseDecimal("1.23450");
    ASSERT_TRUE(number.has_value());
    EXPECT_DOUBLE_EQ(1.2345, number->value);
    EXPECT_EQ(size_t{ 5 }, number->decimals) << "Trailing zeros count as decimals, they are part of the formatting.";
}

TEST(ParseDecimalTest, Signs)
{
    const auto negative = parseDecimal("-0.8");
    ASSERT_TRUE(negative.has_value());
    EXPECT_DOUBLE_EQ(-0.8, negative->value);

    const auto positive = parseDecimal("+2.5");
    ASSERT_TRUE(positive.has_value());
    EXPECT_DOUBLE_EQ(2.5, positive->value);
}

TEST(ParseDecimalTest, MissingDigitsAroundPoint)
{
    const auto leading = parseDecimal(".04");
    ASSERT_TRUE(leading.has_value());
    EXPECT_DOUBLE_EQ(0.04, leading->value);
    EXPECT_EQ(size_t{ 2 }, leading->decimals);

    const auto trailing = parseDecimal("12.");
    ASSERT_TRUE(trailing.has_value());
    EXPECT_DOUBLE_EQ(12.0, trailing->value);
    EXPECT_EQ(size_t{ 0 }, trailing->decimals);
}

/*
 * Fixture to allow parameterized tests for text that is not a plain decimal.
 */
class ParseDecimalMalformedTest : public testing::TestWithParam<std::string>
{
};

TEST_P(ParseDecimalMalformedTest, Rejected)
{
    const std::string text = GetParam();
    EXPECT_FALSE(parseDecimal(text).has_value()) << "'" << text << "' must not be accepted as a number.";
}

INSTANTIATE_TEST_SUITE_P(ParseDecimalMalformedTestInstantiation,
                         ParseDecimalMalformedTest,
                         testing::Values("", "-", ".", "+.", "1.2.3", "1e-3", "abc", "1a", "inf", "nan", " 1", "1 ", "--1"));

/*
 * Fixture to allow parameterized tests for formatDecimal: value, minimum decimals, maximum decimals, expected text.
 */
class FormatDecimalTest : public testing::TestWithParam<std::tuple<double, size_t, size_t, std::string>>
{
};

TEST_P(FormatDecimalTest, Format)
{
    const auto& [value, min_decimals, max_decimals, expected] = GetParam();
    EXPECT_EQ(expected, formatDecimal(value, min_decimals, max_decimals));
}

INSTANTIATE_TEST_SUITE_P(FormatDecimalTestInstantiation,
                         FormatDecimalTest,
                         testing::Values(std::make_tuple(0.5, 1, 5, "0.5"),
                                         std::make_tuple(1.0, 1, 5, "1.0"),
                                         std::make_tuple(0.75, 1, 5, "0.75"),
                                         std::make_tuple(2.0, 0, 5, "2"),
                                         std::make_tuple(0.123456789, 0, 5, "0.12346"),
                                         std::make_tuple(1.5, 5, 5, "1.50000"),
                                         std::make_tuple(-0.000001, 2, 5, "0.00"),
                                         std::make_tuple(-1.25, 0, 5, "-1.25"),
                                         std::make_tuple(3.0, 3, 3, "3.000"),
                                         std::make_tuple(7.5, 0, 0, "8")));

TEST(FormatDecimalPrecisionTest, MoreDecimalsThanADoubleHas)
{
    EXPECT_EQ("0.5" + std::string(319, '0'), formatDecimal(0.5, 320, 320)) << "Rounding may not overflow to infinity.";
    EXPECT_EQ("-2.25", formatDecimal(-2.25, 0, 400));
}

TEST(TrimTest, Whitespace)
{
    EXPECT_EQ("G1 X1", trim("  G1 X1 \r\n"));
    EXPECT_EQ("", trim(" \t\n"));
    EXPECT_EQ("a", trim("a"));
}

} // namespace flowscale
// NOLINTEND(*-magic-numbers)
