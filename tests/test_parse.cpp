/**
 * @file test_parse.cpp
 * @brief Unit tests for plain scalar resolution (GoogleTest)
 *
 * Tests aligned with the YAML 1.2 core schema used by Parse.cpp:
 * - true/false in three casings for booleans (yes/no/on/off stay strings)
 * - ~ and null in three casings for null
 * - decimal, 0o octal and 0x hex integers
 * - floats including .inf and .nan
 */

#include <gtest/gtest.h>
#include "yedit/Parse.hpp"
#include "yedit/Value.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace yedit;

// ============================================================================
// Boolean Parsing
// ============================================================================

TEST(ParseBoolean, TrueValues) {
    EXPECT_EQ(parse_scalar("true"), true);
    EXPECT_EQ(parse_scalar("True"), true);
    EXPECT_EQ(parse_scalar("TRUE"), true);
}

TEST(ParseBoolean, FalseValues) {
    EXPECT_EQ(parse_scalar("false"), false);
    EXPECT_EQ(parse_scalar("False"), false);
    EXPECT_EQ(parse_scalar("FALSE"), false);
}

TEST(ParseBoolean, Yaml11WordsStayStrings) {
    EXPECT_EQ(parse_scalar("yes"), "yes");
    EXPECT_EQ(parse_scalar("off"), "off");
    EXPECT_EQ(parse_scalar("tRUE"), "tRUE");
}

TEST(ParseBoolean, NumericNotBoolean) {
    EXPECT_EQ(parse_scalar("1"), 1);
    EXPECT_EQ(parse_scalar("0"), 0);
    EXPECT_TRUE(parse_scalar("1").is_number_integer());
}

// ============================================================================
// Null Parsing
// ============================================================================

TEST(ParseNull, NullValues) {
    EXPECT_TRUE(parse_scalar("").is_null());
    EXPECT_TRUE(parse_scalar("~").is_null());
    EXPECT_TRUE(parse_scalar("null").is_null());
    EXPECT_TRUE(parse_scalar("Null").is_null());
    EXPECT_TRUE(parse_scalar("NULL").is_null());
}

TEST(ParseNull, OtherWordsAreStrings) {
    EXPECT_EQ(parse_scalar("none"), "none");
    EXPECT_EQ(parse_scalar("nil"), "nil");
}

// ============================================================================
// Integer Parsing
// ============================================================================

TEST(ParseInteger, Decimal) {
    EXPECT_EQ(parse_scalar("42"), 42);
    EXPECT_EQ(parse_scalar("-42"), -42);
    EXPECT_EQ(parse_scalar("+7"), 7);
    EXPECT_EQ(parse_scalar("007"), 7);
}

TEST(ParseInteger, OctalAndHex) {
    EXPECT_EQ(parse_scalar("0o17"), 15);
    EXPECT_EQ(parse_scalar("0x1F"), 31);
    EXPECT_EQ(parse_scalar("0xff"), 255);
}

TEST(ParseInteger, Limits) {
    EXPECT_EQ(parse_scalar("9223372036854775807").get<std::int64_t>(),
              std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(parse_scalar("-9223372036854775808").get<std::int64_t>(),
              std::numeric_limits<std::int64_t>::min());

    Value big = parse_scalar("18446744073709551615");
    EXPECT_TRUE(big.is_number_unsigned());

    Value huge = parse_scalar("99999999999999999999999");
    EXPECT_TRUE(huge.is_number_float());
}

// ============================================================================
// Float Parsing
// ============================================================================

TEST(ParseFloat, Simple) {
    EXPECT_DOUBLE_EQ(parse_scalar("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_scalar("-2.5e3").get<double>(), -2500.0);
    EXPECT_DOUBLE_EQ(parse_scalar(".5").get<double>(), 0.5);
    EXPECT_TRUE(parse_scalar("1.").is_number_float());
}

TEST(ParseFloat, InfinityAndNan) {
    EXPECT_TRUE(std::isinf(parse_scalar(".inf").get<double>()));
    EXPECT_LT(parse_scalar("-.Inf").get<double>(), 0.0);
    EXPECT_TRUE(std::isnan(parse_scalar(".nan").get<double>()));
}

// ============================================================================
// String Fallback
// ============================================================================

TEST(ParseString, Fallback) {
    EXPECT_EQ(parse_scalar("hello"), "hello");
    EXPECT_EQ(parse_scalar("hello world"), "hello world");
    EXPECT_EQ(parse_scalar("123abc"), "123abc");
    EXPECT_EQ(parse_scalar("3.14abc"), "3.14abc");
    EXPECT_EQ(parse_scalar("."), ".");
    EXPECT_EQ(parse_scalar("0x"), "0x");
}

TEST(ResolvesToString, OnlyPlainText) {
    EXPECT_TRUE(resolves_to_string("hello"));
    EXPECT_TRUE(resolves_to_string("yes"));
    EXPECT_FALSE(resolves_to_string("42"));
    EXPECT_FALSE(resolves_to_string("true"));
    EXPECT_FALSE(resolves_to_string(""));
    EXPECT_FALSE(resolves_to_string("~"));
}
