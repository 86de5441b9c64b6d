/**
 * @file test_coerce.cpp
 * @brief Unit tests for value coercion (GoogleTest)
 */

#include <gtest/gtest.h>
#include "yedit/Coerce.hpp"
#include "yedit/Errors.hpp"

using namespace yedit;

// ============================================================================
// coerce_value
// ============================================================================

TEST(CoerceValue, NaturalTypes) {
    EXPECT_EQ(coerce_value("5"), 5);
    EXPECT_EQ(coerce_value("2.5"), 2.5);
    EXPECT_EQ(coerce_value("true"), true);
    EXPECT_EQ(coerce_value("hello"), "hello");
    EXPECT_TRUE(coerce_value("~").is_null());
}

TEST(CoerceValue, YamlFragments) {
    EXPECT_EQ(coerce_value("[1, 2]"), Value::parse("[1, 2]"));
    EXPECT_EQ(coerce_value("{a: 1}"), Value::parse(R"({"a": 1})"));
    EXPECT_EQ(coerce_value("'5'"), "5");
}

TEST(CoerceValue, EmptyTextUnchanged) {
    EXPECT_EQ(coerce_value(""), "");
    EXPECT_EQ(coerce_value("", "int"), "");
}

TEST(CoerceValue, DeclaredStringKeepsText) {
    EXPECT_EQ(coerce_value("5", "str"), "5");
    EXPECT_EQ(coerce_value("true", "string"), "true");
}

TEST(CoerceValue, DeclaredStringStringifiesBoolean) {
    EXPECT_EQ(coerce_value(true, "str"), "True");
    EXPECT_EQ(coerce_value(false, "str"), "False");
}

TEST(CoerceValue, DeclaredBoolean) {
    for (const auto& token : TRUE_TOKENS) {
        EXPECT_EQ(coerce_value(token, "bool"), true) << token;
    }
    for (const auto& token : FALSE_TOKENS) {
        EXPECT_EQ(coerce_value(token, "boolean"), false) << token;
    }
}

TEST(CoerceValue, DeclaredBooleanRejectsOtherText) {
    EXPECT_THROW(coerce_value("maybe", "bool"), TypeMismatchError);
    EXPECT_THROW(coerce_value("yEs", "bool"), TypeMismatchError);
    EXPECT_THROW(coerce_value("1", "bool"), TypeMismatchError);
}

TEST(CoerceValue, TypedInputPassesThrough) {
    EXPECT_EQ(coerce_value(7), 7);
    EXPECT_EQ(coerce_value(Value::parse(R"({"a": [1]})")), Value::parse(R"({"a": [1]})"));
}

TEST(CoerceValue, UnparsableTextThrows) {
    EXPECT_THROW(coerce_value("[1, 2"), TypeMismatchError);
}

// ============================================================================
// coerce_current_value
// ============================================================================

TEST(CoerceCurrentValue, Formats) {
    EXPECT_EQ(*coerce_current_value(Value("1"), ValueFormat::Yaml), 1);
    EXPECT_EQ(*coerce_current_value(Value(R"({"a": 1})"), ValueFormat::Json),
              Value::parse(R"({"a": 1})"));
    EXPECT_EQ(*coerce_current_value(Value("1"), ValueFormat::PlainString), "1");
}

TEST(CoerceCurrentValue, AbsentStaysAbsent) {
    EXPECT_FALSE(coerce_current_value(std::nullopt, ValueFormat::Yaml).has_value());
}

TEST(CoerceCurrentValue, BadJsonThrows) {
    EXPECT_THROW(coerce_current_value(Value("{a: 1}"), ValueFormat::Json), TypeMismatchError);
}

TEST(ValueFormatNames, Parse) {
    EXPECT_EQ(parse_value_format("yaml"), ValueFormat::Yaml);
    EXPECT_EQ(parse_value_format("JSON"), ValueFormat::Json);
    EXPECT_EQ(parse_value_format("plain-string"), ValueFormat::PlainString);
    EXPECT_EQ(parse_value_format("str"), ValueFormat::PlainString);
    EXPECT_THROW(parse_value_format("xml"), ParameterError);
}

// ============================================================================
// Parameter readers
// ============================================================================

TEST(AsBool, Forms) {
    EXPECT_EQ(as_bool(true), true);
    EXPECT_EQ(as_bool("yes"), true);
    EXPECT_EQ(as_bool("OFF"), false);
    EXPECT_FALSE(as_bool("maybe").has_value());
    EXPECT_FALSE(as_bool(1).has_value());
}

TEST(AsInteger, Forms) {
    EXPECT_EQ(as_integer(5), 5);
    EXPECT_EQ(as_integer("-2"), -2);
    EXPECT_EQ(as_integer(" 0x10 "), 16);
    EXPECT_FALSE(as_integer("1.5").has_value());
    EXPECT_FALSE(as_integer("abc").has_value());
    EXPECT_FALSE(as_integer(Value(18446744073709551615ULL)).has_value());
}
