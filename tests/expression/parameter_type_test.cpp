//! # Parameter Type Tests
//!
//! Sub-parsers in isolation, plus the display helpers for captured values.

#include "cuke/expression/parameter_type.hpp"

#include <gtest/gtest.h>

using namespace cuke::expression;

// ============================================================================
// Type Table
// ============================================================================

TEST(ParameterTypeTest, Lookup) {
    EXPECT_EQ(find_parameter_kind("int"), ParameterKind::Int);
    EXPECT_EQ(find_parameter_kind("atom"), ParameterKind::Atom);
    EXPECT_FALSE(find_parameter_kind("Int").has_value());
    EXPECT_FALSE(find_parameter_kind("bigdecimal").has_value());
    EXPECT_EQ(parameter_kind_name(ParameterKind::Float), "float");
}

TEST(ParameterTypeTest, NamesInTableOrder) {
    EXPECT_EQ(parameter_type_names(),
              (std::vector<std::string_view>{"string", "int", "float", "word", "atom"}));
}

// ============================================================================
// Sub-Parsers
// ============================================================================

TEST(ParameterTypeTest, IntAcceptsSign) {
    auto parsed = parse_parameter(ParameterKind::Int, "-5 cukes");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{int64_t{-5}});
    EXPECT_EQ(parsed->consumed, 2u);

    parsed = parse_parameter(ParameterKind::Int, "+7");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{int64_t{7}});
}

TEST(ParameterTypeTest, IntRejections) {
    EXPECT_FALSE(parse_parameter(ParameterKind::Int, "many").has_value());
    EXPECT_FALSE(parse_parameter(ParameterKind::Int, "-").has_value());
    EXPECT_FALSE(parse_parameter(ParameterKind::Int, "99999999999999999999").has_value());
}

TEST(ParameterTypeTest, IntStopsAtFirstNonDigit) {
    auto parsed = parse_parameter(ParameterKind::Int, "12.5");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{int64_t{12}});
    EXPECT_EQ(parsed->consumed, 2u);
}

TEST(ParameterTypeTest, FloatNeedsFractionDigits) {
    auto parsed = parse_parameter(ParameterKind::Float, "19.99 each");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{19.99});
    EXPECT_EQ(parsed->consumed, 5u);

    parsed = parse_parameter(ParameterKind::Float, "-0.5");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{-0.5});

    EXPECT_FALSE(parse_parameter(ParameterKind::Float, "20").has_value());
    EXPECT_FALSE(parse_parameter(ParameterKind::Float, "20.").has_value());
    EXPECT_FALSE(parse_parameter(ParameterKind::Float, ".5").has_value());
}

TEST(ParameterTypeTest, StringUnescapes) {
    auto parsed = parse_parameter(ParameterKind::String, R"("say \"hi\" \\o/" rest)");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{std::string(R"(say "hi" \o/)")});
    EXPECT_EQ(parsed->consumed, 17u);

    parsed = parse_parameter(ParameterKind::String, R"("")");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{std::string()});
}

TEST(ParameterTypeTest, StringRejections) {
    EXPECT_FALSE(parse_parameter(ParameterKind::String, "unquoted").has_value());
    EXPECT_FALSE(parse_parameter(ParameterKind::String, "\"never closed").has_value());
}

TEST(ParameterTypeTest, WordIsNonWhitespaceRun) {
    auto parsed = parse_parameter(ParameterKind::Word, "big-tag! next");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{std::string("big-tag!")});
    EXPECT_FALSE(parse_parameter(ParameterKind::Word, " leading").has_value());
}

TEST(ParameterTypeTest, AtomCharacters) {
    auto parsed = parse_parameter(ParameterKind::Atom, "admin@home_1-x");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->value, Value{Atom{"admin@home_1"}});
    EXPECT_EQ(parsed->consumed, 12u);
    EXPECT_FALSE(parse_parameter(ParameterKind::Atom, "-x").has_value());
}

// ============================================================================
// Values
// ============================================================================

TEST(ValueTest, TypeNames) {
    EXPECT_EQ(value_type_name(Value{}), "null");
    EXPECT_EQ(value_type_name(Value{int64_t{1}}), "int");
    EXPECT_EQ(value_type_name(Value{1.5}), "float");
    EXPECT_EQ(value_type_name(Value{std::string("x")}), "string");
    EXPECT_EQ(value_type_name(Value{Atom{"x"}}), "atom");
    EXPECT_TRUE(is_null(Value{}));
}

TEST(ValueTest, DisplayForms) {
    EXPECT_EQ(value_to_string(Value{}), "null");
    EXPECT_EQ(value_to_string(Value{int64_t{-42}}), "-42");
    EXPECT_EQ(value_to_string(Value{20.0}), "20.0");
    EXPECT_EQ(value_to_string(Value{19.99}), "19.99");
    EXPECT_EQ(value_to_string(Value{std::string(R"(a"b\)")}), R"("a\"b\\")");
    EXPECT_EQ(value_to_string(Value{Atom{"admin"}}), ":admin");
}
