//! # Expression Matcher Tests
//!
//! Whole-text matching of compiled patterns against step text.

#include "cuke/expression/expression.hpp"

#include <gtest/gtest.h>

using namespace cuke;
using namespace cuke::expression;

class MatcherTest : public ::testing::Test {
protected:
    auto match_text(std::string_view pattern, std::string_view text)
        -> std::optional<std::vector<Value>> {
        auto compiled = expression::compile(pattern);
        if (is_err(compiled)) {
            ADD_FAILURE() << unwrap_err(compiled).to_string();
            return std::nullopt;
        }
        return expression::match(text, unwrap(compiled));
    }
};

// ============================================================================
// Parameters
// ============================================================================

TEST_F(MatcherTest, IntParameter) {
    auto args = match_text("I have {int} cucumbers", "I have 42 cucumbers");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{int64_t{42}}));

    args = match_text("I have {int} cucumbers", "I have -5 cucumbers");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{int64_t{-5}}));

    EXPECT_FALSE(match_text("I have {int} cucumbers", "I have many cucumbers").has_value());
}

TEST_F(MatcherTest, IntOverflowDoesNotMatch) {
    EXPECT_FALSE(match_text("{int}", "9223372036854775808").has_value());

    auto args = match_text("{int}", "9223372036854775807");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{int64_t{9223372036854775807}}));
}

TEST_F(MatcherTest, FloatParameter) {
    auto args = match_text("it costs {float}", "it costs 19.99");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{19.99}));

    EXPECT_FALSE(match_text("it costs {float}", "it costs 20").has_value());
}

TEST_F(MatcherTest, MixedTypes) {
    auto args = match_text("{string} costs {float} with {word} and {atom}",
                           R"("red \"apple\"" costs 1.5 with big-tag and admin@home)");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{std::string(R"(red "apple")"), 1.5,
                                         std::string("big-tag"), Atom{"admin@home"}}));
}

TEST_F(MatcherTest, WordStopsAtWhitespace) {
    EXPECT_FALSE(match_text("user {word}", "user two words").has_value());
}

// ============================================================================
// Optional Parameters and Text
// ============================================================================

TEST_F(MatcherTest, OptionalTextEitherWay) {
    EXPECT_EQ(match_text("I have {int} cucumber(s)", "I have 1 cucumber"),
              (std::vector<Value>{int64_t{1}}));
    EXPECT_EQ(match_text("I have {int} cucumber(s)", "I have 2 cucumbers"),
              (std::vector<Value>{int64_t{2}}));
}

TEST_F(MatcherTest, AbsentOptionalParameterIsNull) {
    auto args = match_text("count{int?}", "count");
    ASSERT_TRUE(args.has_value());
    ASSERT_EQ(args->size(), 1u);
    EXPECT_TRUE(is_null((*args)[0]));

    args = match_text("count{int?}", "count7");
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(*args, (std::vector<Value>{int64_t{7}}));

    args = match_text("total {int?}", "total ");
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(is_null((*args)[0]));
}

TEST_F(MatcherTest, FailedOptionalParameterLeavesTextInPlace) {
    auto args = match_text("page{int?}end", "pageend");
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(is_null((*args)[0]));
}

// ============================================================================
// Alternation
// ============================================================================

TEST_F(MatcherTest, Alternation) {
    EXPECT_TRUE(match_text("I click/tap the button", "I click the button").has_value());
    EXPECT_TRUE(match_text("I click/tap the button", "I tap the button").has_value());
    EXPECT_FALSE(match_text("I click/tap the button", "I push the button").has_value());
}

TEST_F(MatcherTest, AlternationTakesFirstPrefixWithoutBacktracking) {
    EXPECT_FALSE(match_text("a/ab c", "ab c").has_value());
    EXPECT_TRUE(match_text("ab/a c", "ab c").has_value());
}

// ============================================================================
// Whole-Text Rule
// ============================================================================

TEST_F(MatcherTest, EscapedBraces) {
    auto args = match_text(R"(I see \{braces\})", "I see {braces}");
    ASSERT_TRUE(args.has_value());
    EXPECT_TRUE(args->empty());
}

TEST_F(MatcherTest, TrailingTextFails) {
    EXPECT_FALSE(match_text("I have {int}", "I have 5 left").has_value());
    EXPECT_FALSE(match_text("exact", "exact ").has_value());
}

TEST_F(MatcherTest, EmptyPattern) {
    EXPECT_TRUE(match_text("", "").has_value());
    EXPECT_FALSE(match_text("", "x").has_value());
}

TEST_F(MatcherTest, CompiledExpressionIsReusable) {
    auto compiled = expression::compile("{int} + {int}");
    ASSERT_TRUE(is_ok(compiled));
    const auto& expr = unwrap(compiled);

    EXPECT_EQ(expression::match("1 + 2", expr), (std::vector<Value>{int64_t{1}, int64_t{2}}));
    EXPECT_EQ(expression::match("3 + 4", expr), (std::vector<Value>{int64_t{3}, int64_t{4}}));
    EXPECT_FALSE(expression::match("3 +", expr).has_value());
}
