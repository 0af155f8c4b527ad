//! # Expression Compiler Tests

#include "cuke/expression/expression.hpp"

#include <gtest/gtest.h>

using namespace cuke;
using namespace cuke::expression;

class CompilerTest : public ::testing::Test {
protected:
    auto compile_ok(std::string_view pattern) -> std::vector<Node> {
        auto result = expression::compile(pattern);
        if (is_err(result)) {
            ADD_FAILURE() << unwrap_err(result).to_string();
            return {};
        }
        return unwrap(result).nodes();
    }

    auto compile_err(std::string_view pattern) -> CompileError {
        auto result = expression::compile(pattern);
        if (is_ok(result)) {
            ADD_FAILURE() << "expected a compile error for " << pattern;
            return CompileError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Node Sequences
// ============================================================================

TEST_F(CompilerTest, LiteralAndParameter) {
    auto nodes = compile_ok("I have {int} cucumber(s)");

    ASSERT_EQ(nodes.size(), 4u);
    EXPECT_EQ(nodes[0], Node{LiteralNode{"I have "}});
    EXPECT_EQ(nodes[1], (Node{ParameterNode{"int", ParameterKind::Int, false}}));
    EXPECT_EQ(nodes[2], Node{LiteralNode{" cucumber"}});
    EXPECT_EQ(nodes[3], Node{OptionalTextNode{"s"}});
}

TEST_F(CompilerTest, OptionalParameter) {
    auto nodes = compile_ok("count{int?}");

    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[1], (Node{ParameterNode{"int", ParameterKind::Int, true}}));
}

TEST_F(CompilerTest, Alternation) {
    auto nodes = compile_ok("I click/tap/press the button");

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0], Node{LiteralNode{"I "}});
    EXPECT_EQ(nodes[1], (Node{AlternationNode{{"click", "tap", "press"}}}));
    EXPECT_EQ(nodes[2], Node{LiteralNode{" the button"}});
}

TEST_F(CompilerTest, EscapesMergeIntoLiterals) {
    auto nodes = compile_ok(R"(I see \{braces\} and \(parens\) a\/b \\)");

    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes[0], Node{LiteralNode{R"(I see {braces} and (parens) a/b \)"}});
}

TEST_F(CompilerTest, NoAdjacentLiterals) {
    auto nodes = compile_ok("a  b\tc {word} d");

    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0], Node{LiteralNode{"a  b\tc "}});
    EXPECT_EQ(nodes[2], Node{LiteralNode{" d"}});
}

TEST_F(CompilerTest, EmptyPattern) {
    EXPECT_TRUE(compile_ok("").empty());
}

TEST_F(CompilerTest, ParameterCount) {
    auto result = expression::compile("{string} costs {float?} (each)");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).parameter_count(), 2u);
    EXPECT_EQ(unwrap(result).source(), "{string} costs {float?} (each)");
}

TEST_F(CompilerTest, NodeRendering) {
    EXPECT_EQ(node_to_string(LiteralNode{"text"}), "\"text\"");
    EXPECT_EQ(node_to_string(ParameterNode{"int", ParameterKind::Int, true}), "{int?}");
    EXPECT_EQ(node_to_string(OptionalTextNode{"s"}), "(s)");
    EXPECT_EQ(node_to_string(AlternationNode{{"a", "b"}}), "a/b");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(CompilerTest, UnknownParameterType) {
    auto error = compile_err("I have {bogus} items");

    EXPECT_EQ(error.kind, CompileErrorKind::UnknownParameterType);
    EXPECT_EQ(error.message, "Unknown parameter type: bogus");
    EXPECT_EQ(error.offset, 7u);
    EXPECT_EQ(error.fragment, "bogus");
    EXPECT_EQ(error.pattern, "I have {bogus} items");
}

TEST_F(CompilerTest, UnclosedParameter) {
    auto error = compile_err("{int");

    EXPECT_EQ(error.kind, CompileErrorKind::MalformedSyntax);
    EXPECT_EQ(error.offset, 0u);
    EXPECT_EQ(error.fragment, "{int");
    EXPECT_EQ(error.message.rfind("Malformed expression at offset 0: expected", 0), 0u);
}

TEST_F(CompilerTest, UpperCaseTypeNameIsMalformed) {
    auto error = compile_err("x {Int}");

    EXPECT_EQ(error.kind, CompileErrorKind::MalformedSyntax);
    EXPECT_EQ(error.offset, 2u);
    EXPECT_EQ(error.fragment, "{Int}");
}

TEST_F(CompilerTest, EmptyOptionalText) {
    auto error = compile_err("cucumber()");
    EXPECT_EQ(error.kind, CompileErrorKind::MalformedSyntax);
    EXPECT_EQ(error.offset, 8u);

    EXPECT_EQ(compile_err("open (never").kind, CompileErrorKind::MalformedSyntax);
}

TEST_F(CompilerTest, BadEscape) {
    auto error = compile_err(R"(a \x)");

    EXPECT_EQ(error.kind, CompileErrorKind::MalformedSyntax);
    EXPECT_EQ(error.offset, 2u);
    EXPECT_EQ(error.fragment, R"(\x)");
    EXPECT_EQ(compile_err("trailing \\").offset, 9u);
}

TEST_F(CompilerTest, ErrorRendering) {
    auto error = compile_err("a {nope}");
    EXPECT_EQ(error.to_string(), "Unknown parameter type: nope\n  a {nope}\n    ^\n");
}
