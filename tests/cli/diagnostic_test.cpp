//! # Diagnostic Rendering Tests

#include "cli/diagnostic.hpp"

#include "cuke/expression/expression.hpp"
#include "cuke/gherkin/gherkin.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace cuke;
using namespace cuke::cli;

class DiagnosticTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    DiagnosticEmitter emitter_{out_};

    void SetUp() override {
        emitter_.set_color_enabled(false);
    }
};

// ============================================================================
// Similar Names
// ============================================================================

TEST(LevenshteinTest, Distances) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3u);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3u);
    EXPECT_EQ(levenshtein_distance("Given", "given"), 0u);
    EXPECT_EQ(levenshtein_distance("Gvien", "Given"), 2u);
}

TEST(FindSimilarTest, ClosestCandidate) {
    std::vector<std::string_view> types{"string", "int", "float", "word", "atom"};
    EXPECT_EQ(find_similar("flaot", types), "float");
    EXPECT_EQ(find_similar("wrd", types), "word");
    EXPECT_EQ(find_similar("xyzzy", types), "");
}

TEST(ErrorCodeTest, OnePerKind) {
    EXPECT_STREQ(error_code_for(gherkin::ParseErrorKind::UnexpectedLine), "G001");
    EXPECT_STREQ(error_code_for(gherkin::ParseErrorKind::ConflictingStepArgument), "G008");
    EXPECT_STREQ(error_code_for(expression::CompileErrorKind::UnknownParameterType), "X001");
    EXPECT_STREQ(error_code_for(expression::CompileErrorKind::MalformedSyntax), "X002");
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(DiagnosticTest, ParseErrorWithSuggestion) {
    std::string text = "Feature: Demo\n"
                       "  Scenario: S\n"
                       "    Given I have 4 cukes\n"
                       "    Gvien I have 5 cukes\n";
    auto parsed = gherkin::parse(text);
    ASSERT_TRUE(is_err(parsed));

    emitter_.set_source_content("demo.feature", text);
    emitter_.emit(make_diagnostic(unwrap_err(parsed), "demo.feature"));

    EXPECT_EQ(out_.str(), "error[G001]: Expected a step, Scenario:, Scenario Outline: or tags, "
                          "found 'Gvien I have 5 cukes'\n"
                          "  --> demo.feature:4:5\n"
                          "   |\n"
                          " 4 |     Gvien I have 5 cukes\n"
                          "   |     ^^^^^\n"
                          "  = help: did you mean `Given`?\n");
    EXPECT_EQ(emitter_.error_count(), 1u);
}

TEST_F(DiagnosticTest, UnknownParameterType) {
    std::string pattern = "I have {flaot} items";
    auto compiled = expression::compile(pattern);
    ASSERT_TRUE(is_err(compiled));

    emitter_.set_source_content("<pattern>", pattern);
    emitter_.emit(make_diagnostic(unwrap_err(compiled), "<pattern>", 1));

    EXPECT_EQ(out_.str(),
              "error[X001]: Unknown parameter type: flaot\n"
              "  --> <pattern>:1:8\n"
              "   |\n"
              " 1 | I have {flaot} items\n"
              "   |        ^^^^^^^ unknown type\n"
              "  = note: available parameter types: {string}, {int}, {float}, {word}, {atom}\n"
              "  = help: did you mean `{float}`?\n");
}

TEST_F(DiagnosticTest, PatternIndentShiftsColumn) {
    auto compiled = expression::compile("{int");
    ASSERT_TRUE(is_err(compiled));

    auto diag = make_diagnostic(unwrap_err(compiled), "steps.txt", 3, 2);
    EXPECT_EQ(diag.code, "X002");
    EXPECT_EQ(diag.line, 3u);
    EXPECT_EQ(diag.column, 3u);
    EXPECT_EQ(diag.length, 4u);
}

TEST_F(DiagnosticTest, NoLocationPrintsHeaderOnly) {
    emitter_.emit(Diagnostic{.code = ErrorCodes::UNREADABLE_FILE,
                             .message = "Failed to open file: missing.feature"});

    EXPECT_EQ(out_.str(), "error[E001]: Failed to open file: missing.feature\n");
}

TEST_F(DiagnosticTest, UnknownFileSkipsSnippet) {
    emitter_.emit(Diagnostic{.code = "G002", .message = "m", .file = "nowhere", .line = 2,
                             .column = 1});

    EXPECT_EQ(out_.str(), "error[G002]: m\n  --> nowhere:2:1\n");
}

TEST_F(DiagnosticTest, TabsKeptInCaretPadding) {
    emitter_.set_source_content("t.feature", "\tbad line\n");
    emitter_.emit(Diagnostic{.code = "G001", .message = "m", .file = "t.feature", .line = 1,
                             .column = 2, .length = 3, .label = "here"});

    EXPECT_NE(out_.str().find("   | \t^^^ here\n"), std::string::npos);
}

TEST_F(DiagnosticTest, WarningsCountedSeparately) {
    emitter_.emit(Diagnostic{.severity = DiagnosticSeverity::Warning, .message = "w"});

    EXPECT_EQ(out_.str(), "warning: w\n");
    EXPECT_EQ(emitter_.error_count(), 0u);
    EXPECT_EQ(emitter_.warning_count(), 1u);
}

TEST_F(DiagnosticTest, UnterminatedDocStringLabel) {
    auto parsed = gherkin::parse("Feature: F\n  Scenario: S\n    Given x\n      \"\"\"\n");
    ASSERT_TRUE(is_err(parsed));

    auto diag = make_diagnostic(unwrap_err(parsed), "f.feature");
    EXPECT_EQ(diag.code, "G006");
    EXPECT_EQ(diag.label, "opened here");
    EXPECT_EQ(diag.length, 3u);
    EXPECT_EQ(diag.column, 7u);
}
