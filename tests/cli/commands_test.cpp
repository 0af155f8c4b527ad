//! # Command Helper Tests
//!
//! Argument splitting, steps-file splitting, undefined step detection and the
//! tree printers used by `cuke parse`, `cuke expand` and `cuke check`.

#include "cli/commands/cmd_match.hpp"
#include "cli/commands/cmd_parse.hpp"
#include "cli/utils.hpp"

#include "cuke/gherkin/gherkin.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace cuke;
using namespace cuke::cli;

// ============================================================================
// Command Arguments
// ============================================================================

class CommandArgsTest : public ::testing::Test {
protected:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;

    auto split(std::vector<std::string> args) -> CommandArgs {
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return split_command_args(static_cast<int>(argv_.size()), argv_.data());
    }
};

TEST_F(CommandArgsTest, FlagsAndPositionals) {
    auto args = split({"cuke", "match", "--verbose", "{int}", "-5", "-", "-vv"});

    EXPECT_EQ(args.positional, (std::vector<std::string>{"{int}", "-5", "-"}));
    EXPECT_EQ(args.flags, (std::vector<std::string>{"--verbose", "-vv"}));
    EXPECT_EQ(args.option_argc, 7);
}

TEST_F(CommandArgsTest, SeparatorEndsFlags) {
    auto args = split({"cuke", "match", "-v", "--", "-x marks {word}", "--verbose", "--"});

    EXPECT_EQ(args.positional, (std::vector<std::string>{"-x marks {word}", "--verbose", "--"}));
    EXPECT_EQ(args.flags, (std::vector<std::string>{"-v"}));
    EXPECT_EQ(args.option_argc, 3);
}

TEST_F(CommandArgsTest, CommandOnly) {
    auto args = split({"cuke", "parse"});

    EXPECT_TRUE(args.positional.empty());
    EXPECT_TRUE(args.flags.empty());
    EXPECT_EQ(args.option_argc, 2);
}

// ============================================================================
// Steps Files
// ============================================================================

TEST(StepPatternsTest, SkipsBlankAndCommentLines) {
    auto patterns = split_step_patterns("  # c\nI have {int} items\n\n   indented {word}\r\n");

    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].text, "I have {int} items");
    EXPECT_EQ(patterns[0].line, 2u);
    EXPECT_EQ(patterns[0].indent, 0u);
    EXPECT_EQ(patterns[1].text, "indented {word}");
    EXPECT_EQ(patterns[1].line, 4u);
    EXPECT_EQ(patterns[1].indent, 3u);
}

TEST(StepPatternsTest, EmptyContent) {
    EXPECT_TRUE(split_step_patterns("").empty());
    EXPECT_TRUE(split_step_patterns("\n\n# only comments\n").empty());
}

// ============================================================================
// Undefined Steps
// ============================================================================

class UndefinedStepsTest : public ::testing::Test {
protected:
    std::ostringstream diagnostics_;
    DiagnosticEmitter emitter_{diagnostics_};
    std::vector<gherkin::Scenario> scenarios_;

    void SetUp() override {
        emitter_.set_color_enabled(false);

        auto parsed = gherkin::parse("Feature: Check\n"
                                     "  Background:\n"
                                     "    Given a clean store\n"
                                     "  Scenario Outline: Show\n"
                                     "    Then I see \"<n>\"\n"
                                     "    Examples:\n"
                                     "      | n |\n"
                                     "      | 1 |\n"
                                     "      | 2 |\n"
                                     "  Scenario: Count\n"
                                     "    When I have 3 items\n");
        ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed).to_string();

        auto scenarios = concrete_scenarios(unwrap(parsed), "check.feature", emitter_);
        ASSERT_TRUE(scenarios.has_value());
        scenarios_ = std::move(*scenarios);
    }
};

TEST_F(UndefinedStepsTest, BackgroundPrefixedToEveryScenario) {
    ASSERT_EQ(scenarios_.size(), 3u);
    for (const auto& scenario : scenarios_) {
        ASSERT_EQ(scenario.steps.size(), 2u);
        EXPECT_EQ(scenario.steps[0].text, "a clean store");
    }
    EXPECT_EQ(scenarios_[1].steps[1].text, "I see \"2\"");
}

TEST_F(UndefinedStepsTest, ReportsEachExpandedStep) {
    expression::StepRegistry registry;
    ASSERT_TRUE(is_ok(registry.add("a clean store")));

    auto undefined = find_undefined_steps(scenarios_, registry);

    ASSERT_EQ(undefined.size(), 3u);
    EXPECT_EQ(undefined[0].text, "I see \"1\"");
    EXPECT_EQ(undefined[0].keyword, "Then");
    EXPECT_EQ(undefined[0].scenario, "Show (row 1)");
    EXPECT_EQ(undefined[0].line, 4u);
    EXPECT_EQ(undefined[0].suggestion, "I see {string}");
    EXPECT_EQ(undefined[1].text, "I see \"2\"");
    EXPECT_EQ(undefined[2].text, "I have 3 items");
    EXPECT_EQ(undefined[2].suggestion, "I have {int} items");
}

TEST_F(UndefinedStepsTest, SharedStepReportedOnce) {
    expression::StepRegistry registry;

    auto undefined = find_undefined_steps(scenarios_, registry);

    ASSERT_EQ(undefined.size(), 4u);
    EXPECT_EQ(undefined[0].text, "a clean store");
    EXPECT_EQ(undefined[0].line, 2u);
    EXPECT_EQ(undefined[0].scenario, "Show (row 1)");
}

TEST_F(UndefinedStepsTest, NothingUndefined) {
    expression::StepRegistry registry;
    ASSERT_TRUE(is_ok(registry.add("a clean store")));
    ASSERT_TRUE(is_ok(registry.add("I see {string}")));
    ASSERT_TRUE(is_ok(registry.add("I have {int} item(s)")));

    EXPECT_TRUE(find_undefined_steps(scenarios_, registry).empty());
    EXPECT_EQ(emitter_.error_count(), 0u);
}

// ============================================================================
// Printers
// ============================================================================

TEST(PrintScenarioTest, TableAlignedInVerboseMode) {
    gherkin::Scenario scenario{
        .name = "S",
        .steps = {gherkin::Step{.keyword = "Given",
                                .text = "x",
                                .docstring = std::nullopt,
                                .datatable = gherkin::DataTable{{"a", "bb"}, {"ccc", "d"}},
                                .line = 4}},
        .tags = {"t"},
        .line = 3};

    std::ostringstream verbose;
    print_scenario(verbose, scenario, true);
    EXPECT_EQ(verbose.str(), "Scenario: S @t  (line 4)\n"
                             "  Given x\n"
                             "    | a   | bb |\n"
                             "    | ccc | d  |\n");

    std::ostringstream terse;
    print_scenario(terse, scenario, false);
    EXPECT_EQ(terse.str(), "Scenario: S @t  (line 4)\n  Given x\n");
}

TEST(PrintScenarioTest, DocStringInVerboseMode) {
    gherkin::Scenario scenario{
        .name = "D",
        .steps = {gherkin::Step{.keyword = "Then",
                                .text = "the body is",
                                .docstring = std::string("a\nb"),
                                .datatable = std::nullopt,
                                .line = 1}},
        .tags = {},
        .line = 0};

    std::ostringstream out;
    print_scenario(out, scenario, true);
    EXPECT_EQ(out.str(), "Scenario: D  (line 1)\n"
                         "  Then the body is\n"
                         "    \"\"\"\n"
                         "    a\n"
                         "    b\n"
                         "    \"\"\"\n");
}

TEST(PrintFeatureTest, OutlineWithExamples) {
    auto parsed = gherkin::parse("@shop\n"
                                 "Feature: Shop\n"
                                 "  Scenario Outline: Buy\n"
                                 "    Given I buy <n>\n"
                                 "    @smoke\n"
                                 "    Examples: First\n"
                                 "      | n  |\n"
                                 "      | 10 |\n");
    ASSERT_TRUE(is_ok(parsed));

    std::ostringstream out;
    print_feature(out, unwrap(parsed), false);
    std::string text = out.str();

    EXPECT_NE(text.find("Feature: Shop @shop  (line 2)\n"), std::string::npos);
    EXPECT_NE(text.find("  Scenario Outline: Buy  (line 3)\n"), std::string::npos);
    EXPECT_NE(text.find("    Given I buy <n>\n"), std::string::npos);
    EXPECT_NE(text.find("    Examples: First @smoke  (line 6, 1 row(s))\n"), std::string::npos);
    EXPECT_NE(text.find("      | n  |\n      | 10 |\n"), std::string::npos);
}
