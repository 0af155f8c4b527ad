//! # Step Matching Commands
//!
//! `cuke match` compiles one Cucumber Expression and matches one step text:
//!
//! ```bash
//! $ cuke match "I have {int} cucumber(s)" "I have 42 cucumbers"
//! match: 1 value(s)
//!   $1  int     42
//! ```
//!
//! `cuke check` loads a steps file (one pattern per line) and reports every
//! step of the expanded feature that no pattern matches, with a suggested
//! pattern for it. The exit code is 1 when anything is undefined.

#include "cmd_match.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "cmd_parse.hpp"
#include "cuke/expression/expression.hpp"
#include "cuke/gherkin/lexer.hpp"
#include "cuke/log/log.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <set>
#include <utility>

namespace cuke::cli {

namespace {

void print_values(std::ostream& out, const std::vector<expression::Value>& values) {
    for (size_t i = 0; i < values.size(); ++i) {
        out << "  $" << i + 1 << "  " << std::left << std::setw(7)
            << expression::value_type_name(values[i]) << std::right << " "
            << expression::value_to_string(values[i]) << "\n";
    }
}

} // namespace

// ============================================================================
// cuke match
// ============================================================================

int run_match(const std::string& pattern, const std::string& text, bool verbose) {
    auto compiled = expression::compile(pattern);
    if (is_err(compiled)) {
        auto& emitter = get_diagnostic_emitter();
        emitter.set_source_content("<pattern>", pattern);
        emitter.emit(make_diagnostic(unwrap_err(compiled), "<pattern>", 1));
        return 1;
    }

    const auto& expr = unwrap(compiled);
    if (verbose) {
        std::cout << "nodes:\n";
        for (const auto& node : expr.nodes()) {
            std::cout << "  " << expression::node_to_string(node) << "\n";
        }
    }

    auto values = expression::match(text, expr);
    if (!values) {
        std::cout << "no match\n";
        return 1;
    }

    std::cout << "match: " << values->size() << " value(s)\n";
    print_values(std::cout, *values);
    return 0;
}

// ============================================================================
// cuke check
// ============================================================================

std::vector<UndefinedStep> find_undefined_steps(const std::vector<gherkin::Scenario>& scenarios,
                                                const expression::StepRegistry& registry) {
    std::vector<UndefinedStep> undefined;
    std::set<std::pair<uint32_t, std::string>> seen;

    for (const auto& scenario : scenarios) {
        for (const auto& step : scenario.steps) {
            if (registry.find(step.text)) {
                continue;
            }
            if (!seen.emplace(step.line, step.text).second) {
                continue;
            }
            undefined.push_back(UndefinedStep{.keyword = step.keyword,
                                              .text = step.text,
                                              .scenario = scenario.name,
                                              .line = step.line,
                                              .suggestion =
                                                  expression::suggest_pattern(step.text)});
        }
    }

    std::stable_sort(undefined.begin(), undefined.end(),
                     [](const UndefinedStep& a, const UndefinedStep& b) { return a.line < b.line; });
    return undefined;
}

int run_check(const std::string& feature_path, const std::string& steps_path, bool verbose) {
    auto& emitter = get_diagnostic_emitter();

    // Step patterns
    auto steps_source = gherkin::Source::from_file(steps_path);
    if (is_err(steps_source)) {
        emitter.emit(Diagnostic{.code = ErrorCodes::UNREADABLE_FILE,
                                .message = unwrap_err(steps_source)});
        return 1;
    }
    std::string steps_text(unwrap(steps_source).content());
    emitter.set_source_content(steps_path, steps_text);

    size_t errors_before = emitter.error_count();
    expression::StepRegistry registry;
    for (const auto& pattern : split_step_patterns(steps_text)) {
        auto added = registry.add(pattern.text);
        if (is_err(added)) {
            emitter.emit(
                make_diagnostic(unwrap_err(added), steps_path, pattern.line, pattern.indent));
        }
    }
    if (emitter.error_count() > errors_before) {
        return 1;
    }
    CUKE_LOG_INFO("cli", "Loaded " << registry.size() << " step pattern(s) from " << steps_path);

    // Feature
    auto loaded = load_feature(feature_path, emitter);
    if (!loaded) {
        return 1;
    }
    auto scenarios = concrete_scenarios(loaded->feature, feature_path, emitter);
    if (!scenarios) {
        return 1;
    }

    size_t step_count = 0;
    for (const auto& scenario : *scenarios) {
        step_count += scenario.steps.size();
        if (!verbose) {
            continue;
        }
        for (const auto& step : scenario.steps) {
            auto found = registry.find(step.text);
            if (!found) {
                continue;
            }
            std::cout << feature_path << ":" << step.line + 1 << ": " << step.keyword << " "
                      << step.text << "  ->  " << found->pattern << "\n";
            print_values(std::cout, found->args);
        }
    }

    auto undefined = find_undefined_steps(*scenarios, registry);
    for (const auto& step : undefined) {
        std::string_view line_text = loaded->source.line(step.line + 1);
        uint32_t indent = static_cast<uint32_t>(gherkin::leading_whitespace(line_text));

        emitter.emit(Diagnostic{
            .severity = DiagnosticSeverity::Error,
            .code = ErrorCodes::UNDEFINED_STEP,
            .message = "No matching step definition found for step `" + step.keyword + " " +
                       step.text + "`",
            .file = feature_path,
            .line = step.line + 1,
            .column = indent + 1,
            .length = static_cast<uint32_t>(gherkin::trim(line_text).size()),
            .label = {},
            .notes = {"in scenario \"" + step.scenario + "\""},
            .help = {"add a step definition such as `" + step.suggestion + "`"}});
    }

    std::cout << scenarios->size() << " scenario(s), " << step_count << " step(s), "
              << undefined.size() << " undefined\n";
    return undefined.empty() ? 0 : 1;
}

} // namespace cuke::cli
