//! # Feature Inspection Commands
//!
//! Implements `cuke lex`, `cuke parse` and `cuke expand`.
//!
//! ```bash
//! cuke lex cart.feature       # One classified token per line
//! cuke parse cart.feature     # Feature, sections and steps
//! cuke expand cart.feature    # Scenarios as they would run
//! ```

#include "cmd_parse.hpp"

#include "cuke/gherkin/expand.hpp"
#include "cuke/gherkin/gherkin.hpp"
#include "cuke/gherkin/lexer.hpp"
#include "cuke/log/log.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <type_traits>
#include <variant>

namespace cuke::cli {

// ============================================================================
// Loading
// ============================================================================

std::optional<LoadedFeature> load_feature(const std::string& path, DiagnosticEmitter& emitter) {
    auto loaded = gherkin::Source::from_file(path);
    if (is_err(loaded)) {
        emitter.emit(
            Diagnostic{.code = ErrorCodes::UNREADABLE_FILE, .message = unwrap_err(loaded)});
        return std::nullopt;
    }
    auto& source = unwrap(loaded);
    emitter.set_source_content(path, std::string(source.content()));

    auto parsed = gherkin::parse(source);
    if (is_err(parsed)) {
        emitter.emit(make_diagnostic(unwrap_err(parsed), path));
        return std::nullopt;
    }

    auto& feature = unwrap(parsed);
    CUKE_LOG_INFO("cli", "Parsed " << path << ": " << feature.scenarios.size()
                                   << " scenario definition(s)");
    return LoadedFeature{.source = std::move(source), .feature = std::move(feature)};
}

std::optional<std::vector<gherkin::Scenario>> concrete_scenarios(const gherkin::Feature& feature,
                                                                 const std::string& path,
                                                                 DiagnosticEmitter& emitter) {
    auto expanded = gherkin::expand_all_scenarios(feature.scenarios);
    if (is_err(expanded)) {
        const auto& error = unwrap_err(expanded);
        emitter.emit(Diagnostic{.code = ErrorCodes::OUTLINE_WITHOUT_EXAMPLES,
                                .message = error.message,
                                .file = path,
                                .line = error.line + 1,
                                .column = 1});
        return std::nullopt;
    }

    auto scenarios = std::move(unwrap(expanded));
    if (feature.background) {
        const auto& background = feature.background->steps;
        for (auto& scenario : scenarios) {
            scenario.steps.insert(scenario.steps.begin(), background.begin(), background.end());
        }
    }
    return scenarios;
}

// ============================================================================
// Printing
// ============================================================================

namespace {

void print_tags(std::ostream& out, const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        out << " @" << tag;
    }
}

void print_table(std::ostream& out, const std::vector<std::vector<std::string>>& rows,
                 const std::string& indent) {
    std::vector<size_t> widths;
    for (const auto& row : rows) {
        if (widths.size() < row.size()) {
            widths.resize(row.size(), 0);
        }
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    for (const auto& row : rows) {
        out << indent << "|";
        for (size_t i = 0; i < row.size(); ++i) {
            out << " " << std::left << std::setw(static_cast<int>(widths[i])) << row[i] << " |";
        }
        out << "\n";
    }
    out << std::right;
}

void print_steps(std::ostream& out, const std::vector<gherkin::Step>& steps,
                 const std::string& indent, bool verbose) {
    for (const auto& step : steps) {
        out << indent << step.keyword << " " << step.text << "\n";
        if (!verbose) {
            continue;
        }
        if (step.docstring) {
            out << indent << "  \"\"\"\n";
            size_t start = 0;
            const std::string& doc = *step.docstring;
            while (start <= doc.size()) {
                size_t end = doc.find('\n', start);
                if (end == std::string::npos) {
                    end = doc.size();
                }
                out << indent << "  " << doc.substr(start, end - start) << "\n";
                start = end + 1;
            }
            out << indent << "  \"\"\"\n";
        }
        if (step.datatable) {
            print_table(out, *step.datatable, indent + "  ");
        }
    }
}

} // namespace

void print_feature(std::ostream& out, const gherkin::Feature& feature, bool verbose) {
    out << "Feature: " << feature.name;
    print_tags(out, feature.tags);
    out << "  (line " << feature.line + 1 << ")\n";

    if (feature.background) {
        out << "  Background:  (line " << feature.background->line + 1 << ")\n";
        print_steps(out, feature.background->steps, "    ", verbose);
    }

    for (const auto& definition : feature.scenarios) {
        std::visit(
            [&](const auto& def) {
                using T = std::decay_t<decltype(def)>;
                if constexpr (std::is_same_v<T, gherkin::Scenario>) {
                    out << "  Scenario: " << def.name;
                    print_tags(out, def.tags);
                    out << "  (line " << def.line + 1 << ")\n";
                    print_steps(out, def.steps, "    ", verbose);
                } else if constexpr (std::is_same_v<T, gherkin::ScenarioOutline>) {
                    out << "  Scenario Outline: " << def.name;
                    print_tags(out, def.tags);
                    out << "  (line " << def.line + 1 << ")\n";
                    print_steps(out, def.steps, "    ", verbose);
                    for (const auto& examples : def.examples) {
                        out << "    Examples:";
                        if (!examples.name.empty()) {
                            out << " " << examples.name;
                        }
                        print_tags(out, examples.tags);
                        out << "  (line " << examples.line + 1 << ", "
                            << examples.table_body.size() << " row(s))\n";

                        std::vector<std::vector<std::string>> rows;
                        rows.push_back(examples.table_header);
                        rows.insert(rows.end(), examples.table_body.begin(),
                                    examples.table_body.end());
                        print_table(out, rows, "      ");
                    }
                }
            },
            definition);
    }
}

void print_scenario(std::ostream& out, const gherkin::Scenario& scenario, bool verbose) {
    out << "Scenario: " << scenario.name;
    print_tags(out, scenario.tags);
    out << "  (line " << scenario.line + 1 << ")\n";
    print_steps(out, scenario.steps, "  ", verbose);
}

// ============================================================================
// Commands
// ============================================================================

int run_lex(const std::string& path) {
    auto& emitter = get_diagnostic_emitter();
    auto loaded = gherkin::Source::from_file(path);
    if (is_err(loaded)) {
        emitter.emit(
            Diagnostic{.code = ErrorCodes::UNREADABLE_FILE, .message = unwrap_err(loaded)});
        return 1;
    }

    const auto& source = unwrap(loaded);
    gherkin::Lexer lexer(source);
    auto tokens = lexer.tokenize();

    int failures = 0;
    for (const auto& token : tokens) {
        std::cout << std::setw(4) << token.line << "  " << std::left << std::setw(20)
                  << gherkin::token_kind_to_string(token.kind) << std::right;
        if (!token.keyword.empty()) {
            std::cout << " [" << token.keyword << "]";
        }
        if (token.is(gherkin::TokenKind::Error)) {
            std::cout << " expected " << token.text << " at column " << token.error_column;
            ++failures;
        } else if (!token.items.empty()) {
            for (const auto& item : token.items) {
                std::cout << " `" << item << "`";
            }
        } else if (!token.text.empty()) {
            std::cout << " " << token.text;
        }
        std::cout << "\n";
    }

    CUKE_LOG_INFO("cli", "Lexed " << tokens.size() << " line token(s) from " << path);
    return failures == 0 ? 0 : 1;
}

int run_parse(const std::string& path, bool verbose) {
    auto& emitter = get_diagnostic_emitter();
    auto loaded = load_feature(path, emitter);
    if (!loaded) {
        return 1;
    }

    print_feature(std::cout, loaded->feature, verbose);
    return 0;
}

int run_expand(const std::string& path, bool verbose) {
    auto& emitter = get_diagnostic_emitter();
    auto loaded = load_feature(path, emitter);
    if (!loaded) {
        return 1;
    }

    auto scenarios = concrete_scenarios(loaded->feature, path, emitter);
    if (!scenarios) {
        return 1;
    }

    for (size_t i = 0; i < scenarios->size(); ++i) {
        if (i > 0) {
            std::cout << "\n";
        }
        print_scenario(std::cout, (*scenarios)[i], verbose);
    }
    CUKE_LOG_INFO("cli", "Expanded " << loaded->feature.scenarios.size()
                                     << " definition(s) into " << scenarios->size()
                                     << " scenario(s)");
    return 0;
}

} // namespace cuke::cli
