//! # Feature Inspection Commands Interface
//!
//! | Function       | Command       | Output                           |
//! |----------------|---------------|----------------------------------|
//! | `run_lex()`    | `cuke lex`    | Line tokens                      |
//! | `run_parse()`  | `cuke parse`  | Document tree                    |
//! | `run_expand()` | `cuke expand` | Concrete scenarios               |

#pragma once

#include "cli/diagnostic.hpp"
#include "cuke/gherkin/document.hpp"
#include "cuke/gherkin/source.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cuke::cli {

/// A parsed feature together with the text it came from.
struct LoadedFeature {
    gherkin::Source source;
    gherkin::Feature feature;
};

/// Reads and parses `path`, emitting a diagnostic on failure.
std::optional<LoadedFeature> load_feature(const std::string& path, DiagnosticEmitter& emitter);

/// Scenarios with the Background steps prefixed and outlines expanded.
/// Emits a diagnostic and returns nullopt when an outline cannot be expanded.
std::optional<std::vector<gherkin::Scenario>> concrete_scenarios(const gherkin::Feature& feature,
                                                                 const std::string& path,
                                                                 DiagnosticEmitter& emitter);

void print_feature(std::ostream& out, const gherkin::Feature& feature, bool verbose);
void print_scenario(std::ostream& out, const gherkin::Scenario& scenario, bool verbose);

int run_lex(const std::string& path);
int run_parse(const std::string& path, bool verbose);
int run_expand(const std::string& path, bool verbose);

} // namespace cuke::cli
