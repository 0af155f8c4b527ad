//! # Step Matching Commands Interface
//!
//! | Function      | Command      | Output                            |
//! |---------------|--------------|-----------------------------------|
//! | `run_match()` | `cuke match` | Captured values of one match      |
//! | `run_check()` | `cuke check` | Steps no pattern matches          |

#pragma once

#include "cuke/expression/step_registry.hpp"
#include "cuke/gherkin/document.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cuke::cli {

/// A step of a concrete scenario that no registered pattern matches.
struct UndefinedStep {
    std::string keyword;
    std::string text;
    std::string scenario; ///< Name of the concrete scenario that reached it first
    uint32_t line;        ///< 0-based line of the step
    std::string suggestion;
};

/// Undefined steps in source order. A step reached from several scenarios
/// with the same text is reported once.
std::vector<UndefinedStep> find_undefined_steps(const std::vector<gherkin::Scenario>& scenarios,
                                                const expression::StepRegistry& registry);

int run_match(const std::string& pattern, const std::string& text, bool verbose);
int run_check(const std::string& feature_path, const std::string& steps_path, bool verbose);

} // namespace cuke::cli
