//! # Scenario Outline Expansion
//!
//! Turns each Examples row of an outline into a concrete Scenario:
//!
//! - name: `Outline (row N)`, or `Outline (Block name: row N)` for a named
//!   Examples block; N counts from 1 within each block
//! - steps: `<column>` placeholders replaced in step text, doc strings and
//!   data table cells
//! - tags: outline tags followed by the block's tags, without duplicates
//! - line: the outline's line
//!
//! Blocks are expanded in order, rows in order within a block.

#ifndef CUKE_GHERKIN_EXPAND_HPP
#define CUKE_GHERKIN_EXPAND_HPP

#include "cuke/common.hpp"
#include "cuke/gherkin/document.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::gherkin {

struct ExpandError {
    std::string message;
    std::string outline_name;
    uint32_t line; ///< 0-based line of the outline
};

/// Column name to cell value for one Examples row.
using Substitutions = std::map<std::string, std::string, std::less<>>;

/// Replaces every `<name>` whose name is a key of `values`. Unknown
/// placeholders are left as written. Substituted values are not rescanned.
[[nodiscard]] auto substitute_placeholders(std::string_view text, const Substitutions& values)
    -> std::string;

[[nodiscard]] auto expand_outline(const ScenarioOutline& outline)
    -> Result<std::vector<Scenario>, ExpandError>;

/// Scenarios pass through unchanged, outlines are replaced by their rows.
[[nodiscard]] auto expand_all_scenarios(const std::vector<ScenarioDefinition>& definitions)
    -> Result<std::vector<Scenario>, ExpandError>;

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_EXPAND_HPP
