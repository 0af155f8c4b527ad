//! # Gherkin Document Model
//!
//! Plain value types produced by the parser. Every node owns its children;
//! there are no back-references, so a Feature can be moved, copied and
//! compared like any other value.
//!
//! Line numbers stored here are 0-based indexes of the keyword line. Error
//! positions (see `ParseError`) are 1-based.

#ifndef CUKE_GHERKIN_DOCUMENT_HPP
#define CUKE_GHERKIN_DOCUMENT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cuke::gherkin {

/// Rows of trimmed cells, in source order.
using DataTable = std::vector<std::vector<std::string>>;

/// One keyword-prefixed line, optionally carrying a doc string or a table.
struct Step {
    std::string keyword; ///< `Given`, `When`, `Then`, `And`, `But` or `*`
    std::string text;
    std::optional<std::string> docstring;
    std::optional<DataTable> datatable;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const Step& other) const -> bool = default;
};

struct Background {
    std::vector<Step> steps;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const Background& other) const -> bool = default;
};

struct Scenario {
    std::string name;
    std::vector<Step> steps;
    std::vector<std::string> tags;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const Scenario& other) const -> bool = default;
};

/// A table of placeholder values for a Scenario Outline.
///
/// Every body row has as many cells as the header. An unnamed block has an
/// empty `name`.
struct Examples {
    std::string name;
    std::vector<std::string> tags;
    std::vector<std::string> table_header;
    std::vector<std::vector<std::string>> table_body;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const Examples& other) const -> bool = default;
};

/// A templated scenario whose steps contain `<placeholder>` tokens.
/// A successfully parsed outline always has at least one Examples block.
struct ScenarioOutline {
    std::string name;
    std::vector<Step> steps;
    std::vector<std::string> tags;
    std::vector<Examples> examples;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const ScenarioOutline& other) const -> bool = default;
};

using ScenarioDefinition = std::variant<Scenario, ScenarioOutline>;

struct Feature {
    std::string name;
    std::string description; ///< Reserved, always empty
    std::optional<Background> background;
    std::vector<ScenarioDefinition> scenarios;
    std::vector<std::string> tags;
    uint32_t line = 0;

    [[nodiscard]] auto operator==(const Feature& other) const -> bool = default;
};

// ============================================================================
// Accessors over ScenarioDefinition
// ============================================================================

[[nodiscard]] inline auto definition_name(const ScenarioDefinition& def) -> const std::string& {
    return std::visit([](const auto& d) -> const std::string& { return d.name; }, def);
}

[[nodiscard]] inline auto is_outline(const ScenarioDefinition& def) -> bool {
    return std::holds_alternative<ScenarioOutline>(def);
}

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_DOCUMENT_HPP
