//! # Step Registry
//!
//! An ordered list of step patterns, each compiled once when it is added.
//! Lookup returns the first pattern, in registration order, that matches the
//! step text.
//!
//! ```cpp
//! StepRegistry registry;
//! auto added = registry.add("I have {int} cucumber(s)");
//! if (auto found = registry.find("I have 3 cucumbers")) {
//!     // found->pattern == "I have {int} cucumber(s)", found->args == {3}
//! }
//! ```
//!
//! A registry is a plain value owned by its caller.

#ifndef CUKE_EXPRESSION_STEP_REGISTRY_HPP
#define CUKE_EXPRESSION_STEP_REGISTRY_HPP

#include "cuke/expression/expression.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::expression {

struct StepDefinition {
    std::string pattern;
    CompiledExpression compiled;
};

struct StepMatch {
    size_t index;        ///< Position of the definition in the registry
    std::string pattern; ///< Pattern text of the definition
    std::vector<Value> args;
};

class StepRegistry {
public:
    /// Compiles and appends a pattern. Returns its index.
    [[nodiscard]] auto add(std::string_view pattern) -> Result<size_t, CompileError>;

    [[nodiscard]] auto find(std::string_view step_text) const -> std::optional<StepMatch>;

    [[nodiscard]] auto size() const -> size_t {
        return definitions_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return definitions_.empty();
    }

    [[nodiscard]] auto definitions() const -> const std::vector<StepDefinition>& {
        return definitions_;
    }

private:
    std::vector<StepDefinition> definitions_;
};

/// Proposes a pattern for unmatched step text: quoted strings become
/// `{string}`, decimals `{float}` and whole numbers `{int}`.
[[nodiscard]] auto suggest_pattern(std::string_view step_text) -> std::string;

} // namespace cuke::expression

#endif // CUKE_EXPRESSION_STEP_REGISTRY_HPP
