//! # Step Expressions
//!
//! A small pattern language for step text:
//!
//! | Construct          | Syntax                     | Captured |
//! |--------------------|----------------------------|----------|
//! | Literal            | `I have`                   | no       |
//! | Required parameter | `{int}`                    | yes      |
//! | Optional parameter | `{int?}`                   | yes (null when absent) |
//! | Optional text      | `cucumber(s)`              | no       |
//! | Alternation        | `click/tap`                | no       |
//! | Escapes            | `\{ \} \( \) \/ \\`        | no       |
//!
//! ```cpp
//! auto compiled = expression::compile("I have {int} cucumber(s)");
//! auto args = expression::match("I have 5 cucumbers", unwrap(compiled));
//! // args == std::vector<Value>{int64_t{5}}
//! ```
//!
//! `compile` and `match` are pure: a CompiledExpression can be shared by
//! any number of threads matching concurrently.

#ifndef CUKE_EXPRESSION_EXPRESSION_HPP
#define CUKE_EXPRESSION_EXPRESSION_HPP

#include "cuke/common.hpp"
#include "cuke/expression/parameter_type.hpp"
#include "cuke/expression/value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cuke::expression {

// ============================================================================
// Nodes
// ============================================================================

/// Text that must appear verbatim.
struct LiteralNode {
    std::string text;

    [[nodiscard]] auto operator==(const LiteralNode& other) const -> bool = default;
};

/// `{type}` or `{type?}`.
struct ParameterNode {
    std::string type_name;
    ParameterKind kind;
    bool optional;

    [[nodiscard]] auto operator==(const ParameterNode& other) const -> bool = default;
};

/// `(text)`: consumed when present, skipped otherwise.
struct OptionalTextNode {
    std::string text;

    [[nodiscard]] auto operator==(const OptionalTextNode& other) const -> bool = default;
};

/// `a/b/c`: the first option that prefixes the text is consumed.
struct AlternationNode {
    std::vector<std::string> options;

    [[nodiscard]] auto operator==(const AlternationNode& other) const -> bool = default;
};

using Node = std::variant<LiteralNode, ParameterNode, OptionalTextNode, AlternationNode>;

/// Pattern-like rendering of one node, e.g. `{int?}` or `(s)`.
[[nodiscard]] auto node_to_string(const Node& node) -> std::string;

// ============================================================================
// Compiled Expression
// ============================================================================

/// An immutable node sequence produced by `compile`. No two literal nodes
/// are adjacent.
class CompiledExpression {
public:
    CompiledExpression(std::string source, std::vector<Node> nodes)
        : source_(std::move(source)), nodes_(std::move(nodes)) {}

    [[nodiscard]] auto source() const -> const std::string& {
        return source_;
    }

    [[nodiscard]] auto nodes() const -> const std::vector<Node>& {
        return nodes_;
    }

    /// Number of values a successful match returns.
    [[nodiscard]] auto parameter_count() const -> size_t;

private:
    std::string source_;
    std::vector<Node> nodes_;
};

// ============================================================================
// Errors
// ============================================================================

enum class CompileErrorKind : uint8_t {
    UnknownParameterType,
    MalformedSyntax,
};

struct CompileError {
    CompileErrorKind kind;
    std::string message;
    std::string pattern;
    size_t offset;        ///< Byte offset of the offending construct
    std::string fragment; ///< The unknown type name, or the text that could not be read

    /// "<message>" followed by the pattern and a caret under `offset`.
    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Entry Points
// ============================================================================

[[nodiscard]] auto compile(std::string_view pattern) -> Result<CompiledExpression, CompileError>;

/// Values of the captured nodes in pattern order, or nullopt when the text
/// does not match. Never throws and never partially matches.
[[nodiscard]] auto match(std::string_view text, const CompiledExpression& compiled)
    -> std::optional<std::vector<Value>>;

} // namespace cuke::expression

#endif // CUKE_EXPRESSION_EXPRESSION_HPP
