//! # Parameter Types
//!
//! The closed set of types usable inside `{...}` in a step expression, each
//! bound to a sub-parser through a fixed table. A sub-parser reads a prefix
//! of the remaining step text and reports how many bytes it consumed.
//!
//! | Name     | Accepts                                   | Yields        |
//! |----------|-------------------------------------------|---------------|
//! | `string` | `"..."` with `\"` and `\\` escapes        | unescaped text|
//! | `int`    | `[-+]?[0-9]+` fitting in 64 bits          | `int64_t`     |
//! | `float`  | `[-+]?[0-9]+\.[0-9]+`                     | `double`      |
//! | `word`   | one or more non-whitespace characters     | text          |
//! | `atom`   | `[A-Za-z0-9_@]+`                          | `Atom`        |

#ifndef CUKE_EXPRESSION_PARAMETER_TYPE_HPP
#define CUKE_EXPRESSION_PARAMETER_TYPE_HPP

#include "cuke/expression/value.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace cuke::expression {

enum class ParameterKind : uint8_t { String, Int, Float, Word, Atom };

/// A value read from the front of the step text.
struct ParsedValue {
    Value value;
    size_t consumed; ///< Bytes of input used
};

/// Resolves a type name written in a pattern. Unknown names yield nullopt.
[[nodiscard]] auto find_parameter_kind(std::string_view name) -> std::optional<ParameterKind>;

[[nodiscard]] auto parameter_kind_name(ParameterKind kind) -> std::string_view;

/// Every recognized type name, in table order.
[[nodiscard]] auto parameter_type_names() -> std::vector<std::string_view>;

/// Runs the sub-parser for `kind` against the start of `text`.
[[nodiscard]] auto parse_parameter(ParameterKind kind, std::string_view text)
    -> std::optional<ParsedValue>;

} // namespace cuke::expression

#endif // CUKE_EXPRESSION_PARAMETER_TYPE_HPP
