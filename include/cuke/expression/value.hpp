//! # Captured Values
//!
//! What a successful match hands back for each captured parameter.
//!
//! | Parameter type | Alternative       |
//! |----------------|-------------------|
//! | `{int}`        | `int64_t`         |
//! | `{float}`      | `double`          |
//! | `{string}`     | `std::string`     |
//! | `{word}`       | `std::string`     |
//! | `{atom}`       | `Atom`            |
//! | absent `{x?}`  | `std::monostate`  |

#ifndef CUKE_EXPRESSION_VALUE_HPP
#define CUKE_EXPRESSION_VALUE_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cuke::expression {

/// A symbolic name captured by `{atom}`, kept distinct from plain text.
struct Atom {
    std::string name;

    [[nodiscard]] auto operator==(const Atom& other) const -> bool = default;
};

using Value = std::variant<std::monostate, int64_t, double, std::string, Atom>;

[[nodiscard]] inline auto is_null(const Value& value) -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// "null", "int", "float", "string" or "atom".
[[nodiscard]] auto value_type_name(const Value& value) -> std::string_view;

/// Display form: `null`, `42`, `19.99`, `"text"` (escaped) or `:name`.
[[nodiscard]] auto value_to_string(const Value& value) -> std::string;

} // namespace cuke::expression

#endif // CUKE_EXPRESSION_VALUE_HPP
