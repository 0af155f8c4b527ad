//! # Common Definitions
//!
//! Types shared by every cuke module: the version string and the `Result`
//! alias used for fallible operations.
//!
//! ## Error Handling
//!
//! The parsing and matching engines never throw on malformed input. Every
//! failure is returned as the error alternative of a `Result<T, E>`.

#ifndef CUKE_COMMON_HPP
#define CUKE_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cuke {

// ============================================================================
// Version Information
// ============================================================================

/// The toolkit version string.
constexpr const char* VERSION = "0.4.0";

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto result = expression::compile("I have {int} items");
/// if (is_ok(result)) {
///     const auto& compiled = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace cuke

#endif // CUKE_COMMON_HPP
