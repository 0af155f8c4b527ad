//! # Gherkin Entry Points
//!
//! ```cpp
//! auto result = cuke::gherkin::parse(text);
//! if (is_err(result)) {
//!     const auto& error = unwrap_err(result);
//!     std::cerr << error.to_string();
//! }
//! ```
//!
//! `parse` is a pure function: no I/O, no logging, no shared state. It is
//! safe to call from several threads at once.

#ifndef CUKE_GHERKIN_GHERKIN_HPP
#define CUKE_GHERKIN_GHERKIN_HPP

#include "cuke/gherkin/document.hpp"
#include "cuke/gherkin/parser.hpp"
#include "cuke/gherkin/source.hpp"

#include <string_view>

namespace cuke::gherkin {

/// Parses feature text into a Feature tree.
[[nodiscard]] auto parse(std::string_view text) -> Result<Feature, ParseError>;

/// Parses an already loaded Source; positions in errors refer to it.
[[nodiscard]] auto parse(const Source& source) -> Result<Feature, ParseError>;

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_GHERKIN_HPP
