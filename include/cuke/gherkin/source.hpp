//! # Feature Source Text
//!
//! Owns the text of one feature file and indexes its line starts so that
//! lines can be looked up by their 1-based number.
//!
//! ```cpp
//! auto loaded = Source::from_file("features/cart.feature");
//! if (is_err(loaded)) {
//!     std::cerr << unwrap_err(loaded) << "\n";
//! }
//! Source inline_source = Source::from_string("Feature: Cart\n", "<test>");
//! ```

#ifndef CUKE_GHERKIN_SOURCE_HPP
#define CUKE_GHERKIN_SOURCE_HPP

#include "cuke/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cuke::gherkin {

/// The UTF-8 text of a feature file with a line index.
///
/// Views returned by `content()`, `line()` and `snippet()` stay valid as long
/// as the Source is alive. A leading UTF-8 byte order mark is dropped.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns line `line_num` (1-based) without its `\n` or `\r\n` terminator.
    /// Out-of-range lines yield an empty view.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Byte offset at which line `line_num` (1-based) starts.
    [[nodiscard]] auto line_offset(uint32_t line_num) const -> size_t;

    /// Number of physical lines. A trailing newline does not open a new line.
    [[nodiscard]] auto line_count() const -> uint32_t;

    /// At most `max_bytes` of text starting at `offset`, shortened so that a
    /// multi-byte UTF-8 sequence is never cut in half.
    [[nodiscard]] auto snippet(size_t offset, size_t max_bytes) const -> std::string_view;

    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_SOURCE_HPP
