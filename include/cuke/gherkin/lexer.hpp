//! # Gherkin Lexer
//!
//! The two bottom layers of the Gherkin grammar:
//!
//! - **Primitives**: horizontal whitespace, trimming, line splitting
//!   (`\n` and `\r\n`).
//! - **Keywords and elements**: section keywords (`Feature:`,
//!   `Scenario Outline:`, ...), the six step keywords, tag lines, table rows
//!   and doc string separators.
//!
//! The lexer tracks whether it is inside a doc string, so content lines that
//! happen to look like steps or tags are passed through untouched. A `"""`
//! line opens a doc string only after a step or its data table; anywhere
//! else it is plain text.
//!
//! ```cpp
//! Source source = Source::from_string("Feature: Cart\n  Scenario: Empty\n");
//! Lexer lexer(source);
//! for (Token tok = lexer.next_token(); !tok.is_eof(); tok = lexer.next_token()) {
//!     std::cout << token_kind_to_string(tok.kind) << "\n";
//! }
//! ```

#ifndef CUKE_GHERKIN_LEXER_HPP
#define CUKE_GHERKIN_LEXER_HPP

#include "cuke/gherkin/source.hpp"
#include "cuke/gherkin/token.hpp"

#include <string_view>
#include <vector>

namespace cuke::gherkin {

// ============================================================================
// Primitives
// ============================================================================

/// Space or tab.
[[nodiscard]] constexpr auto is_horizontal_space(char c) -> bool {
    return c == ' ' || c == '\t';
}

/// Strips horizontal whitespace (and stray `\r`) from both ends.
[[nodiscard]] auto trim(std::string_view s) -> std::string_view;

[[nodiscard]] auto trim_start(std::string_view s) -> std::string_view;

/// Strips any trailing whitespace including newlines.
[[nodiscard]] auto trim_end(std::string_view s) -> std::string_view;

/// Number of leading spaces and tabs.
[[nodiscard]] auto leading_whitespace(std::string_view s) -> size_t;

// ============================================================================
// Keywords
// ============================================================================

/// True for `Given`, `When`, `Then`, `And`, `But` and `*`.
[[nodiscard]] auto is_step_keyword(std::string_view word) -> bool;

/// The step keywords in their canonical order.
[[nodiscard]] auto step_keywords() -> const std::vector<std::string_view>&;

// ============================================================================
// Lexer
// ============================================================================

/// Turns a Source into a stream of line tokens.
class Lexer {
public:
    /// The source must outlive the lexer and every token it returns.
    explicit Lexer(const Source& source);

    /// Classifies the next line. Returns `TokenKind::Eof` once every line
    /// has been consumed, and keeps returning it afterwards.
    [[nodiscard]] auto next_token() -> Token;

    /// All tokens including the final `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    /// True while an opening `"""` has not been closed.
    [[nodiscard]] auto in_doc_string() const -> bool {
        return in_doc_string_;
    }

private:
    const Source& source_;
    uint32_t next_line_ = 1;
    bool in_doc_string_ = false;
    bool step_context_ = false;

    [[nodiscard]] auto classify(Token token, std::string_view trimmed) -> Token;
    [[nodiscard]] auto classify_line(Token token, std::string_view trimmed) -> Token;

    // Keyword lines (lexer_keyword.cpp)
    [[nodiscard]] auto lex_section_line(Token& token, std::string_view trimmed) const -> bool;
    [[nodiscard]] auto lex_step_line(Token& token, std::string_view trimmed) const -> bool;

    // Structural elements (lexer_element.cpp)
    void lex_tag_line(Token& token, std::string_view trimmed) const;
    void lex_table_row(Token& token, std::string_view trimmed) const;

    static void fail(Token& token, std::string_view expected, size_t column_in_trimmed);
};

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_LEXER_HPP
