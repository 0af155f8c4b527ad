//! # Gherkin Parser
//!
//! Recursive descent over line tokens, layered bottom-up:
//!
//! | Layer    | File                 | Produces                         |
//! |----------|----------------------|----------------------------------|
//! | elements | `parser_element.cpp` | tag sets, tables, doc strings    |
//! | steps    | `parser_step.cpp`    | `Step` with its attachment       |
//! | sections | `parser_section.cpp` | Background, Scenario, Outline    |
//! | document | `parser_feature.cpp` | `Feature`                        |
//!
//! Parsing stops at the first error. A failed parse never yields a partial
//! tree.

#ifndef CUKE_GHERKIN_PARSER_HPP
#define CUKE_GHERKIN_PARSER_HPP

#include "cuke/common.hpp"
#include "cuke/gherkin/document.hpp"
#include "cuke/gherkin/lexer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cuke::gherkin {

/// What went wrong, for callers that react differently per category.
enum class ParseErrorKind : uint8_t {
    UnexpectedLine,          ///< A line that fits no construct at this point
    MissingFeature,          ///< No `Feature:` line (possibly after tags)
    MalformedTag,            ///< `@` not followed by a valid tag name
    MalformedTable,          ///< Row without cells, or Examples row of the wrong width
    EmptyExamplesTable,      ///< `Examples:` with no header row
    UnterminatedDocString,   ///< `"""` never closed
    OutlineWithoutExamples,  ///< Scenario Outline finished without an Examples block
    ConflictingStepArgument, ///< Second doc string or table on one step
};

[[nodiscard]] auto parse_error_kind_name(ParseErrorKind kind) -> std::string_view;

/// Structured parse failure.
struct ParseError {
    ParseErrorKind kind;
    std::string message;  ///< "Expected ..." sentence naming the construct
    std::string expected; ///< The construct that was expected, e.g. "Feature:"
    std::string found;    ///< The offending fragment (trimmed line), empty at end of input
    uint32_t line;        ///< 1-based
    uint32_t column;      ///< 1-based
    std::string rest;     ///< Up to 50 bytes of unconsumed input from the error position

    /// Multi-line report: position, expectation and the text near the error.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// Maximum length of `ParseError::rest`.
constexpr size_t ERROR_SNIPPET_BYTES = 50;

/// Joins doc string content lines with `\n` after removing the smallest
/// leading indentation found on any non-blank line, then trims trailing
/// whitespace from the result.
[[nodiscard]] auto join_doc_string(const std::vector<std::string_view>& lines) -> std::string;

class Parser {
public:
    /// The source must outlive the parser.
    explicit Parser(const Source& source);

    [[nodiscard]] auto parse_feature() -> Result<Feature, ParseError>;

private:
    const Source& source_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    // ========================================================================
    // Token Navigation (parser_core.cpp)
    // ========================================================================

    [[nodiscard]] auto peek() const -> const Token&;
    auto advance() -> const Token&;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    [[nodiscard]] auto is_at_end() const -> bool;

    /// Skips blank lines and comments.
    void skip_ignorable();

    /// Kind of the first token after the tag lines, blank lines and comments
    /// that start at the current position.
    [[nodiscard]] auto kind_after_tags() const -> TokenKind;

    [[nodiscard]] auto error_at(const Token& token, ParseErrorKind kind,
                                std::string_view expected) const -> ParseError;

    /// Converts a lexer `Error` token into a ParseError.
    [[nodiscard]] auto lexer_error(const Token& token) const -> ParseError;

    // ========================================================================
    // Elements (parser_element.cpp)
    // ========================================================================

    [[nodiscard]] auto parse_tags() -> Result<std::vector<std::string>, ParseError>;
    [[nodiscard]] auto parse_data_table() -> Result<DataTable, ParseError>;
    [[nodiscard]] auto parse_doc_string() -> Result<std::string, ParseError>;

    // ========================================================================
    // Steps (parser_step.cpp)
    // ========================================================================

    [[nodiscard]] auto parse_step() -> Result<Step, ParseError>;
    [[nodiscard]] auto parse_steps() -> Result<std::vector<Step>, ParseError>;

    // ========================================================================
    // Sections (parser_section.cpp)
    // ========================================================================

    [[nodiscard]] auto parse_background() -> Result<Background, ParseError>;
    [[nodiscard]] auto parse_scenario_definition() -> Result<ScenarioDefinition, ParseError>;
    [[nodiscard]] auto parse_scenario(std::vector<std::string> tags)
        -> Result<Scenario, ParseError>;
    [[nodiscard]] auto parse_outline(std::vector<std::string> tags)
        -> Result<ScenarioOutline, ParseError>;
    [[nodiscard]] auto parse_examples() -> Result<Examples, ParseError>;

    // ========================================================================
    // Document (parser_feature.cpp)
    // ========================================================================

    [[nodiscard]] auto parse_feature_header() -> Result<Feature, ParseError>;
    void skip_description();
};

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_PARSER_HPP
