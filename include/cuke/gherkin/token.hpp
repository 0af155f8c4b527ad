//! # Gherkin Line Tokens
//!
//! Gherkin is line oriented: every physical line of a feature file is
//! classified into exactly one token. The parser consumes these tokens and
//! never looks at raw characters again, except for doc string content.
//!
//! | Kind                  | Example                        |
//! |-----------------------|--------------------------------|
//! | `TagLine`             | `@smoke @slow`                 |
//! | `FeatureLine`         | `Feature: Shopping cart`       |
//! | `BackgroundLine`      | `Background:`                  |
//! | `ScenarioLine`        | `Scenario: Add an item`        |
//! | `ScenarioOutlineLine` | `Scenario Outline: Totals`     |
//! | `ExamplesLine`        | `Examples: Small carts`        |
//! | `StepLine`            | `Given I have 3 items`         |
//! | `DocStringSeparator`  | `"""`                          |
//! | `TableRow`            | `| name | price |`              |
//! | `Comment`             | `# pending review`             |

#ifndef CUKE_GHERKIN_TOKEN_HPP
#define CUKE_GHERKIN_TOKEN_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::gherkin {

/// Classification of one physical line.
enum class TokenKind : uint8_t {
    Eof,
    Empty,   ///< Only whitespace
    Comment, ///< First non-blank character is `#`
    TagLine,
    FeatureLine,
    BackgroundLine,
    ScenarioLine,
    ScenarioOutlineLine,
    ExamplesLine,
    StepLine,
    DocStringSeparator,
    DocStringContent, ///< Any line between two separators, kept verbatim
    TableRow,
    Other, ///< Free text (feature description lines)
    Error, ///< A tag line or table row that could not be read
};

[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// One classified line.
struct Token {
    TokenKind kind;

    /// Keyword as written (`"Scenario Outline:"`, `"Given"`, `"*"`).
    /// Empty for kinds without a keyword.
    std::string_view keyword;

    /// Trimmed text after the keyword: a section name or the step text.
    /// For `Other` and `DocStringContent` the line itself, for `Error` the
    /// name of the construct that was expected.
    std::string_view text;

    /// Tag names without `@`, or the trimmed cells of a table row.
    std::vector<std::string> items;

    /// The whole line without its terminator.
    std::string_view raw;

    uint32_t line;   ///< 1-based line number
    size_t offset;   ///< Byte offset of the line start
    uint32_t indent; ///< Bytes of leading whitespace
    uint32_t error_column = 0; ///< 1-based column of the problem, `Error` only

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Blank lines and comments, which the parser skips between constructs.
    [[nodiscard]] auto is_ignorable() const -> bool {
        return kind == TokenKind::Empty || kind == TokenKind::Comment;
    }

    /// 0-based line index, the form stored in the document model.
    [[nodiscard]] auto line_index() const -> uint32_t {
        return line - 1;
    }
};

} // namespace cuke::gherkin

#endif // CUKE_GHERKIN_TOKEN_HPP
