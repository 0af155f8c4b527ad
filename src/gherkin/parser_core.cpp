//! # Parser Core
//!
//! Token navigation and error construction shared by every parser layer.
//!
//! | Method            | Description                                 |
//! |-------------------|---------------------------------------------|
//! | `peek()`          | Look at the current token                   |
//! | `advance()`       | Consume and return the current token        |
//! | `check()`         | Test the current token kind                 |
//! | `skip_ignorable()`| Skip blank lines and comments               |
//! | `kind_after_tags()` | Look past tags to the section they belong to |

#include "cuke/gherkin/parser.hpp"

namespace cuke::gherkin {

// ============================================================================
// ParseError
// ============================================================================

auto parse_error_kind_name(ParseErrorKind kind) -> std::string_view {
    switch (kind) {
    case ParseErrorKind::UnexpectedLine:
        return "unexpected line";
    case ParseErrorKind::MissingFeature:
        return "missing feature";
    case ParseErrorKind::MalformedTag:
        return "malformed tag";
    case ParseErrorKind::MalformedTable:
        return "malformed table";
    case ParseErrorKind::EmptyExamplesTable:
        return "empty examples table";
    case ParseErrorKind::UnterminatedDocString:
        return "unterminated doc string";
    case ParseErrorKind::OutlineWithoutExamples:
        return "outline without examples";
    case ParseErrorKind::ConflictingStepArgument:
        return "conflicting step argument";
    }
    return "unknown";
}

auto ParseError::to_string() const -> std::string {
    std::string out = "Gherkin parse error at line " + std::to_string(line) + ", column " +
                      std::to_string(column) + ":\n  " + message + "\n";
    if (!rest.empty()) {
        out += "Near: \"" + rest + "\"\n";
    }
    return out;
}

// ============================================================================
// Token Navigation
// ============================================================================

Parser::Parser(const Source& source) : source_(source) {
    Lexer lexer(source_);
    tokens_ = lexer.tokenize();
}

auto Parser::peek() const -> const Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_];
}

auto Parser::advance() -> const Token& {
    const Token& current = peek();
    if (!is_at_end()) {
        ++pos_;
    }
    return current;
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

void Parser::skip_ignorable() {
    while (peek().is_ignorable()) {
        advance();
    }
}

auto Parser::kind_after_tags() const -> TokenKind {
    for (size_t i = pos_; i < tokens_.size(); ++i) {
        const Token& token = tokens_[i];
        if (!token.is(TokenKind::TagLine) && !token.is_ignorable()) {
            return token.kind;
        }
    }
    return TokenKind::Eof;
}

// ============================================================================
// Error Construction
// ============================================================================

auto Parser::error_at(const Token& token, ParseErrorKind kind, std::string_view expected) const
    -> ParseError {
    if (token.is(TokenKind::Error)) {
        return lexer_error(token);
    }

    std::string found = token.is_eof() ? std::string{} : std::string(trim(token.raw));

    std::string message = "Expected " + std::string(expected);
    if (token.is_eof()) {
        message += " before end of input";
    } else {
        message += ", found '" + found + "'";
    }

    size_t start = token.offset + token.indent;
    return ParseError{.kind = kind,
                      .message = std::move(message),
                      .expected = std::string(expected),
                      .found = std::move(found),
                      .line = token.line,
                      .column = token.indent + 1,
                      .rest = std::string(source_.snippet(start, ERROR_SNIPPET_BYTES))};
}

auto Parser::lexer_error(const Token& token) const -> ParseError {
    std::string_view trimmed = trim(token.raw);
    ParseErrorKind kind = ParseErrorKind::UnexpectedLine;
    if (trimmed.starts_with("@")) {
        kind = ParseErrorKind::MalformedTag;
    } else if (trimmed.starts_with("|")) {
        kind = ParseErrorKind::MalformedTable;
    }

    size_t start = token.offset + token.error_column - 1;
    return ParseError{.kind = kind,
                      .message = "Expected " + std::string(token.text),
                      .expected = std::string(token.text),
                      .found = std::string(trimmed),
                      .line = token.line,
                      .column = token.error_column,
                      .rest = std::string(source_.snippet(start, ERROR_SNIPPET_BYTES))};
}

} // namespace cuke::gherkin
