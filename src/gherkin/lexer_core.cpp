//! # Lexer Core
//!
//! Line splitting, trimming primitives and the per-line dispatch.

#include "cuke/gherkin/lexer.hpp"

namespace cuke::gherkin {

// ============================================================================
// Primitives
// ============================================================================

namespace {

constexpr std::string_view DOC_STRING_DELIMITER = R"(""")";

auto is_trimmable(char c) -> bool {
    return is_horizontal_space(c) || c == '\r';
}

} // namespace

auto trim_start(std::string_view s) -> std::string_view {
    size_t start = 0;
    while (start < s.size() && is_trimmable(s[start])) {
        ++start;
    }
    return s.substr(start);
}

auto trim(std::string_view s) -> std::string_view {
    s = trim_start(s);
    size_t end = s.size();
    while (end > 0 && is_trimmable(s[end - 1])) {
        --end;
    }
    return s.substr(0, end);
}

auto trim_end(std::string_view s) -> std::string_view {
    size_t end = s.size();
    while (end > 0 && (is_trimmable(s[end - 1]) || s[end - 1] == '\n')) {
        --end;
    }
    return s.substr(0, end);
}

auto leading_whitespace(std::string_view s) -> size_t {
    size_t n = 0;
    while (n < s.size() && is_horizontal_space(s[n])) {
        ++n;
    }
    return n;
}

// ============================================================================
// Lexer
// ============================================================================

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::next_token() -> Token {
    if (next_line_ > source_.line_count()) {
        return Token{.kind = TokenKind::Eof,
                     .keyword = {},
                     .text = {},
                     .items = {},
                     .raw = {},
                     .line = source_.line_count() + 1,
                     .offset = source_.length(),
                     .indent = 0};
    }

    uint32_t line_num = next_line_++;
    std::string_view raw = source_.line(line_num);

    Token token{.kind = TokenKind::Other,
                .keyword = {},
                .text = {},
                .items = {},
                .raw = raw,
                .line = line_num,
                .offset = source_.line_offset(line_num),
                .indent = static_cast<uint32_t>(leading_whitespace(raw))};

    return classify(std::move(token), trim(raw));
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().is_eof()) {
            break;
        }
    }
    return tokens;
}

auto Lexer::classify(Token token, std::string_view trimmed) -> Token {
    if (in_doc_string_) {
        if (trimmed == DOC_STRING_DELIMITER) {
            in_doc_string_ = false;
            token.kind = TokenKind::DocStringSeparator;
        } else {
            token.kind = TokenKind::DocStringContent;
            token.text = token.raw;
        }
        return token;
    }

    token = classify_line(std::move(token), trimmed);

    // A step keeps its context through its argument and interleaved comments.
    switch (token.kind) {
    case TokenKind::StepLine:
    case TokenKind::TableRow:
    case TokenKind::DocStringSeparator:
        step_context_ = true;
        break;
    case TokenKind::Empty:
    case TokenKind::Comment:
        break;
    default:
        step_context_ = false;
        break;
    }
    return token;
}

auto Lexer::classify_line(Token token, std::string_view trimmed) -> Token {
    token.text = trimmed;

    if (trimmed.empty()) {
        token.kind = TokenKind::Empty;
        return token;
    }

    if (trimmed.front() == '#') {
        token.kind = TokenKind::Comment;
        return token;
    }

    // Outside a step, `"""` is ordinary text (e.g. in a description).
    if (step_context_ && trimmed.starts_with(DOC_STRING_DELIMITER)) {
        if (trimmed.size() != DOC_STRING_DELIMITER.size()) {
            fail(token, "end of line after \"\"\"", DOC_STRING_DELIMITER.size());
            return token;
        }
        in_doc_string_ = true;
        token.kind = TokenKind::DocStringSeparator;
        return token;
    }

    if (trimmed.front() == '@') {
        lex_tag_line(token, trimmed);
        return token;
    }

    if (trimmed.front() == '|') {
        lex_table_row(token, trimmed);
        return token;
    }

    if (lex_section_line(token, trimmed) || lex_step_line(token, trimmed)) {
        return token;
    }

    token.kind = TokenKind::Other;
    return token;
}

void Lexer::fail(Token& token, std::string_view expected, size_t column_in_trimmed) {
    token.kind = TokenKind::Error;
    token.text = expected;
    token.items.clear();
    token.error_column = token.indent + static_cast<uint32_t>(column_in_trimmed) + 1;
}

} // namespace cuke::gherkin
