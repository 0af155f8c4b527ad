//! # Tag Lines and Table Rows
//!
//! A tag line is a run of `@name` tokens separated by whitespace, where a
//! name is one or more letters, digits, `_` or `-`. A `#` after the tags
//! starts a comment.
//!
//! A table row is split on `|`. Cells are trimmed; the empty cell left by
//! the closing `|` is dropped, every other cell is kept even when empty.

#include "cuke/gherkin/lexer.hpp"

namespace cuke::gherkin {

namespace {

auto is_tag_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

} // namespace

void Lexer::lex_tag_line(Token& token, std::string_view trimmed) const {
    token.kind = TokenKind::TagLine;

    size_t pos = 0;
    while (pos < trimmed.size()) {
        if (is_horizontal_space(trimmed[pos])) {
            ++pos;
            continue;
        }
        if (trimmed[pos] == '#') {
            break;
        }
        if (trimmed[pos] != '@') {
            fail(token, "tag starting with '@'", pos);
            return;
        }

        size_t start = ++pos;
        while (pos < trimmed.size() && is_tag_char(trimmed[pos])) {
            ++pos;
        }
        if (pos == start) {
            fail(token, "tag name after '@'", pos);
            return;
        }
        // A comment may follow a tag without a space.
        if (pos < trimmed.size() && !is_horizontal_space(trimmed[pos]) && trimmed[pos] != '#') {
            fail(token, "tag name of letters, digits, '_' or '-'", pos);
            return;
        }

        token.items.emplace_back(trimmed.substr(start, pos - start));
    }
}

void Lexer::lex_table_row(Token& token, std::string_view trimmed) const {
    token.kind = TokenKind::TableRow;

    std::string_view rest = trimmed.substr(1);
    while (true) {
        size_t bar = rest.find('|');
        if (bar == std::string_view::npos) {
            token.items.emplace_back(trim(rest));
            break;
        }
        token.items.emplace_back(trim(rest.substr(0, bar)));
        rest = rest.substr(bar + 1);
    }

    if (!token.items.empty() && token.items.back().empty()) {
        token.items.pop_back();
    }

    if (token.items.empty()) {
        fail(token, "table cell between '|' delimiters", 1);
    }
}

} // namespace cuke::gherkin
