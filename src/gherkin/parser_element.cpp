//! # Structural Elements
//!
//! Tag sets, data tables and doc strings: the pieces that sections and steps
//! are assembled from.

#include "cuke/gherkin/parser.hpp"

#include <algorithm>
#include <limits>

namespace cuke::gherkin {

auto join_doc_string(const std::vector<std::string_view>& lines) -> std::string {
    size_t indent = std::numeric_limits<size_t>::max();
    for (auto line : lines) {
        if (!trim(line).empty()) {
            indent = std::min(indent, leading_whitespace(line));
        }
    }
    if (indent == std::numeric_limits<size_t>::max()) {
        indent = 0;
    }

    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        std::string_view line = lines[i];
        joined += line.substr(std::min({indent, leading_whitespace(line), line.size()}));
    }

    return std::string(trim_end(joined));
}

auto Parser::parse_tags() -> Result<std::vector<std::string>, ParseError> {
    std::vector<std::string> tags;

    skip_ignorable();
    while (check(TokenKind::TagLine)) {
        for (const auto& tag : advance().items) {
            if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
                tags.push_back(tag);
            }
        }
        skip_ignorable();
    }

    if (check(TokenKind::Error)) {
        return lexer_error(peek());
    }

    return tags;
}

auto Parser::parse_data_table() -> Result<DataTable, ParseError> {
    DataTable rows;
    while (check(TokenKind::TableRow)) {
        rows.push_back(advance().items);

        // Comments and blank lines between rows belong to the table.
        size_t next = pos_;
        while (next < tokens_.size() && tokens_[next].is_ignorable()) {
            ++next;
        }
        if (next < tokens_.size() && tokens_[next].is(TokenKind::TableRow)) {
            pos_ = next;
        }
    }

    if (check(TokenKind::Error)) {
        return lexer_error(peek());
    }

    return rows;
}

auto Parser::parse_doc_string() -> Result<std::string, ParseError> {
    const Token& opening = advance();

    std::vector<std::string_view> lines;
    while (check(TokenKind::DocStringContent)) {
        lines.push_back(advance().text);
    }

    if (!check(TokenKind::DocStringSeparator)) {
        auto error =
            error_at(opening, ParseErrorKind::UnterminatedDocString, "closing \"\"\" delimiter");
        error.message = "Expected closing \"\"\" for the doc string opened on line " +
                        std::to_string(opening.line) + " before end of input";
        return error;
    }
    advance();

    return join_doc_string(lines);
}

} // namespace cuke::gherkin
