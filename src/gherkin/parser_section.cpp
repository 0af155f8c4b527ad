//! # Section Parsing
//!
//! Background, Scenario, Scenario Outline and Examples. A section ends at
//! the next tag line, `Scenario:` or `Scenario Outline:` line, or at the end
//! of input; any other line left over after its steps is an error.

#include "cuke/gherkin/parser.hpp"

namespace cuke::gherkin {

namespace {

auto opens_next_section(const Token& token) -> bool {
    return token.is_one_of({TokenKind::TagLine, TokenKind::ScenarioLine,
                            TokenKind::ScenarioOutlineLine, TokenKind::Eof});
}

} // namespace

auto Parser::parse_background() -> Result<Background, ParseError> {
    const Token& keyword = advance();

    auto steps = parse_steps();
    if (is_err(steps))
        return unwrap_err(steps);

    if (!opens_next_section(peek())) {
        return error_at(peek(), ParseErrorKind::UnexpectedLine,
                        "a step, Scenario:, Scenario Outline: or tags");
    }

    return Background{.steps = std::move(unwrap(steps)), .line = keyword.line_index()};
}

auto Parser::parse_scenario_definition() -> Result<ScenarioDefinition, ParseError> {
    auto tags = parse_tags();
    if (is_err(tags))
        return unwrap_err(tags);

    if (check(TokenKind::ScenarioLine)) {
        auto scenario = parse_scenario(std::move(unwrap(tags)));
        if (is_err(scenario))
            return unwrap_err(scenario);
        return std::move(unwrap(scenario));
    }

    if (check(TokenKind::ScenarioOutlineLine)) {
        auto outline = parse_outline(std::move(unwrap(tags)));
        if (is_err(outline))
            return unwrap_err(outline);
        return std::move(unwrap(outline));
    }

    return error_at(peek(), ParseErrorKind::UnexpectedLine,
                    unwrap(tags).empty() ? "Scenario: or Scenario Outline:"
                                         : "Scenario: or Scenario Outline: after tags");
}

auto Parser::parse_scenario(std::vector<std::string> tags) -> Result<Scenario, ParseError> {
    const Token& keyword = advance();

    auto steps = parse_steps();
    if (is_err(steps))
        return unwrap_err(steps);

    if (check(TokenKind::ExamplesLine)) {
        return error_at(peek(), ParseErrorKind::UnexpectedLine,
                        "a step; Examples: is only allowed in a Scenario Outline");
    }
    if (!opens_next_section(peek())) {
        return error_at(peek(), ParseErrorKind::UnexpectedLine,
                        "a step, Scenario:, Scenario Outline: or tags");
    }

    return Scenario{.name = std::string(keyword.text),
                    .steps = std::move(unwrap(steps)),
                    .tags = std::move(tags),
                    .line = keyword.line_index()};
}

auto Parser::parse_outline(std::vector<std::string> tags) -> Result<ScenarioOutline, ParseError> {
    const Token& keyword = advance();

    auto steps = parse_steps();
    if (is_err(steps))
        return unwrap_err(steps);

    std::vector<Examples> examples;
    while (check(TokenKind::ExamplesLine) ||
           (check(TokenKind::TagLine) && kind_after_tags() == TokenKind::ExamplesLine)) {
        auto block = parse_examples();
        if (is_err(block))
            return unwrap_err(block);
        examples.push_back(std::move(unwrap(block)));
        skip_ignorable();
    }

    if (check(TokenKind::TagLine) && kind_after_tags() == TokenKind::Error) {
        auto tags = parse_tags();
        if (is_err(tags))
            return unwrap_err(tags);
    }

    if (!opens_next_section(peek())) {
        return error_at(peek(), ParseErrorKind::UnexpectedLine,
                        examples.empty() ? "a step or Examples:"
                                         : "Examples:, Scenario:, Scenario Outline: or tags");
    }

    if (examples.empty()) {
        auto error = error_at(keyword, ParseErrorKind::OutlineWithoutExamples, "Examples:");
        error.message = "Scenario Outline '" + std::string(keyword.text) +
                        "' has no Examples section";
        return error;
    }

    return ScenarioOutline{.name = std::string(keyword.text),
                           .steps = std::move(unwrap(steps)),
                           .tags = std::move(tags),
                           .examples = std::move(examples),
                           .line = keyword.line_index()};
}

auto Parser::parse_examples() -> Result<Examples, ParseError> {
    auto tags = parse_tags();
    if (is_err(tags))
        return unwrap_err(tags);

    const Token& keyword = advance();

    skip_ignorable();
    if (!check(TokenKind::TableRow)) {
        return error_at(peek(), ParseErrorKind::EmptyExamplesTable,
                        "an Examples table header row");
    }

    size_t first_row = pos_;
    auto table = parse_data_table();
    if (is_err(table))
        return unwrap_err(table);

    std::vector<const Token*> row_tokens;
    for (size_t i = first_row; i < pos_; ++i) {
        if (tokens_[i].is(TokenKind::TableRow)) {
            row_tokens.push_back(&tokens_[i]);
        }
    }

    DataTable& rows = unwrap(table);
    for (size_t i = 1; i < rows.size(); ++i) {
        if (rows[i].size() != rows[0].size()) {
            return error_at(*row_tokens[i], ParseErrorKind::MalformedTable,
                            "a row of " + std::to_string(rows[0].size()) +
                                " cells to match the Examples header");
        }
    }

    std::vector<std::string> header = std::move(rows[0]);
    rows.erase(rows.begin());

    return Examples{.name = std::string(keyword.text),
                    .tags = std::move(unwrap(tags)),
                    .table_header = std::move(header),
                    .table_body = std::move(rows),
                    .line = keyword.line_index()};
}

} // namespace cuke::gherkin
