//! # Step Parsing
//!
//! A step is one keyword line. Blank lines and comments may separate it from
//! its single optional attachment, a doc string or a data table.

#include "cuke/gherkin/parser.hpp"

namespace cuke::gherkin {

auto Parser::parse_step() -> Result<Step, ParseError> {
    const Token& line = advance();

    Step step{.keyword = std::string(line.keyword),
              .text = std::string(line.text),
              .docstring = std::nullopt,
              .datatable = std::nullopt,
              .line = line.line_index()};

    skip_ignorable();
    if (check(TokenKind::DocStringSeparator)) {
        auto doc = parse_doc_string();
        if (is_err(doc))
            return unwrap_err(doc);
        step.docstring = std::move(unwrap(doc));
    } else if (check(TokenKind::TableRow)) {
        auto table = parse_data_table();
        if (is_err(table))
            return unwrap_err(table);
        step.datatable = std::move(unwrap(table));
    } else {
        return step;
    }

    skip_ignorable();
    if (check(TokenKind::DocStringSeparator) || check(TokenKind::TableRow)) {
        return error_at(peek(), ParseErrorKind::ConflictingStepArgument,
                        "a new step; a step takes one doc string or one data table");
    }

    return step;
}

auto Parser::parse_steps() -> Result<std::vector<Step>, ParseError> {
    std::vector<Step> steps;

    skip_ignorable();
    while (check(TokenKind::StepLine)) {
        auto step = parse_step();
        if (is_err(step))
            return unwrap_err(step);
        steps.push_back(std::move(unwrap(step)));
        skip_ignorable();
    }

    return steps;
}

} // namespace cuke::gherkin
