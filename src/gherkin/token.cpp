#include "cuke/gherkin/token.hpp"

namespace cuke::gherkin {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Empty:
        return "blank line";
    case TokenKind::Comment:
        return "comment";
    case TokenKind::TagLine:
        return "tags";
    case TokenKind::FeatureLine:
        return "Feature:";
    case TokenKind::BackgroundLine:
        return "Background:";
    case TokenKind::ScenarioLine:
        return "Scenario:";
    case TokenKind::ScenarioOutlineLine:
        return "Scenario Outline:";
    case TokenKind::ExamplesLine:
        return "Examples:";
    case TokenKind::StepLine:
        return "step";
    case TokenKind::DocStringSeparator:
        return "\"\"\"";
    case TokenKind::DocStringContent:
        return "doc string content";
    case TokenKind::TableRow:
        return "table row";
    case TokenKind::Other:
        return "text";
    case TokenKind::Error:
        return "malformed line";
    }
    return "unknown";
}

} // namespace cuke::gherkin
