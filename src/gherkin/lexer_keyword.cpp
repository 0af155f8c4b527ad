//! # Keyword Recognition
//!
//! Section keywords end with a colon and may be followed by a name. Step
//! keywords must be followed by at least one space or tab. Both are matched
//! literally and case-sensitively.

#include "cuke/gherkin/lexer.hpp"

#include <array>

namespace cuke::gherkin {

namespace {

struct SectionKeyword {
    std::string_view text;
    TokenKind kind;
};

constexpr std::array<SectionKeyword, 7> SECTION_KEYWORDS = {{
    {"Feature:", TokenKind::FeatureLine},
    {"Background:", TokenKind::BackgroundLine},
    {"Scenario Outline:", TokenKind::ScenarioOutlineLine},
    {"Scenario Template:", TokenKind::ScenarioOutlineLine},
    {"Scenario:", TokenKind::ScenarioLine},
    {"Examples:", TokenKind::ExamplesLine},
    {"Scenarios:", TokenKind::ExamplesLine},
}};

} // namespace

auto step_keywords() -> const std::vector<std::string_view>& {
    static const std::vector<std::string_view> keywords = {"Given", "When", "Then",
                                                           "And",   "But",  "*"};
    return keywords;
}

auto is_step_keyword(std::string_view word) -> bool {
    for (auto keyword : step_keywords()) {
        if (keyword == word) {
            return true;
        }
    }
    return false;
}

auto Lexer::lex_section_line(Token& token, std::string_view trimmed) const -> bool {
    for (const auto& section : SECTION_KEYWORDS) {
        if (trimmed.starts_with(section.text)) {
            token.kind = section.kind;
            token.keyword = trimmed.substr(0, section.text.size());
            token.text = trim(trimmed.substr(section.text.size()));
            return true;
        }
    }
    return false;
}

auto Lexer::lex_step_line(Token& token, std::string_view trimmed) const -> bool {
    for (auto keyword : step_keywords()) {
        if (trimmed.size() > keyword.size() && trimmed.starts_with(keyword) &&
            is_horizontal_space(trimmed[keyword.size()])) {
            token.kind = TokenKind::StepLine;
            token.keyword = trimmed.substr(0, keyword.size());
            token.text = trim(trimmed.substr(keyword.size()));
            return true;
        }
    }
    return false;
}

} // namespace cuke::gherkin
