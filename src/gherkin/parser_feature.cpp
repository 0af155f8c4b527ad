//! # Document Assembly
//!
//! ```text
//! feature     = ignorable* tags Feature-line description* background? definition*
//! definition  = tags (scenario | outline)
//! description = any line except tags, Background:, Scenario:, Scenario Outline:
//! ```

#include "cuke/gherkin/parser.hpp"

namespace cuke::gherkin {

namespace {

auto ends_description(const Token& token) -> bool {
    if (token.is(TokenKind::Error)) {
        return trim(token.raw).starts_with("@");
    }
    return token.is_one_of({TokenKind::TagLine, TokenKind::BackgroundLine, TokenKind::ScenarioLine,
                            TokenKind::ScenarioOutlineLine, TokenKind::Eof});
}

} // namespace

auto Parser::parse_feature() -> Result<Feature, ParseError> {
    auto header = parse_feature_header();
    if (is_err(header))
        return unwrap_err(header);
    Feature& feature = unwrap(header);

    skip_description();

    skip_ignorable();
    if (check(TokenKind::BackgroundLine)) {
        auto background = parse_background();
        if (is_err(background))
            return unwrap_err(background);
        feature.background = std::move(unwrap(background));
    }

    skip_ignorable();
    while (!is_at_end()) {
        auto definition = parse_scenario_definition();
        if (is_err(definition))
            return unwrap_err(definition);
        feature.scenarios.push_back(std::move(unwrap(definition)));
        skip_ignorable();
    }

    return std::move(feature);
}

auto Parser::parse_feature_header() -> Result<Feature, ParseError> {
    auto tags = parse_tags();
    if (is_err(tags))
        return unwrap_err(tags);

    if (!check(TokenKind::FeatureLine)) {
        return error_at(peek(), ParseErrorKind::MissingFeature,
                        unwrap(tags).empty() ? "Feature:" : "Feature: after tags");
    }

    const Token& keyword = advance();
    if (keyword.text.empty()) {
        return error_at(keyword, ParseErrorKind::MissingFeature, "a feature name after Feature:");
    }

    Feature feature;
    feature.name = std::string(keyword.text);
    feature.tags = std::move(unwrap(tags));
    feature.line = keyword.line_index();
    return feature;
}

void Parser::skip_description() {
    while (!ends_description(peek())) {
        advance();
    }
}

} // namespace cuke::gherkin
