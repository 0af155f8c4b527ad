#include "cuke/gherkin/gherkin.hpp"

namespace cuke::gherkin {

auto parse(const Source& source) -> Result<Feature, ParseError> {
    Parser parser(source);
    return parser.parse_feature();
}

auto parse(std::string_view text) -> Result<Feature, ParseError> {
    Source source = Source::from_string(std::string(text));
    return parse(source);
}

} // namespace cuke::gherkin
