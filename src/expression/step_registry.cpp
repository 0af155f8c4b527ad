#include "cuke/expression/step_registry.hpp"

#include "cuke/log/log.hpp"

#include <regex>

namespace cuke::expression {

auto StepRegistry::add(std::string_view pattern) -> Result<size_t, CompileError> {
    auto compiled = compile(pattern);
    if (is_err(compiled)) {
        CUKE_LOG_WARN("registry", "Rejected step pattern '"
                                      << pattern << "': " << unwrap_err(compiled).message);
        return unwrap_err(compiled);
    }

    for (const auto& existing : definitions_) {
        if (existing.pattern == pattern) {
            CUKE_LOG_WARN("registry", "Step pattern '" << pattern
                                                       << "' is registered twice; the later copy "
                                                          "never matches");
            break;
        }
    }

    definitions_.push_back(
        StepDefinition{.pattern = std::string(pattern), .compiled = std::move(unwrap(compiled))});
    CUKE_LOG_DEBUG("registry", "Registered step pattern #" << definitions_.size() - 1 << " '"
                                                           << pattern << "'");
    return definitions_.size() - 1;
}

auto StepRegistry::find(std::string_view step_text) const -> std::optional<StepMatch> {
    for (size_t i = 0; i < definitions_.size(); ++i) {
        auto args = match(step_text, definitions_[i].compiled);
        if (args) {
            CUKE_LOG_TRACE("registry", "'" << step_text << "' matched pattern #" << i);
            return StepMatch{
                .index = i, .pattern = definitions_[i].pattern, .args = std::move(*args)};
        }
    }
    CUKE_LOG_TRACE("registry", "'" << step_text << "' matched no pattern");
    return std::nullopt;
}

auto suggest_pattern(std::string_view step_text) -> std::string {
    static const std::regex quoted(R"("[^"]*")");
    static const std::regex decimal(R"(\b\d+\.\d+\b)");
    static const std::regex integer(R"(\b\d+\b)");

    std::string suggestion(step_text);
    suggestion = std::regex_replace(suggestion, quoted, "{string}");
    suggestion = std::regex_replace(suggestion, decimal, "{float}");
    suggestion = std::regex_replace(suggestion, integer, "{int}");
    return suggestion;
}

} // namespace cuke::expression
