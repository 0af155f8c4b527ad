#include "cuke/gherkin/expand.hpp"

#include "cuke/log/log.hpp"

#include <algorithm>

namespace cuke::gherkin {

namespace {

auto row_name(const ScenarioOutline& outline, const Examples& block, size_t row_number)
    -> std::string {
    std::string name = outline.name + " (";
    if (!block.name.empty()) {
        name += block.name + ": ";
    }
    name += "row " + std::to_string(row_number) + ")";
    return name;
}

auto merge_tags(const std::vector<std::string>& outline_tags,
                const std::vector<std::string>& block_tags) -> std::vector<std::string> {
    std::vector<std::string> merged;
    for (const auto* source : {&outline_tags, &block_tags}) {
        for (const auto& tag : *source) {
            if (std::find(merged.begin(), merged.end(), tag) == merged.end()) {
                merged.push_back(tag);
            }
        }
    }
    return merged;
}

auto substitute_step(const Step& step, const Substitutions& values) -> Step {
    Step result = step;
    result.text = substitute_placeholders(step.text, values);
    if (step.docstring) {
        result.docstring = substitute_placeholders(*step.docstring, values);
    }
    if (step.datatable) {
        for (auto& row : *result.datatable) {
            for (auto& cell : row) {
                cell = substitute_placeholders(cell, values);
            }
        }
    }
    return result;
}

} // namespace

auto substitute_placeholders(std::string_view text, const Substitutions& values) -> std::string {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('<', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t close = text.find('>', open + 1);
        if (close == std::string_view::npos) {
            break;
        }

        auto it = values.find(text.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            // Not a placeholder we know; keep the '<' and rescan after it.
            out.append(text, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }

        out.append(text, pos, open - pos);
        out += it->second;
        pos = close + 1;
    }

    out.append(text, pos);
    return out;
}

auto expand_outline(const ScenarioOutline& outline) -> Result<std::vector<Scenario>, ExpandError> {
    if (outline.examples.empty()) {
        return ExpandError{.message = "Scenario Outline '" + outline.name +
                                      "' has no Examples section",
                           .outline_name = outline.name,
                           .line = outline.line};
    }

    std::vector<Scenario> scenarios;
    for (const auto& block : outline.examples) {
        for (size_t i = 0; i < block.table_body.size(); ++i) {
            const auto& row = block.table_body[i];

            Substitutions values;
            for (size_t col = 0; col < block.table_header.size() && col < row.size(); ++col) {
                values.emplace(block.table_header[col], row[col]);
            }

            Scenario scenario{.name = row_name(outline, block, i + 1),
                              .steps = {},
                              .tags = merge_tags(outline.tags, block.tags),
                              .line = outline.line};
            for (const auto& step : outline.steps) {
                scenario.steps.push_back(substitute_step(step, values));
            }
            scenarios.push_back(std::move(scenario));
        }
    }

    CUKE_LOG_DEBUG("gherkin", "Expanded outline '" << outline.name << "' into "
                                                   << scenarios.size() << " scenario(s)");
    return scenarios;
}

auto expand_all_scenarios(const std::vector<ScenarioDefinition>& definitions)
    -> Result<std::vector<Scenario>, ExpandError> {
    std::vector<Scenario> scenarios;
    for (const auto& definition : definitions) {
        if (const auto* scenario = std::get_if<Scenario>(&definition)) {
            scenarios.push_back(*scenario);
            continue;
        }

        auto expanded = expand_outline(std::get<ScenarioOutline>(definition));
        if (is_err(expanded))
            return unwrap_err(expanded);
        for (auto& scenario : unwrap(expanded)) {
            scenarios.push_back(std::move(scenario));
        }
    }
    return scenarios;
}

} // namespace cuke::gherkin
