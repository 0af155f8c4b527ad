//! # Expression Matcher
//!
//! A single left-to-right walk over the nodes, one node per step, with no
//! backtracking:
//!
//! | Node               | Remaining text starts with a match | Otherwise              |
//! |--------------------|------------------------------------|------------------------|
//! | Literal            | consume                            | no match               |
//! | Required parameter | consume, capture value             | no match               |
//! | Optional parameter | consume, capture value             | capture null, go on    |
//! | Optional text      | consume                            | go on                  |
//! | Alternation        | consume the first matching option  | no match               |
//!
//! The match succeeds only if all text is consumed once the nodes run out.

#include "cuke/expression/expression.hpp"

namespace cuke::expression {

namespace {

enum class Outcome : uint8_t { Continue, Fail };

auto consume_prefix(std::string_view& text, std::string_view prefix) -> bool {
    if (!text.starts_with(prefix)) {
        return false;
    }
    text.remove_prefix(prefix.size());
    return true;
}

auto match_node(const Node& node, std::string_view& text, std::vector<Value>& args) -> Outcome {
    if (const auto* literal = std::get_if<LiteralNode>(&node)) {
        return consume_prefix(text, literal->text) ? Outcome::Continue : Outcome::Fail;
    }

    if (const auto* param = std::get_if<ParameterNode>(&node)) {
        std::optional<ParsedValue> parsed;
        if (!text.empty()) {
            parsed = parse_parameter(param->kind, text);
        }
        if (parsed) {
            args.push_back(std::move(parsed->value));
            text.remove_prefix(parsed->consumed);
            return Outcome::Continue;
        }
        if (param->optional) {
            args.emplace_back(std::monostate{});
            return Outcome::Continue;
        }
        return Outcome::Fail;
    }

    if (const auto* optional = std::get_if<OptionalTextNode>(&node)) {
        consume_prefix(text, optional->text);
        return Outcome::Continue;
    }

    const auto& alternation = std::get<AlternationNode>(node);
    for (const auto& option : alternation.options) {
        if (consume_prefix(text, option)) {
            return Outcome::Continue;
        }
    }
    return Outcome::Fail;
}

} // namespace

auto match(std::string_view text, const CompiledExpression& compiled)
    -> std::optional<std::vector<Value>> {
    std::vector<Value> args;
    args.reserve(compiled.parameter_count());

    for (const auto& node : compiled.nodes()) {
        if (match_node(node, text, args) == Outcome::Fail) {
            return std::nullopt;
        }
    }

    if (!text.empty()) {
        return std::nullopt;
    }
    return args;
}

} // namespace cuke::expression
