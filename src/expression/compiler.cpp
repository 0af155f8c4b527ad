//! # Expression Compiler
//!
//! Scans a pattern left to right. At each position the first construct that
//! applies wins:
//!
//! 1. escape `\{ \} \( \) \/ \\`
//! 2. parameter `{name}` / `{name?}` with a lower-case name
//! 3. optional text `(...)`, non-empty, up to the first `)`
//! 4. alternation `word/word[/word...]`
//! 5. a run of whitespace
//! 6. a run of anything else except `{`, `\`, `(` and whitespace
//!
//! A position where none applies is a syntax error. Adjacent literal pieces
//! are merged as they are produced.

#include "cuke/expression/expression.hpp"

#include <type_traits>

namespace cuke::expression {

namespace {

constexpr std::string_view ESCAPABLE = "{}()/\\";

auto is_pattern_whitespace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n';
}

auto ends_alternative(char c) -> bool {
    return c == '/' || c == '\\' || c == '{' || c == '(' || c == ')' || is_pattern_whitespace(c);
}

auto ends_literal(char c) -> bool {
    return c == '{' || c == '\\' || c == '(' || is_pattern_whitespace(c);
}

auto is_type_name_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || c == '_';
}

void append_literal(std::vector<Node>& nodes, std::string_view text) {
    if (!nodes.empty()) {
        if (auto* last = std::get_if<LiteralNode>(&nodes.back())) {
            last->text += text;
            return;
        }
    }
    nodes.emplace_back(LiteralNode{std::string(text)});
}

class PatternScanner {
public:
    explicit PatternScanner(std::string_view pattern) : pattern_(pattern) {}

    auto scan() -> Result<std::vector<Node>, CompileError> {
        while (pos_ < pattern_.size()) {
            char c = pattern_[pos_];

            if (c == '\\') {
                if (pos_ + 1 >= pattern_.size() ||
                    ESCAPABLE.find(pattern_[pos_ + 1]) == std::string_view::npos) {
                    return malformed(pos_, pattern_.substr(pos_, 2),
                                     "an escape sequence (\\{ \\} \\( \\) \\/ \\\\)");
                }
                append_literal(nodes_, pattern_.substr(pos_ + 1, 1));
                pos_ += 2;
                continue;
            }

            if (c == '{') {
                auto error = scan_parameter();
                if (error) {
                    return std::move(*error);
                }
                continue;
            }

            if (c == '(') {
                size_t close = pattern_.find(')', pos_ + 1);
                if (close == std::string_view::npos || close == pos_ + 1) {
                    return malformed(pos_, pattern_.substr(pos_),
                                     "non-empty optional text closed by ')'");
                }
                nodes_.emplace_back(
                    OptionalTextNode{std::string(pattern_.substr(pos_ + 1, close - pos_ - 1))});
                pos_ = close + 1;
                continue;
            }

            if (scan_alternation()) {
                continue;
            }

            size_t start = pos_;
            if (is_pattern_whitespace(c)) {
                while (pos_ < pattern_.size() && is_pattern_whitespace(pattern_[pos_])) {
                    ++pos_;
                }
            } else {
                while (pos_ < pattern_.size() && !ends_literal(pattern_[pos_])) {
                    ++pos_;
                }
            }
            append_literal(nodes_, pattern_.substr(start, pos_ - start));
        }

        return std::move(nodes_);
    }

private:
    std::string_view pattern_;
    size_t pos_ = 0;
    std::vector<Node> nodes_;

    auto malformed(size_t offset, std::string_view fragment, std::string_view expected) const
        -> CompileError {
        return CompileError{.kind = CompileErrorKind::MalformedSyntax,
                            .message = "Malformed expression at offset " +
                                       std::to_string(offset) + ": expected " +
                                       std::string(expected),
                            .pattern = std::string(pattern_),
                            .offset = offset,
                            .fragment = std::string(fragment)};
    }

    auto scan_parameter() -> std::optional<CompileError> {
        size_t start = pos_;
        size_t end = start + 1;
        while (end < pattern_.size() && is_type_name_char(pattern_[end])) {
            ++end;
        }
        std::string_view name = pattern_.substr(start + 1, end - start - 1);

        bool optional = end < pattern_.size() && pattern_[end] == '?';
        if (optional) {
            ++end;
        }

        if (name.empty() || end >= pattern_.size() || pattern_[end] != '}') {
            size_t close = pattern_.find('}', start);
            auto fragment = pattern_.substr(start, close == std::string_view::npos
                                                       ? std::string_view::npos
                                                       : close - start + 1);
            return malformed(start, fragment, "a parameter like {int} or {int?}");
        }

        auto kind = find_parameter_kind(name);
        if (!kind) {
            return CompileError{.kind = CompileErrorKind::UnknownParameterType,
                                .message = "Unknown parameter type: " + std::string(name),
                                .pattern = std::string(pattern_),
                                .offset = start,
                                .fragment = std::string(name)};
        }

        nodes_.emplace_back(ParameterNode{std::string(name), *kind, optional});
        pos_ = end + 1;
        return std::nullopt;
    }

    auto alternative_end(size_t from) const -> size_t {
        while (from < pattern_.size() && !ends_alternative(pattern_[from])) {
            ++from;
        }
        return from;
    }

    auto scan_alternation() -> bool {
        size_t end = alternative_end(pos_);
        if (end == pos_ || end >= pattern_.size() || pattern_[end] != '/') {
            return false;
        }

        std::vector<std::string> options{std::string(pattern_.substr(pos_, end - pos_))};
        while (end < pattern_.size() && pattern_[end] == '/') {
            size_t next = alternative_end(end + 1);
            if (next == end + 1) {
                break;
            }
            options.emplace_back(pattern_.substr(end + 1, next - end - 1));
            end = next;
        }

        if (options.size() < 2) {
            return false;
        }

        nodes_.emplace_back(AlternationNode{std::move(options)});
        pos_ = end;
        return true;
    }
};

} // namespace

auto compile(std::string_view pattern) -> Result<CompiledExpression, CompileError> {
    PatternScanner scanner(pattern);
    auto nodes = scanner.scan();
    if (is_err(nodes))
        return unwrap_err(nodes);

    return CompiledExpression(std::string(pattern), std::move(unwrap(nodes)));
}

auto CompiledExpression::parameter_count() const -> size_t {
    size_t count = 0;
    for (const auto& node : nodes_) {
        if (std::holds_alternative<ParameterNode>(node)) {
            ++count;
        }
    }
    return count;
}

auto node_to_string(const Node& node) -> std::string {
    return std::visit(
        [](const auto& n) -> std::string {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, LiteralNode>) {
                return "\"" + n.text + "\"";
            } else if constexpr (std::is_same_v<T, ParameterNode>) {
                return "{" + n.type_name + (n.optional ? "?}" : "}");
            } else if constexpr (std::is_same_v<T, OptionalTextNode>) {
                return "(" + n.text + ")";
            } else {
                std::string joined;
                for (const auto& option : n.options) {
                    if (!joined.empty()) {
                        joined += '/';
                    }
                    joined += option;
                }
                return joined;
            }
        },
        node);
}

auto CompileError::to_string() const -> std::string {
    return message + "\n  " + pattern + "\n  " + std::string(offset, ' ') + "^\n";
}

} // namespace cuke::expression
