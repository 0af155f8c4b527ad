//! # Parameter Sub-Parsers
//!
//! One function per parameter kind, registered in `PARAMETER_TYPES`.
//! Lookup by name happens once, when a pattern is compiled.

#include "cuke/expression/parameter_type.hpp"

#include <array>
#include <charconv>

namespace cuke::expression {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_whitespace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n';
}

auto is_atom_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || is_digit(c) || c == '_' ||
           c == '@';
}

/// Length of an optional sign followed by at least one digit, 0 if absent.
auto signed_digits_length(std::string_view text) -> size_t {
    size_t i = (!text.empty() && (text[0] == '-' || text[0] == '+')) ? 1 : 0;
    size_t digits_start = i;
    while (i < text.size() && is_digit(text[i])) {
        ++i;
    }
    return i == digits_start ? 0 : i;
}

/// std::from_chars rejects a leading '+', so it is skipped here.
template <typename T> auto convert_number(std::string_view text) -> std::optional<T> {
    std::string_view digits = text.starts_with('+') ? text.substr(1) : text;
    T value{};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_string(std::string_view text) -> std::optional<ParsedValue> {
    if (text.empty() || text[0] != '"') {
        return std::nullopt;
    }

    std::string out;
    size_t i = 1;
    while (i < text.size()) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
            out += text[i + 1];
            i += 2;
        } else if (c == '"') {
            return ParsedValue{.value = std::move(out), .consumed = i + 1};
        } else {
            out += c;
            ++i;
        }
    }
    return std::nullopt;
}

auto parse_int(std::string_view text) -> std::optional<ParsedValue> {
    size_t length = signed_digits_length(text);
    if (length == 0) {
        return std::nullopt;
    }
    auto value = convert_number<int64_t>(text.substr(0, length));
    if (!value) {
        return std::nullopt;
    }
    return ParsedValue{.value = *value, .consumed = length};
}

auto parse_float(std::string_view text) -> std::optional<ParsedValue> {
    size_t length = signed_digits_length(text);
    if (length == 0 || length >= text.size() || text[length] != '.') {
        return std::nullopt;
    }

    size_t end = length + 1;
    while (end < text.size() && is_digit(text[end])) {
        ++end;
    }
    if (end == length + 1) {
        return std::nullopt;
    }

    auto value = convert_number<double>(text.substr(0, end));
    if (!value) {
        return std::nullopt;
    }
    return ParsedValue{.value = *value, .consumed = end};
}

auto parse_word(std::string_view text) -> std::optional<ParsedValue> {
    size_t end = 0;
    while (end < text.size() && !is_whitespace(text[end])) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    return ParsedValue{.value = std::string(text.substr(0, end)), .consumed = end};
}

auto parse_atom(std::string_view text) -> std::optional<ParsedValue> {
    size_t end = 0;
    while (end < text.size() && is_atom_char(text[end])) {
        ++end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    return ParsedValue{.value = Atom{std::string(text.substr(0, end))}, .consumed = end};
}

using SubParser = std::optional<ParsedValue> (*)(std::string_view);

struct ParameterTypeEntry {
    std::string_view name;
    ParameterKind kind;
    SubParser parse;
};

constexpr std::array<ParameterTypeEntry, 5> PARAMETER_TYPES = {{
    {"string", ParameterKind::String, parse_string},
    {"int", ParameterKind::Int, parse_int},
    {"float", ParameterKind::Float, parse_float},
    {"word", ParameterKind::Word, parse_word},
    {"atom", ParameterKind::Atom, parse_atom},
}};

auto entry_for(ParameterKind kind) -> const ParameterTypeEntry& {
    for (const auto& entry : PARAMETER_TYPES) {
        if (entry.kind == kind) {
            return entry;
        }
    }
    return PARAMETER_TYPES.front();
}

} // namespace

auto find_parameter_kind(std::string_view name) -> std::optional<ParameterKind> {
    for (const auto& entry : PARAMETER_TYPES) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

auto parameter_kind_name(ParameterKind kind) -> std::string_view {
    return entry_for(kind).name;
}

auto parameter_type_names() -> std::vector<std::string_view> {
    std::vector<std::string_view> names;
    for (const auto& entry : PARAMETER_TYPES) {
        names.push_back(entry.name);
    }
    return names;
}

auto parse_parameter(ParameterKind kind, std::string_view text) -> std::optional<ParsedValue> {
    return entry_for(kind).parse(text);
}

} // namespace cuke::expression
