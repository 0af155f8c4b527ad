#include "cuke/expression/value.hpp"

#include <array>
#include <charconv>
#include <type_traits>

namespace cuke::expression {

namespace {

auto format_double(double value) -> std::string {
    std::array<char, 32> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    std::string text(buffer.data(), end);
    // Keep floats recognizable: 20.0 prints as "20.0", not "20".
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto quote(const std::string& text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

auto value_type_name(const Value& value) -> std::string_view {
    return std::visit(
        [](const auto& v) -> std::string_view {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return "int";
            } else if constexpr (std::is_same_v<T, double>) {
                return "float";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else {
                return "atom";
            }
        },
        value);
}

auto value_to_string(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(v);
            } else {
                return ":" + v.name;
            }
        },
        value);
}

} // namespace cuke::expression
