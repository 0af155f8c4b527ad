//! # Diagnostic Rendering
//!
//! Implements the rustc-style error output used by every command.

#include "cli/diagnostic.hpp"

#include "cuke/expression/parameter_type.hpp"
#include "cuke/gherkin/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <unistd.h>

namespace cuke::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

auto terminal_supports_colors() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }

    const char* term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    return std::string_view(term) != "dumb";
}

auto get_diagnostic_emitter() -> DiagnosticEmitter& {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// Error Code Mapping
// ============================================================================

auto error_code_for(gherkin::ParseErrorKind kind) -> const char* {
    using gherkin::ParseErrorKind;
    switch (kind) {
    case ParseErrorKind::UnexpectedLine:
        return ErrorCodes::UNEXPECTED_LINE;
    case ParseErrorKind::MissingFeature:
        return ErrorCodes::MISSING_FEATURE;
    case ParseErrorKind::MalformedTag:
        return ErrorCodes::MALFORMED_TAG;
    case ParseErrorKind::MalformedTable:
        return ErrorCodes::MALFORMED_TABLE;
    case ParseErrorKind::EmptyExamplesTable:
        return ErrorCodes::EMPTY_EXAMPLES;
    case ParseErrorKind::UnterminatedDocString:
        return ErrorCodes::UNTERMINATED_DOC_STRING;
    case ParseErrorKind::OutlineWithoutExamples:
        return ErrorCodes::OUTLINE_WITHOUT_EXAMPLES;
    case ParseErrorKind::ConflictingStepArgument:
        return ErrorCodes::CONFLICTING_ARGUMENT;
    }
    return ErrorCodes::UNEXPECTED_LINE;
}

auto error_code_for(expression::CompileErrorKind kind) -> const char* {
    switch (kind) {
    case expression::CompileErrorKind::UnknownParameterType:
        return ErrorCodes::UNKNOWN_PARAMETER_TYPE;
    case expression::CompileErrorKind::MalformedSyntax:
        return ErrorCodes::MALFORMED_EXPRESSION;
    }
    return ErrorCodes::MALFORMED_EXPRESSION;
}

auto severity_name(DiagnosticSeverity severity) -> std::string_view {
    switch (severity) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    }
    return "unknown";
}

// ============================================================================
// Diagnostic Construction
// ============================================================================

namespace {

auto first_word(std::string_view text) -> std::string_view {
    size_t end = 0;
    while (end < text.size() && !gherkin::is_horizontal_space(text[end])) {
        ++end;
    }
    return text.substr(0, end);
}

auto clamp_width(size_t width) -> uint32_t {
    return static_cast<uint32_t>(std::max<size_t>(width, 1));
}

} // namespace

auto make_diagnostic(const gherkin::ParseError& error, const std::string& file) -> Diagnostic {
    using gherkin::ParseErrorKind;

    Diagnostic diag{.severity = DiagnosticSeverity::Error,
                    .code = error_code_for(error.kind),
                    .message = error.message,
                    .file = file,
                    .line = error.line,
                    .column = error.column,
                    .length = 1,
                    .label = {},
                    .notes = {},
                    .help = {}};

    switch (error.kind) {
    case ParseErrorKind::UnexpectedLine: {
        std::string_view word = first_word(error.found);
        diag.length = clamp_width(word.size());
        // Short words sit within two edits of `*` and `And`
        std::string similar =
            word.size() >= 3 ? find_similar(word, gherkin::step_keywords()) : std::string{};
        if (!similar.empty() && similar != word) {
            diag.help.push_back("did you mean `" + similar + "`?");
        }
        break;
    }
    case ParseErrorKind::MissingFeature:
        diag.length = clamp_width(first_word(error.found).size());
        diag.help.push_back("a feature file starts with `Feature: <name>`, optionally after tags");
        break;
    case ParseErrorKind::MalformedTag:
        diag.label = "invalid tag";
        break;
    case ParseErrorKind::MalformedTable:
        diag.length = clamp_width(error.found.size());
        break;
    case ParseErrorKind::EmptyExamplesTable:
        diag.help.push_back("add a header row such as `| name | value |`");
        break;
    case ParseErrorKind::UnterminatedDocString:
        diag.length = 3;
        diag.label = "opened here";
        break;
    case ParseErrorKind::OutlineWithoutExamples:
        diag.length = clamp_width(error.found.size());
        diag.help.push_back("add an `Examples:` table after the outline steps");
        break;
    case ParseErrorKind::ConflictingStepArgument:
        diag.label = "second argument";
        diag.notes.push_back("a step carries at most one doc string or data table");
        break;
    }
    return diag;
}

auto make_diagnostic(const expression::CompileError& error, const std::string& file,
                     uint32_t line, uint32_t indent) -> Diagnostic {
    Diagnostic diag{.severity = DiagnosticSeverity::Error,
                    .code = error_code_for(error.kind),
                    .message = error.message,
                    .file = file,
                    .line = line,
                    .column = static_cast<uint32_t>(indent + error.offset + 1),
                    .length = 1,
                    .label = {},
                    .notes = {},
                    .help = {}};

    if (error.kind == expression::CompileErrorKind::UnknownParameterType) {
        // Underline the braces too
        diag.length = clamp_width(error.fragment.size() + 2);
        diag.label = "unknown type";
        std::string similar = find_similar(error.fragment, expression::parameter_type_names());
        if (!similar.empty()) {
            diag.help.push_back("did you mean `{" + similar + "}`?");
        }

        std::string known;
        for (auto name : expression::parameter_type_names()) {
            if (!known.empty()) {
                known += ", ";
            }
            known += "{" + std::string(name) + "}";
        }
        diag.notes.push_back("available parameter types: " + known);
    } else {
        diag.length = clamp_width(error.fragment.size());
    }
    return diag;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, std::string content) {
    source_files_[path] = std::move(content);
}

auto DiagnosticEmitter::get_source_line(std::string_view path, uint32_t line) const
    -> std::string {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0) {
        return "";
    }

    const std::string& content = it->second;
    uint32_t current_line = 1;
    size_t line_start = 0;
    while (current_line < line) {
        size_t newline = content.find('\n', line_start);
        if (newline == std::string::npos) {
            return "";
        }
        line_start = newline + 1;
        ++current_line;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos) {
        line_end = content.size();
    }
    if (line_end > line_start && content[line_end - 1] == '\r') {
        --line_end;
    }
    return content.substr(line_start, line_end - line_start);
}

auto DiagnosticEmitter::color(const char* code) const -> const char* {
    return use_colors_ ? code : "";
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        warning_count_++;
    }

    emit_header(diag);
    emit_source_snippet(diag);
    emit_notes(diag);
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    const char* sev_color = Colors::BrightCyan;
    if (diag.severity == DiagnosticSeverity::Error) {
        sev_color = Colors::BrightRed;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        sev_color = Colors::BrightYellow;
    }

    out_ << color(Colors::Bold) << color(sev_color) << severity_name(diag.severity);
    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const Diagnostic& diag) {
    if (diag.file.empty() || diag.line == 0) {
        return;
    }

    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.file << ":"
         << diag.line << ":" << diag.column << "\n";

    std::string source_line = get_source_line(diag.file, diag.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = static_cast<int>(std::to_string(diag.line).size());

    out_ << color(Colors::BrightBlue) << std::setw(line_width + 1) << "" << " |"
         << color(Colors::Reset) << "\n";
    out_ << color(Colors::BrightBlue) << " " << std::setw(line_width) << diag.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Tabs are kept in the padding so the caret lines up with the text above.
    uint32_t start_col = diag.column > 0 ? diag.column - 1 : 0;
    std::string padding;
    for (uint32_t i = 0; i < start_col; ++i) {
        padding += (i < source_line.size() && source_line[i] == '\t') ? '\t' : ' ';
    }

    out_ << color(Colors::BrightBlue) << std::setw(line_width + 1) << "" << " | "
         << color(Colors::Reset) << padding << color(Colors::BrightRed)
         << std::string(diag.length, '^');
    if (!diag.label.empty()) {
        out_ << " " << diag.label;
    }
    out_ << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_notes(const Diagnostic& diag) {
    for (const auto& note : diag.notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
    for (const auto& h : diag.help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

// ============================================================================
// Levenshtein Distance
// ============================================================================

auto levenshtein_distance(std::string_view a, std::string_view b) -> size_t {
    const size_t m = a.size();
    const size_t n = b.size();

    if (m == 0) {
        return n;
    }
    if (n == 0) {
        return m;
    }

    // Two rows are enough
    std::vector<size_t> prev(n + 1);
    std::vector<size_t> curr(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= n; ++j) {
            auto ca = std::tolower(static_cast<unsigned char>(a[i - 1]));
            auto cb = std::tolower(static_cast<unsigned char>(b[j - 1]));
            size_t cost = (ca == cb) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }

    return prev[n];
}

auto find_similar(std::string_view name, const std::vector<std::string_view>& candidates,
                  size_t max_distance) -> std::string {
    std::string best;
    size_t best_distance = max_distance + 1;

    for (auto candidate : candidates) {
        size_t len_diff = name.size() > candidate.size() ? name.size() - candidate.size()
                                                         : candidate.size() - name.size();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(name, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best = std::string(candidate);
        }
    }

    return best;
}

} // namespace cuke::cli
