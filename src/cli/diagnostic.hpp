//! # Diagnostic Rendering
//!
//! Formats parse, compile and step errors for the terminal.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category            | Example                          |
//! |--------|---------------------|----------------------------------|
//! | G      | Gherkin parser      | G001 - Unexpected line           |
//! | X      | Cucumber Expression | X001 - Unknown parameter type    |
//! | S      | Step lookup         | S001 - Undefined step            |
//! | E      | Input/output        | E001 - File not readable         |
//!
//! ## Output Shape
//!
//! ```text
//! error[G001]: Expected a step, Scenario:, Scenario Outline: or tags, found 'Gvien ...'
//!   --> cart.feature:4:5
//!    |
//!  4 |     Gvien I have 5 cukes
//!    |     ^^^^^
//!   = help: did you mean `Given`?
//! ```

#pragma once

#include "cuke/expression/expression.hpp"
#include "cuke/gherkin/parser.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cuke::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
// Gherkin parser, one per ParseErrorKind
constexpr const char* UNEXPECTED_LINE = "G001";
constexpr const char* MISSING_FEATURE = "G002";
constexpr const char* MALFORMED_TAG = "G003";
constexpr const char* MALFORMED_TABLE = "G004";
constexpr const char* EMPTY_EXAMPLES = "G005";
constexpr const char* UNTERMINATED_DOC_STRING = "G006";
constexpr const char* OUTLINE_WITHOUT_EXAMPLES = "G007";
constexpr const char* CONFLICTING_ARGUMENT = "G008";

// Cucumber Expressions
constexpr const char* UNKNOWN_PARAMETER_TYPE = "X001";
constexpr const char* MALFORMED_EXPRESSION = "X002";

// Step lookup
constexpr const char* UNDEFINED_STEP = "S001";

// Input/output
constexpr const char* UNREADABLE_FILE = "E001";
} // namespace ErrorCodes

[[nodiscard]] auto error_code_for(gherkin::ParseErrorKind kind) -> const char*;
[[nodiscard]] auto error_code_for(expression::CompileErrorKind kind) -> const char*;

// ============================================================================
// Diagnostic Structure
// ============================================================================

enum class DiagnosticSeverity : uint8_t {
    Error,
    Warning,
    Note,
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;
    std::string message;
    std::string file;       ///< Key into the emitter's registered sources
    uint32_t line = 0;      ///< 1-based, 0 when there is no position
    uint32_t column = 0;    ///< 1-based
    uint32_t length = 1;    ///< Width of the underline
    std::string label;      ///< Text printed after the underline
    std::vector<std::string> notes;
    std::vector<std::string> help;
};

/// Diagnostic for a failed feature parse in `file`.
[[nodiscard]] auto make_diagnostic(const gherkin::ParseError& error, const std::string& file)
    -> Diagnostic;

/// Diagnostic for a rejected pattern. `file` names where the pattern came
/// from and `line` is its 1-based line there. `indent` is the number of
/// bytes before the pattern on that line.
[[nodiscard]] auto make_diagnostic(const expression::CompileError& error, const std::string& file,
                                   uint32_t line, uint32_t indent = 0) -> Diagnostic;

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    /// Registers the text of `path` so snippets can be shown for it.
    void set_source_content(const std::string& path, std::string content);

    void emit(const Diagnostic& diag);

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }

    [[nodiscard]] auto warning_count() const -> size_t {
        return warning_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
    std::map<std::string, std::string, std::less<>> source_files_;

    [[nodiscard]] auto get_source_line(std::string_view path, uint32_t line) const -> std::string;
    [[nodiscard]] auto color(const char* code) const -> const char*;

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const Diagnostic& diag);
    void emit_notes(const Diagnostic& diag);
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] auto terminal_supports_colors() -> bool;

/// Process-wide emitter writing to stderr.
auto get_diagnostic_emitter() -> DiagnosticEmitter&;

[[nodiscard]] auto severity_name(DiagnosticSeverity severity) -> std::string_view;

/// Case-insensitive edit distance.
[[nodiscard]] auto levenshtein_distance(std::string_view a, std::string_view b) -> size_t;

/// Closest candidate within `max_distance` edits, or empty.
[[nodiscard]] auto find_similar(std::string_view name,
                                const std::vector<std::string_view>& candidates,
                                size_t max_distance = 2) -> std::string;

} // namespace cuke::cli
