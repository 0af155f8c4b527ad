//! # Structured Logging
//!
//! Module-tagged logging used at the edges of cuke: feature file loading,
//! outline expansion, the step registry and the command-line front end.
//! The parser, the expression compiler and the matcher never log.
//!
//! ```cpp
//! CUKE_LOG_INFO("gherkin", "Loaded " << path << " (" << bytes << " bytes)");
//! CUKE_LOG_DEBUG("registry", "Registered step pattern '" << pattern << "'");
//! ```

#ifndef CUKE_LOG_LOG_HPP
#define CUKE_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cuke::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
auto level_name(LogLevel level) -> const char*;

/// Parses a level name in lower or upper case.
/// Unrecognized names map to `LogLevel::Info`.
auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "gherkin", "registry")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Formatter
// ============================================================================

/// Template engine for text log lines.
///
/// Recognized tokens: {time}, {time_ms}, {level}, {module}, {message},
/// {file}, {line}. Unknown tokens are copied through unchanged.
class LogFormatter {
public:
    explicit LogFormatter(std::string_view format_template = "{time} {level} [{module}] {message}");

    [[nodiscard]] auto format(const LogRecord& record) const -> std::string;

    void set_template(std::string_view format_template);

    [[nodiscard]] auto get_template() const -> const std::string& {
        return template_;
    }

private:
    std::string template_;
};

/// Serializes a record as a single-line JSON object (without newline).
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;

    void set_format(LogFormat format) {
        format_ = format;
    }

    void set_formatter(LogFormatter formatter) {
        formatter_ = std::move(formatter);
    }

protected:
    /// Renders a record according to the sink's format.
    [[nodiscard]] auto render(const LogRecord& record) const -> std::string;

    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;
};

/// Writes to stderr, with ANSI level colors when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }

private:
    bool colors_enabled_;
};

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans records out to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    [[nodiscard]] auto size() const -> size_t {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter parsed from "gherkin=debug,registry=trace,*=warn".
///
/// A bare module name without "=level" enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Logger configuration, usually produced by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty for no file output
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Records are dispatched to the sinks under a mutex.
class Logger {
public:
    /// Replaces the sinks and levels of the global logger.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast check used by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Returns the current wall-clock time as "HH:MM:SS.mmm".
[[nodiscard]] auto get_timestamp() -> std::string;

/// Milliseconds since the Unix epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv and -q
/// from argv. CUKE_LOG is consulted when neither a level nor a filter is given.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

// ============================================================================
// Logging Macros
// ============================================================================

// Messages below this level are compiled out.
// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef CUKE_MIN_LOG_LEVEL
#define CUKE_MIN_LOG_LEVEL 0
#endif

#define CUKE_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= CUKE_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::cuke::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define CUKE_LOG_TRACE(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Trace, module, msg)
#define CUKE_LOG_DEBUG(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Debug, module, msg)
#define CUKE_LOG_INFO(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Info, module, msg)
#define CUKE_LOG_WARN(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Warn, module, msg)
#define CUKE_LOG_ERROR(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Error, module, msg)
#define CUKE_LOG_FATAL(module, msg) CUKE_LOG_IMPL(::cuke::log::LogLevel::Fatal, module, msg)

} // namespace cuke::log

#endif // CUKE_LOG_LOG_HPP
