//! # docmd Logging
//!
//! A small structured logger shared by the renderer and the CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages (`directive`, `markup`, `render`, `cli`)
//! - Output sinks (Console, File, Null, Multi)
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via DOCMD_MIN_LOG_LEVEL
//!
//! Renderer diagnostics are advisory: they are emitted at Debug level and
//! never change what a rendering call returns.
//!
//! ## Usage
//!
//! ```cpp
//! DOCMD_LOG_DEBUG("directive", "Unknown directive `@" << name << "`");
//! DOCMD_LOG_WARN("cli", "Cannot read " << path);
//! ```

#ifndef DOCMD_LOG_HPP
#define DOCMD_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docmd::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
///
/// The renderer only logs at Trace (skipped nodes, unmatched closes) and
/// Debug (unknown directives, markup fallbacks). The CLI uses Warn and Error
/// for unreadable input.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name, ignoring case.
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< "directive", "markup", "render" or "cli"
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text,
    JSON ///< One object per line, for `--log-format=json`
};

/// Writes `record` as a text line: "HH:MM:SS.mmm LEVEL [module] message".
void write_text_record(std::ostream& out, const LogRecord& record, bool colors);

/// Writes `record` as a single-line JSON object.
void write_json_record(std::ostream& out, const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Writes to stderr, which the `docmd` executable keeps free of Markdown
/// output. Colors only when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to the file named by `--log-file`. Error and Fatal records are
/// flushed immediately.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards records.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Fans out log records to several child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "directive=trace,markup=debug,*=warn".
/// A bare module name enables everything from that module.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string, replacing previous module levels.
    void parse(std::string_view spec);

    /// Check if a message at `level` from `module` passes the filter.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// What `parse_log_options()` extracted from the command line.
///
/// `filter_spec` comes from `--log-filter` or `DOCMD_LOG`, `log_file` from
/// `--log-file` and `format` from `--log-format`. `-q` turns `console` off.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe process-wide logger.
///
/// Rendering calls on different threads share this instance; every write is
/// serialized by the internal mutex. Until `init()` is called the logger has
/// no sinks and drops everything.
class Logger {
public:
    /// Replace sinks, level and filter from `config`.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Dispatch a record to all sinks.
    void log(const LogRecord& record);

    /// Build a record for `message` and dispatch it.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
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

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts logging options from argv: --log-level, --log-filter, --log-file,
/// --log-format, -v/-vv/-vvv and -q. Falls back to the DOCMD_LOG environment
/// variable when neither a level nor a filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Define DOCMD_MIN_LOG_LEVEL before including this header to elide calls
// below that level at compile time (0=Trace ... 6=Off).
#ifndef DOCMD_MIN_LOG_LEVEL
#define DOCMD_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define DOCMD_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= DOCMD_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::docmd::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define DOCMD_LOG_TRACE(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Trace, module, msg)
#define DOCMD_LOG_DEBUG(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Debug, module, msg)
#define DOCMD_LOG_INFO(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Info, module, msg)
#define DOCMD_LOG_WARN(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Warn, module, msg)
#define DOCMD_LOG_ERROR(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Error, module, msg)
#define DOCMD_LOG_FATAL(module, msg) DOCMD_LOG_IMPL(::docmd::log::LogLevel::Fatal, module, msg)

} // namespace docmd::log

#endif // DOCMD_LOG_HPP
