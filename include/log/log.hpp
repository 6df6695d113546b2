//! # apidiff Logging
//!
//! Structured logging for every apidiff component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//!   ("zip", "metadata", "surface", "diff", "inspector", "registry", "mcp", "cli")
//! - Multiple output sinks (Console, File, Null, Multi)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via APIDIFF_MIN_LOG_LEVEL
//!
//! Logs always go to stderr or a file; stdout carries results and MCP frames.
//!
//! ## Usage
//!
//! ```cpp
//! APIDIFF_LOG_INFO("inspector", "Comparing " << id << " " << from << " -> " << to);
//! APIDIFF_LOG_WARN("metadata", "Skipping " << path << ": " << err.message);
//! ```

#ifndef APIDIFF_LOG_HPP
#define APIDIFF_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apidiff::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing (table rows, signature blobs)
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Skipped modules, degraded coverage
    Error = 4, ///< Failed requests
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the string name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "metadata", "diff")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

/// Renders a record as one text line: "HH:MM:SS.mmm LEVEL [module] message\n".
std::string format_text_line(const LogRecord& record, bool colors);

/// Renders a record as one JSON line: {"ts":..,"level":..,"module":..,"msg":..}\n.
std::string format_json_line(const LogRecord& record);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
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

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
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

/// Null sink that discards all messages (for tests).
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Multi-sink that fans out log records to multiple child sinks.
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
/// Parses filter strings like "metadata=trace,zip=debug,*=warn" and
/// provides `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level".
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use; call
/// `Logger::init()` to reconfigure.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Replace all sinks with a single one.
    void set_sink(std::unique_ptr<LogSink> sink);

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

/// Returns current time formatted as "HH:MM:SS.mmm".
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

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q.
/// Falls back to the APIDIFF_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef APIDIFF_MIN_LOG_LEVEL
#define APIDIFF_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define APIDIFF_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= APIDIFF_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::apidiff::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define APIDIFF_LOG_TRACE(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Trace, module, msg)
#define APIDIFF_LOG_DEBUG(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Debug, module, msg)
#define APIDIFF_LOG_INFO(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Info, module, msg)
#define APIDIFF_LOG_WARN(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Warn, module, msg)
#define APIDIFF_LOG_ERROR(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Error, module, msg)
#define APIDIFF_LOG_FATAL(module, msg) APIDIFF_LOG_IMPL(::apidiff::log::LogLevel::Fatal, module, msg)

} // namespace apidiff::log

#endif // APIDIFF_LOG_HPP
