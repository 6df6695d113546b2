//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks and LogFilter.

#include "log/log.hpp"

#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define APIDIFF_ISATTY(fd) _isatty(fd)
#define APIDIFF_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define APIDIFF_ISATTY(fd) isatty(fd)
#define APIDIFF_FILENO(f) fileno(f)
#endif

namespace apidiff::log {

// ============================================================================
// Line Formatting
// ============================================================================

static bool detect_terminal_colors() {
    if (!APIDIFF_ISATTY(APIDIFF_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

static const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

std::string format_text_line(const LogRecord& record, bool colors) {
    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (colors) {
        oss << level_color(record.level);
    }
    // Pad level name to 5 chars for alignment
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";
    return oss.str();
}

std::string format_json_line(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ","
        << "\"level\":\"" << level_name(record.level) << "\","
        << "\"module\":\"" << record.module << "\","
        << "\"msg\":\"";

    for (char c : record.message) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }

    oss << "\"}\n";
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << format_json_line(record);
    } else {
        std::cerr << format_text_line(record, colors_enabled_);
    }
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json_line(record)
                                         : format_text_line(record, false));

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MultiSink
// ============================================================================

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>(true));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        // The fast path must not reject what a per-module override accepts.
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_ = LogFilter{};
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace apidiff::log
