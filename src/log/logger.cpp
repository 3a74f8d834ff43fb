//! # Logger Implementation
//!
//! Level names, record formats, the sinks, module filtering and the
//! `Logger` singleton. JSON lines are built as `JsonValue` objects and
//! written by the codec's generator.

#include "log/log.hpp"

#include "json/json_generator.hpp"
#include "json/json_value.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace jcodec::log {

namespace {

struct LevelEntry {
    std::string_view lower;
    const char* upper;
    LogLevel level;
};

constexpr std::array<LevelEntry, 7> LEVELS = {{
    {"trace", "TRACE", LogLevel::Trace},
    {"debug", "DEBUG", LogLevel::Debug},
    {"info", "INFO", LogLevel::Info},
    {"warn", "WARN", LogLevel::Warn},
    {"error", "ERROR", LogLevel::Error},
    {"fatal", "FATAL", LogLevel::Fatal},
    {"off", "OFF", LogLevel::Off},
}};

auto equals_lower(std::string_view text, std::string_view lower) -> bool {
    if (text.size() != lower.size()) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != lower[i]) {
            return false;
        }
    }
    return true;
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

/// Level name padded to five columns.
auto padded_level(LogLevel level) -> std::string {
    std::string name = level_name(level);
    if (name.size() < 5) {
        name.resize(5, ' ');
    }
    return name;
}

auto level_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        break;
    }
    return "";
}

/// Detects if stderr supports ANSI color codes.
auto stderr_has_colors() -> bool {
#ifdef _WIN32
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    if (handle == INVALID_HANDLE_VALUE) {
        return false;
    }
    DWORD mode = 0;
    if (!GetConsoleMode(handle, &mode)) {
        return false;
    }
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

} // namespace

// ============================================================================
// Levels and Formats
// ============================================================================

auto level_name(LogLevel level) -> const char* {
    for (const auto& entry : LEVELS) {
        if (entry.level == level) {
            return entry.upper;
        }
    }
    return "???";
}

auto parse_level(std::string_view name) -> LogLevel {
    name = trim(name);
    if (equals_lower(name, "warning")) {
        return LogLevel::Warn;
    }
    for (const auto& entry : LEVELS) {
        if (equals_lower(name, entry.lower)) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

auto parse_format(std::string_view name) -> LogFormat {
    return equals_lower(trim(name), "json") ? LogFormat::JSON : LogFormat::Text;
}

auto format_clock(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    auto millis = static_cast<int>(timestamp_ms % 1000);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min,
                  tm_buf.tm_sec, millis);
    return buf;
}

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto format_text(const LogRecord& record) -> std::string {
    std::string out = format_clock(record.timestamp_ms);
    out += ' ';
    out += padded_level(record.level);
    out += " [";
    out += record.module;
    out += "] ";
    out += record.message;
    return out;
}

auto format_json(const LogRecord& record) -> std::string {
    auto line = json::json_object();
    line.set("level", json::JsonValue(level_name(record.level)));
    line.set("module", json::JsonValue(record.module));
    line.set("msg", json::JsonValue(record.message));
    line.set("ts", json::JsonValue(static_cast<long long>(record.timestamp_ms)));
    return json::stringify(line);
}

// ============================================================================
// Sinks
// ============================================================================

auto FormattedSink::render(const LogRecord& record) const -> std::string {
    return format_ == LogFormat::JSON ? format_json(record) : format_text(record);
}

ConsoleSink::ConsoleSink(bool use_colors)
    : out_(std::cerr), colors_(use_colors && stderr_has_colors()) {}

ConsoleSink::ConsoleSink(std::ostream& out, bool use_colors) : out_(out), colors_(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    if (format() == LogFormat::JSON || !colors_) {
        out_ << render(record) << '\n';
        return;
    }

    out_ << format_clock(record.timestamp_ms) << ' ' << level_color(record.level)
         << padded_level(record.level) << "\033[0m [" << record.module << "] " << record.message
         << '\n';
}

void ConsoleSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << render(record) << '\n';
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
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    rules_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        auto entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            rules_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        auto module = trim(entry.substr(0, eq));
        auto level = parse_level(entry.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else if (!module.empty()) {
            rules_[std::string(module)] = level;
        }
    }
}

auto LogFilter::level_for(std::string_view module) const -> LogLevel {
    while (!module.empty()) {
        auto it = rules_.find(module);
        if (it != rules_.end()) {
            return it->second;
        }
        size_t dot = module.rfind('.');
        if (dot == std::string_view::npos) {
            break;
        }
        module = module.substr(0, dot);
    }
    return default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel lowest = default_level_;
    for (const auto& [module, level] : rules_) {
        if (level < lowest) {
            lowest = level;
        }
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter(config.level);
    if (!config.filter_spec.empty()) {
        // A "*=level" rule overrides config.level.
        logger.filter_.parse(config.filter_spec);
    }
    logger.refresh_threshold();

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

void Logger::refresh_threshold() {
    threshold_.store(filter_.min_level(), std::memory_order_relaxed);
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < threshold_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, std::string message, const char* file,
                 int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();
    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    filter_ = LogFilter(LogLevel::Warn);
    refresh_threshold();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    refresh_threshold();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    refresh_threshold();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace jcodec::log
