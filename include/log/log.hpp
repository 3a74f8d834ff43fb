//! # jcodec Logging
//!
//! Diagnostics for the codec modules. Records carry a level, a dotted
//! module tag (`json.tokenizer`, `json.parser`) and a message, and are
//! dispatched to the sinks registered with the `Logger` singleton.
//!
//! ## Filtering
//!
//! Module rules follow the tag hierarchy: a rule for `json` covers
//! `json.parser` and `json.tokenizer` unless a longer rule matches first.
//!
//! | Filter string | Effect |
//! |---------------|--------|
//! | `debug` | Every module at Debug and above |
//! | `json=trace,*=off` | Only the codec modules, at every level |
//! | `json.parser=debug,*=warn` | Parser at Debug, everything else at Warn |
//!
//! The logger starts without sinks, so the library stays silent until a
//! host program calls `Logger::init`. Messages below `JCODEC_MIN_LOG_LEVEL`
//! are removed at compile time.
//!
//! ## Usage
//!
//! ```cpp
//! Logger::init(log_config_from_env());
//! JCODEC_LOG_DEBUG("json.parser", "duplicate key '" << key << "'");
//! ```

#ifndef JCODEC_LOG_HPP
#define JCODEC_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace jcodec::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order. `Off` is only a threshold.
enum class LogLevel : uint8_t { Trace, Debug, Info, Warn, Error, Fatal, Off };

/// Returns the upper-case name of a level (e.g., "TRACE", "WARN").
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. `warning` is accepted for `Warn`.
///
/// Returns `LogLevel::Info` if the name is not recognized.
[[nodiscard]] auto parse_level(std::string_view name) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;  ///< Dotted tag, e.g. "json.parser"
    std::string message;
    const char* file = "";    ///< Source file (__FILE__)
    int line = 0;             ///< Source line (__LINE__)
    int64_t timestamp_ms = 0; ///< Milliseconds since the Unix epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Parses a format name, ignoring case: `json` selects `LogFormat::JSON`,
/// anything else `LogFormat::Text`.
[[nodiscard]] auto parse_format(std::string_view name) -> LogFormat;

/// Renders a record as `"HH:MM:SS.mmm LEVEL [module] message"`, the level
/// padded to five characters.
[[nodiscard]] auto format_text(const LogRecord& record) -> std::string;

/// Renders a record as a single-line JSON object with the keys `level`,
/// `module`, `msg` and `ts`.
///
/// The line is produced by the codec's own generator, so keys come out
/// sorted and the message is escaped like any other JSON string.
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

/// Formats the local wall-clock time of `timestamp_ms` as `HH:MM:SS.mmm`.
[[nodiscard]] auto format_clock(int64_t timestamp_ms) -> std::string;

/// Returns the current time in milliseconds since the Unix epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
///
/// The `Logger` serializes calls to `write` and `flush`; sinks need no
/// locking of their own.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Writes one record.
    virtual void write(const LogRecord& record) = 0;

    /// Flushes any buffered output.
    virtual void flush() = 0;
};

/// A sink that renders records in a selectable `LogFormat`.
class FormattedSink : public LogSink {
public:
    void set_format(LogFormat format) { format_ = format; }

    [[nodiscard]] auto format() const -> LogFormat { return format_; }

protected:
    /// Renders `record` in the current format, without a trailing newline.
    [[nodiscard]] auto render(const LogRecord& record) const -> std::string;

private:
    LogFormat format_ = LogFormat::Text;
};

/// Writes records to a stream, stderr by default.
///
/// In text format the level name can be colored with ANSI escapes.
class ConsoleSink : public FormattedSink {
public:
    /// Writes to stderr. Colors are used only when stderr is a terminal.
    explicit ConsoleSink(bool use_colors = true);

    /// Writes to `out`, which must outlive the sink. Colors are used
    /// exactly when `use_colors` is set.
    ConsoleSink(std::ostream& out, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    bool colors_;
};

/// Appends records to a file, one per line.
///
/// Error and Fatal records are flushed immediately.
class FileSink : public FormattedSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool { return file_.is_open(); }

private:
    std::ofstream file_;
};

/// Discards all records.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level thresholds.
///
/// # Format
///
/// A comma-separated list of `module=level` entries. `*=level` sets the
/// default threshold; a bare `module` enables that module at Trace.
/// Whitespace around names is ignored.
///
/// # Matching
///
/// A module uses the rule of its longest dotted prefix that has one
/// (`json.parser`, then `json`), otherwise the default.
class LogFilter {
public:
    explicit LogFilter(LogLevel default_level = LogLevel::Info) : default_level_(default_level) {}

    /// Replaces the module rules with those in `spec`.
    void parse(std::string_view spec);

    /// Returns the threshold that applies to `module`.
    [[nodiscard]] auto level_for(std::string_view module) const -> LogLevel;

    /// Returns `true` if a record at `level` from `module` passes.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool {
        return level >= level_for(module);
    }

    void set_default_level(LogLevel level) { default_level_ = level; }

    [[nodiscard]] auto default_level() const -> LogLevel { return default_level_; }

    /// Returns the lowest threshold across the default and every rule.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_;
    std::map<std::string, LogLevel, std::less<>> rules_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for `Logger::init`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Default threshold
    LogFormat format = LogFormat::Text; ///< Format for every sink
    std::string filter_spec;            ///< Module rules, see `LogFilter`
    std::string log_file;               ///< Log file path; empty for none
    bool console = true;                ///< Write to stderr
    bool colors = true;                 ///< Color console output on terminals
};

/// Builds a `LogConfig` from the environment.
///
/// - `JCODEC_LOG`: a level name, or module rules when it contains `=` or `,`
/// - `JCODEC_LOG_FILE`: path of a log file
/// - `JCODEC_LOG_FORMAT`: `json` or `text`
[[nodiscard]] auto log_config_from_env() -> LogConfig;

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
///
/// Owns the sinks and the module filter. `should_log` first compares
/// against the lowest enabled threshold without locking, so disabled
/// records cost one atomic load.
class Logger {
public:
    /// Replaces sinks and filter with those described by `config`.
    static void init(const LogConfig& config);

    /// Returns the global logger.
    static auto instance() -> Logger&;

    /// Returns `true` if a record at `level` from `module` would be written.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    /// Writes `record` to every sink.
    void log(const LogRecord& record);

    /// Builds a timestamped record and writes it to every sink.
    void log(LogLevel level, std::string_view module, std::string message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink and restores the Warn threshold.
    void reset();

    /// Sets the default threshold, keeping module rules.
    void set_level(LogLevel level);

    /// Returns the lowest threshold any module is logged at.
    [[nodiscard]] auto level() const -> LogLevel {
        return threshold_.load(std::memory_order_relaxed);
    }

    /// Replaces the module rules.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    /// Recomputes `threshold_` from the filter. Requires `mutex_`.
    void refresh_threshold();

    std::atomic<LogLevel> threshold_{LogLevel::Warn};
    LogFilter filter_{LogLevel::Warn};
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum level: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error,
// 5=Fatal, 6=Off.
#ifndef JCODEC_MIN_LOG_LEVEL
#define JCODEC_MIN_LOG_LEVEL 0
#endif

/// Internal macro, not for direct use.
///
/// `msg` is a stream expression and is only evaluated when the record
/// passes the filter.
#define JCODEC_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= JCODEC_MIN_LOG_LEVEL) {                                     \
            auto& jcodec_logger_ = ::jcodec::log::Logger::instance();                              \
            if (jcodec_logger_.should_log(level, module_str)) {                                    \
                std::ostringstream jcodec_msg_;                                                    \
                jcodec_msg_ << msg;                                                                \
                jcodec_logger_.log(level, module_str, jcodec_msg_.str(), __FILE__, __LINE__);      \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Logs a trace-level message.
/// Usage: JCODEC_LOG_TRACE("module", "message " << value);
#define JCODEC_LOG_TRACE(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Trace, module, msg)

/// Logs a debug-level message.
#define JCODEC_LOG_DEBUG(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Debug, module, msg)

/// Logs an info-level message.
#define JCODEC_LOG_INFO(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Info, module, msg)

/// Logs a warning-level message.
#define JCODEC_LOG_WARN(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Warn, module, msg)

/// Logs an error-level message.
#define JCODEC_LOG_ERROR(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Error, module, msg)

/// Logs a fatal-level message.
#define JCODEC_LOG_FATAL(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Fatal, module, msg)

} // namespace jcodec::log

#endif // JCODEC_LOG_HPP
