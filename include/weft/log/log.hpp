//! # weft Logging
//!
//! Diagnostics emitted by the JSON engine: skipped keys under lenient
//! matching, decode failures, and the open/close lifecycle of file sources
//! and item streams. Everything is tagged with the module `"json"`.
//!
//! The logger starts without sinks, so nothing is printed until the host
//! either calls `init_from_env()` or installs a sink of its own. Records are
//! written as one line each:
//!
//! ```text
//! DEBUG [json] skipping unknown field "extra" in config.json
//! ```
//!
//! ## Usage
//!
//! ```cpp
//! weft::log::init_from_env(); // WEFT_LOG=debug or WEFT_LOG=json=trace,*=warn
//! WEFT_LOG_DEBUG("json", "skipping unknown field \"" << key << "\"");
//! ```

#ifndef WEFT_LOG_HPP
#define WEFT_LOG_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace weft::log {

// ============================================================================
// Levels
// ============================================================================

/// Severity levels in ascending order. `Off` silences a module entirely.
enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Off = 5 };

/// Returns the upper-case name of a level (`"DEBUG"`).
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case.
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<LogLevel>;

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
};

/// Renders a record as `LEVEL [module] message` with a trailing newline.
[[nodiscard]] auto format_line(const LogRecord& record) -> std::string;

/// Destination for log records. Calls are serialized by the `Logger`.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
};

/// Writes each record to stderr.
class StderrSink : public LogSink {
public:
    void write(const LogRecord& record) override;
};

/// Keeps formatted lines in memory, for hosts that surface diagnostics
/// themselves and for tests.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;

    /// Returns a copy of the captured lines.
    [[nodiscard]] auto lines() const -> std::vector<std::string>;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds parsed from specs like `"json=trace,*=warn"`.
///
/// A bare module name enables it at `Trace`; `*` sets the threshold for
/// every module not listed.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest threshold of any module, i.e. the least severe level that can
    /// pass this filter.
    [[nodiscard]] auto lowest_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::vector<std::pair<std::string, LogLevel>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    std::string filter_spec = "*=warn"; ///< Parsed by `LogFilter::parse`
    bool to_stderr = true;              ///< Install a `StderrSink`
};

/// Process-wide logger. Every member is safe to call concurrently.
class Logger {
public:
    static auto instance() -> Logger&;

    /// Replaces the filter and sinks according to `config`.
    void configure(const LogConfig& config);

    /// Cheap check made by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Applies `level` to every module.
    void set_level(LogLevel level);

    /// Replaces the filter with a parsed spec.
    void set_filter(std::string_view spec);

    /// The least severe level any module currently accepts.
    [[nodiscard]] auto level() const -> LogLevel {
        return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
    }

private:
    Logger() = default;

    void apply_filter(LogFilter filter);

    // Mirrors filter_.lowest_level() so rejected levels skip the mutex.
    std::atomic<int> threshold_{static_cast<int>(LogLevel::Warn)};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Environment
// ============================================================================

/// Reads `WEFT_LOG`: a level (`debug`) or a filter spec (`json=trace`).
/// Unset means `*=warn`.
[[nodiscard]] auto config_from_env() -> LogConfig;

/// Shorthand for `Logger::instance().configure(config_from_env())`.
void init_from_env();

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out. 0=Trace ... 5=Off
#ifndef WEFT_MIN_LOG_LEVEL
#define WEFT_MIN_LOG_LEVEL 0
#endif

#define WEFT_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= WEFT_MIN_LOG_LEVEL) {                                       \
            auto& weft_logger_ = ::weft::log::Logger::instance();                                  \
            if (weft_logger_.should_log(level, module_str)) {                                      \
                std::ostringstream weft_oss_;                                                      \
                weft_oss_ << msg;                                                                  \
                weft_logger_.log(level, module_str, weft_oss_.str());                              \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: WEFT_LOG_DEBUG("json", "message " << value);
#define WEFT_LOG_TRACE(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Trace, module, msg)
#define WEFT_LOG_DEBUG(module, msg) WEFT_LOG_IMPL(::weft::log::LogLevel::Debug, module, msg)

} // namespace weft::log

#endif // WEFT_LOG_HPP
