//! # Logger Implementation
//!
//! Level names, the one-line record format, the stderr and memory sinks,
//! filter parsing and the process-wide `Logger`.

#include "weft/log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>

namespace weft::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

constexpr std::array<std::pair<LogLevel, std::string_view>, 6> LEVEL_NAMES{{
    {LogLevel::Trace, "TRACE"},
    {LogLevel::Debug, "DEBUG"},
    {LogLevel::Info, "INFO"},
    {LogLevel::Warn, "WARN"},
    {LogLevel::Error, "ERROR"},
    {LogLevel::Off, "OFF"},
}};

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    for (const auto& [value, name] : LEVEL_NAMES) {
        if (value == level) {
            return name.data();
        }
    }
    return "?";
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    for (const auto& [value, text] : LEVEL_NAMES) {
        if (equals_ignore_case(name, text)) {
            return value;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

auto format_line(const LogRecord& record) -> std::string {
    std::string line = level_name(record.level);
    line += " [";
    line += record.module;
    line += "] ";
    line += record.message;
    line += '\n';
    return line;
}

void StderrSink::write(const LogRecord& record) {
    std::cerr << format_line(record);
}

void MemorySink::write(const LogRecord& record) {
    auto line = format_line(record);
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
}

auto MemorySink::lines() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        auto entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        auto module = trim(entry.substr(0, eq));
        LogLevel level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            auto parsed = parse_level(trim(entry.substr(eq + 1)));
            if (!parsed) {
                continue;
            }
            level = *parsed;
        }

        if (module == "*") {
            default_level_ = level;
            continue;
        }
        auto it = std::find_if(modules_.begin(), modules_.end(),
                               [module](const auto& m) { return m.first == module; });
        if (it != modules_.end()) {
            it->second = level;
        } else {
            modules_.emplace_back(std::string(module), level);
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level == LogLevel::Off) {
        return false;
    }
    for (const auto& [name, threshold] : modules_) {
        if (name == module) {
            return level >= threshold;
        }
    }
    return level >= default_level_;
}

auto LogFilter::lowest_level() const -> LogLevel {
    LogLevel lowest = default_level_;
    for (const auto& [_, threshold] : modules_) {
        lowest = std::min(lowest, threshold);
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

void Logger::apply_filter(LogFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_.store(static_cast<int>(filter.lowest_level()), std::memory_order_relaxed);
    filter_ = std::move(filter);
}

void Logger::configure(const LogConfig& config) {
    LogFilter filter;
    filter.parse(config.filter_spec);
    apply_filter(std::move(filter));

    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    if (config.to_stderr) {
        sinks_.push_back(std::make_unique<StderrSink>());
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (static_cast<int>(level) < threshold_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{level, module, std::move(message)};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    LogFilter filter;
    filter.set_default_level(level);
    apply_filter(std::move(filter));
}

void Logger::set_filter(std::string_view spec) {
    LogFilter filter;
    filter.parse(spec);
    apply_filter(std::move(filter));
}

} // namespace weft::log
