#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>

namespace gpo {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5, Off = 6 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF  ";
    default:
        return "?????";
    }
}

/**
 * Parse a level name as used in config files and on the command line.
 * Throws std::invalid_argument for unknown names.
 */
inline LogLevel parse_level(const std::string& name) {
    if (name == "trace")
        return LogLevel::Trace;
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn" || name == "warning")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    if (name == "fatal")
        return LogLevel::Fatal;
    if (name == "off")
        return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

// Category constants for the allocation engine
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Data = 1;
constexpr uint8_t Regime = 2;
constexpr uint8_t Allocation = 3;
constexpr uint8_t Recovery = 4;
constexpr uint8_t Config = 5;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Data:
        return "data";
    case LogCategory::Regime:
        return "regime";
    case LogCategory::Allocation:
        return "allocation";
    case LogCategory::Recovery:
        return "recovery";
    case LogCategory::Config:
        return "config";
    default:
        return "other";
    }
}

struct LogEntry {
    uint64_t timestamp_ms = 0;
    LogLevel level = LogLevel::Info;
    uint8_t category = LogCategory::System;
    std::string message;
};

/**
 * Logger - synchronous, thread-safe
 *
 * Evaluations run in microseconds and log a handful of lines each, so the
 * entry is written on the calling thread. The mutex guards the logger's state
 * only; the output callback runs without it. One Logger may be shared by
 * every Evaluator in the process.
 *
 * Usage:
 *   Logger logger(LogLevel::Debug);
 *   GPO_LOGF_INFO(logger, Regime, "regime %s, drawdown %.2f%%", "B", -36.7);
 */
class Logger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    explicit Logger(LogLevel min_level = LogLevel::Info) : min_level_(min_level), total_logged_(0) {}

    // Non-copyable
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, uint8_t category, const std::string& message) {
        if (!enabled(level))
            return;

        LogEntry entry;
        entry.timestamp_ms = get_timestamp_ms();
        entry.level = level;
        entry.category = category;
        entry.message = message;

        // The sink runs unlocked so a callback may log again
        OutputCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++total_logged_;
            callback = output_callback_;
        }
        output_entry(entry, callback);
    }

    /**
     * Log with printf-style formatting. Messages longer than 255 characters
     * are truncated.
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (!enabled(level))
            return;

        char buffer[256];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    // Fatal passes every filter, including Off
    bool enabled(LogLevel level) const {
        if (level == LogLevel::Fatal)
            return true;
        std::lock_guard<std::mutex> lock(mutex_);
        return level != LogLevel::Off && level >= min_level_;
    }

    void set_min_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    void set_output_callback(OutputCallback cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_callback_ = std::move(cb);
    }

    uint64_t total_logged() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_logged_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    OutputCallback output_callback_;
    uint64_t total_logged_;

    static void output_entry(const LogEntry& entry, const OutputCallback& callback) {
        if (callback) {
            callback(entry);
        } else {
            // Default: print to stderr
            std::fprintf(stderr, "[%llu.%03llu] [%s] [%s] %s\n",
                         static_cast<unsigned long long>(entry.timestamp_ms / 1000),
                         static_cast<unsigned long long>(entry.timestamp_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message.c_str());
        }
    }

    static uint64_t get_timestamp_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }
};

// Convenience macros
#define GPO_LOG_DEBUG(logger, cat, msg) (logger).log(gpo::logging::LogLevel::Debug, gpo::logging::LogCategory::cat, msg)
#define GPO_LOG_INFO(logger, cat, msg) (logger).log(gpo::logging::LogLevel::Info, gpo::logging::LogCategory::cat, msg)
#define GPO_LOG_WARN(logger, cat, msg) (logger).log(gpo::logging::LogLevel::Warn, gpo::logging::LogCategory::cat, msg)
#define GPO_LOG_ERROR(logger, cat, msg) (logger).log(gpo::logging::LogLevel::Error, gpo::logging::LogCategory::cat, msg)
#define GPO_LOG_FATAL(logger, cat, msg) (logger).log(gpo::logging::LogLevel::Fatal, gpo::logging::LogCategory::cat, msg)

// Printf-style variants
#define GPO_LOGF_DEBUG(logger, cat, fmt, ...) \
    (logger).logf(gpo::logging::LogLevel::Debug, gpo::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define GPO_LOGF_INFO(logger, cat, fmt, ...) \
    (logger).logf(gpo::logging::LogLevel::Info, gpo::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define GPO_LOGF_WARN(logger, cat, fmt, ...) \
    (logger).logf(gpo::logging::LogLevel::Warn, gpo::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace gpo
