#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace chadbuffer {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * The program path logs at INFO (one trace line per branch); decoder
 * internals log at DEBUG/TRACE and cost nothing when those are disabled.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * @brief Structured log entry
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/// Receives every formatted line that passes the level filter
using LogSink = std::function<void(LogLevel, const std::string &)>;

/**
 * @brief Global logging configuration
 *
 * Thread-safe; level and format can be adjusted at runtime. Output goes to
 * stdout unless a sink is installed, which hosts use to capture program
 * trace lines and tests use to assert on them.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Replace the output sink; an empty function restores stdout
    void set_sink(LogSink sink) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = std::move(sink);
    }

    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log with explicit module
    template<typename... Args>
    void log(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            oss.str(),
            "",
            {}
        };

        output_log_entry(entry);
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            message,
            error_code,
            context
        };

        output_log_entry(entry);
    }

    /// Parse "trace", "debug", ... ; unknown names fall back to INFO
    static LogLevel parse_level(const std::string& name);
    static std::string level_to_string(LogLevel level);

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false) {}

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;

    std::mutex sink_mutex_;
    LogSink sink_;

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (sink_) {
            sink_(entry.level, line);
        } else {
            std::cout << line << std::endl;
        }
    }

    std::string escape_json_string(const std::string& input) const;
};

} // namespace common
} // namespace chadbuffer

/**
 * @brief Performance-conscious logging macros
 *
 * TRACE and DEBUG avoid formatting overhead when disabled. The first
 * argument is the module name.
 */
#define LOG_TRACE(...) \
    do { \
        if (chadbuffer::common::Logger::instance().is_enabled(chadbuffer::common::LogLevel::TRACE)) { \
            chadbuffer::common::Logger::instance().log(chadbuffer::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (chadbuffer::common::Logger::instance().is_debug_enabled()) { \
            chadbuffer::common::Logger::instance().log(chadbuffer::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    chadbuffer::common::Logger::instance().log(chadbuffer::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    chadbuffer::common::Logger::instance().log(chadbuffer::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    chadbuffer::common::Logger::instance().log(chadbuffer::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...) \
    chadbuffer::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_PROGRAM_ERROR(message, ...) \
    LOG_STRUCTURED(chadbuffer::common::LogLevel::ERROR, "program", message, ##__VA_ARGS__)

#define LOG_HOST_ERROR(message, ...) \
    LOG_STRUCTURED(chadbuffer::common::LogLevel::ERROR, "host", message, ##__VA_ARGS__)
