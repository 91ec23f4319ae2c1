#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <atomic>
#include <mutex>
#include "shardex/security_utils.hpp"

namespace shardex {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Parses DEBUG/INFO/WARN/ERROR/FATAL (case-sensitive), INFO otherwise
LogLevel parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const { return level_.load(); }
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // Zero disables rate limiting
    void set_rate_limit(std::chrono::milliseconds limit);
    void enable_structured(bool enabled);

    void log(LogLevel level, const std::string& message);

    // Type-safe logging with automatic sanitization
    template<typename... Args>
    void log_safe(LogLevel level, std::string_view format_str, Args&&... args) {
        if (!enabled(level)) return;
        auto formatted = SecurityUtils::safe_format(format_str, args...);
        log(level, SecurityUtils::sanitize_log_input(formatted));
    }

    void debug(const std::string& msg) { log(LogLevel::DEBUG, SecurityUtils::sanitize_log_input(msg)); }
    void info(const std::string& msg) { log(LogLevel::INFO, SecurityUtils::sanitize_log_input(msg)); }
    void warn(const std::string& msg) { log(LogLevel::WARN, SecurityUtils::sanitize_log_input(msg)); }
    void error(const std::string& msg) { log(LogLevel::ERROR, SecurityUtils::sanitize_log_input(msg)); }
    void fatal(const std::string& msg) { log(LogLevel::FATAL, SecurityUtils::sanitize_log_input(msg)); }

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> structured_{false};
    std::atomic<std::chrono::milliseconds::rep> rate_limit_ms_{0};
    std::atomic<std::chrono::steady_clock::time_point> last_log_{};
    std::mutex output_mutex_;

    std::string format_message(LogLevel level, const std::string& message);
    bool should_rate_limit();
};

#define LOG_DEBUG(msg) if (shardex::Logger::instance().enabled(shardex::LogLevel::DEBUG)) shardex::Logger::instance().debug(msg)
#define LOG_INFO(msg) if (shardex::Logger::instance().enabled(shardex::LogLevel::INFO)) shardex::Logger::instance().info(msg)
#define LOG_WARN(msg) if (shardex::Logger::instance().enabled(shardex::LogLevel::WARN)) shardex::Logger::instance().warn(msg)
#define LOG_ERROR(msg) if (shardex::Logger::instance().enabled(shardex::LogLevel::ERROR)) shardex::Logger::instance().error(msg)
#define LOG_FATAL(msg) shardex::Logger::instance().fatal(msg)

#define LOG_DEBUG_SAFE(fmt_str, ...) shardex::Logger::instance().log_safe(shardex::LogLevel::DEBUG, fmt_str, __VA_ARGS__)
#define LOG_INFO_SAFE(fmt_str, ...) shardex::Logger::instance().log_safe(shardex::LogLevel::INFO, fmt_str, __VA_ARGS__)
#define LOG_WARN_SAFE(fmt_str, ...) shardex::Logger::instance().log_safe(shardex::LogLevel::WARN, fmt_str, __VA_ARGS__)
#define LOG_ERROR_SAFE(fmt_str, ...) shardex::Logger::instance().log_safe(shardex::LogLevel::ERROR, fmt_str, __VA_ARGS__)
#define LOG_FATAL_SAFE(fmt_str, ...) shardex::Logger::instance().log_safe(shardex::LogLevel::FATAL, fmt_str, __VA_ARGS__)

} // namespace shardex
