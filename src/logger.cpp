/**
 * @file logger.cpp
 * @brief Thread-safe logging with optional rate limiting
 *
 * Features:
 * - Singleton pattern for global access
 * - Lock-free level checking (atomic level)
 * - Optional rate limiting to prevent log flooding
 * - Structured logging (JSON lines) or plain text
 * - Timestamp with millisecond precision (UTC)
 *
 * Output goes to stderr so tools can keep stdout for their own reports.
 */

#include "shardex/logger.hpp"
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace shardex {

LogLevel parse_log_level(std::string_view name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

/**
 * @brief Get logger singleton instance
 *
 * Thread-safe singleton using static local variable.
 */
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_rate_limit(std::chrono::milliseconds limit) {
    rate_limit_ms_.store(limit.count());
}

void Logger::enable_structured(bool enabled) {
    structured_.store(enabled);
}

/**
 * @brief Log message at specified level
 * @param level Log level
 * @param message Message to log (already sanitized)
 *
 * Fast-path checks:
 * 1. Level filter (atomic load)
 * 2. Rate limit check (atomic compare)
 * 3. Format and output under the output mutex
 */
void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    // FATAL is never dropped by the rate limiter
    if (level != LogLevel::FATAL && should_rate_limit()) return;

    auto line = format_message(level, message);
    std::lock_guard lock(output_mutex_);
    std::cerr << line << '\n';
}

/**
 * @brief Format log message with timestamp and level
 *
 * Formats:
 * - Structured (JSON): {"timestamp":"...","level":"...","message":"..."}
 * - Plain: [2024-01-01 12:00:00.123] INFO  message
 */
std::string Logger::format_message(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    const char* level_name = "INFO";
    switch (level) {
        case LogLevel::DEBUG: level_name = "DEBUG"; break;
        case LogLevel::INFO:  level_name = "INFO"; break;
        case LogLevel::WARN:  level_name = "WARN"; break;
        case LogLevel::ERROR: level_name = "ERROR"; break;
        case LogLevel::FATAL: level_name = "FATAL"; break;
    }

    std::stringstream ss;
    if (structured_.load()) {
        ss << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
           << ",\"level\":\"" << level_name
           << "\",\"message\":\"" << message << "\"}";
    } else {
        ss << "[" << std::put_time(&utc, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
           << std::left << std::setfill(' ') << std::setw(5) << level_name
           << " " << message;
    }

    return ss.str();
}

/**
 * @brief Check if logging should be rate limited
 * @return true if this log line should be skipped
 *
 * Compare-exchange on the last log time so that only one of several
 * concurrent callers in the same window wins.
 */
bool Logger::should_rate_limit() {
    auto limit = std::chrono::milliseconds(rate_limit_ms_.load());
    if (limit.count() <= 0) return false;

    auto now = std::chrono::steady_clock::now();
    auto last = last_log_.load();

    if (now - last < limit) {
        return true;
    }

    return !last_log_.compare_exchange_strong(last, now);
}

} // namespace shardex
