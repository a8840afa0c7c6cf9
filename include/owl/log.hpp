#pragma once

#include <atomic>
#include <cstdarg>
#include <mutex>
#include <optional>
#include <string>

namespace owl {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

/// Parse "debug" / "info" / "warn" / "error" (case-sensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Process-wide stderr logger
 *
 * printf-style, use through the OWL_LOG_* macros so call sites carry
 * file, line and function. Safe to call from the fetch worker threads.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    bool enabled(LogLevel level) const {
        return level >= level_.load(std::memory_order_relaxed);
    }

#if defined(__GNUC__)
    __attribute__((format(printf, 6, 7)))
#endif
    void log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    void log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    bool use_color_;
    std::mutex write_mutex_;
};

} // namespace owl

#define OWL_LOG_AT(lvl, ...)                                                                  \
    do {                                                                                      \
        if (::owl::Logger::instance().enabled(lvl)) {                                         \
            ::owl::Logger::instance().log(lvl, __FILE__, __LINE__, __func__, __VA_ARGS__);    \
        }                                                                                     \
    } while (0)

#define OWL_LOG_DEBUG(...) OWL_LOG_AT(::owl::LogLevel::Debug, __VA_ARGS__)
#define OWL_LOG_INFO(...)  OWL_LOG_AT(::owl::LogLevel::Info, __VA_ARGS__)
#define OWL_LOG_WARN(...)  OWL_LOG_AT(::owl::LogLevel::Warn, __VA_ARGS__)
#define OWL_LOG_ERROR(...) OWL_LOG_AT(::owl::LogLevel::Error, __VA_ARGS__)
