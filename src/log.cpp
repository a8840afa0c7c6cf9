#include "owl/log.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <unistd.h>

namespace owl {

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[34m";
        case LogLevel::Info: return "\033[32m";
        case LogLevel::Warn: return "\033[33m";
        case LogLevel::Error: return "\033[31m";
    }
    return "\033[0m";
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Keep only the file name; full build paths drown the message.
const char* base_name(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::Info)
    , use_color_(isatty(STDERR_FILENO) != 0)
{}

void Logger::set_level(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return level_.load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (!enabled(level)) return;
    va_list args;
    va_start(args, fmt);
    log_impl(level, file, line, func, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* file, int line, const char* func, const char* fmt, va_list args) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (use_color_) {
        std::fprintf(stderr, "[%s] %s[%s]\033[0m ", timestamp, level_color(level), level_name(level));
    } else {
        std::fprintf(stderr, "[%s] [%s] ", timestamp, level_name(level));
    }
    if (level_.load(std::memory_order_relaxed) == LogLevel::Debug) {
        std::fprintf(stderr, "(%s) at %s:%d ", func, base_name(file), line);
    }
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace owl
