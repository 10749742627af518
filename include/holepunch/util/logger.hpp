#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <format>
#include <iostream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <ctime>

namespace holepunch::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

// Parse "trace", "debug", "info", "warn"/"warning", "error", "fatal"
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }

    bool enabled(LogLevel level) const { return level >= this->level(); }

    template<typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        auto message = std::format(fmt, std::forward<Args>(args)...);

        std::lock_guard lock(mutex_);
        std::cerr << std::format("[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] ",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int>(ms.count()));
        std::cerr << level_string(level) << " " << message << std::endl;
    }

    template<typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warning, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Fatal, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    static std::string_view level_string(LogLevel level) {
        switch (level) {
            case LogLevel::Trace: return "[TRACE]";
            case LogLevel::Debug: return "[DEBUG]";
            case LogLevel::Info: return "[INFO] ";
            case LogLevel::Warning: return "[WARN] ";
            case LogLevel::Error: return "[ERROR]";
            case LogLevel::Fatal: return "[FATAL]";
        }
        return "[?????]";
    }

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// Global logging macros
#define LOG_TRACE(...) holepunch::util::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) holepunch::util::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) holepunch::util::Logger::instance().info(__VA_ARGS__)
#define LOG_WARNING(...) holepunch::util::Logger::instance().warning(__VA_ARGS__)
#define LOG_ERROR(...) holepunch::util::Logger::instance().error(__VA_ARGS__)
#define LOG_FATAL(...) holepunch::util::Logger::instance().fatal(__VA_ARGS__)

} // namespace holepunch::util
