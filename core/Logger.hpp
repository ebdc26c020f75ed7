#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <string>

namespace securewatch {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

// Accepts "trace", "debug", "info", "warn", "error", "critical" (any case).
// Returns false and leaves `level` untouched for anything else.
bool ParseLogLevel(const std::string& text, LogLevel& level);

// Process-wide logger. The console sink writes to stderr because stdout
// carries the alert stream. An empty file path logs to the console only.
// Logging before Initialize() sets up a console-only logger.
class Logger {
public:
    static void Initialize(const std::string& log_file_path = "logs/securewatch.log",
                          size_t max_file_size = 10 * 1024 * 1024,
                          size_t max_files = 5);

    static void SetLevel(LogLevel level);
    static void Shutdown();
    static bool IsInitialized();

    static std::shared_ptr<spdlog::logger> Get();

    template<typename... Args>
    static void Trace(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Debug(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Info(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Warn(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Error(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void Critical(fmt::format_string<Args...> fmt, Args&&... args) {
        Get()->critical(fmt, std::forward<Args>(args)...);
    }

private:
    static void InitializeLocked(const std::string& log_file_path, size_t max_file_size, size_t max_files);

    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(...) securewatch::Logger::Trace(__VA_ARGS__)
#define LOG_DEBUG(...) securewatch::Logger::Debug(__VA_ARGS__)
#define LOG_INFO(...) securewatch::Logger::Info(__VA_ARGS__)
#define LOG_WARN(...) securewatch::Logger::Warn(__VA_ARGS__)
#define LOG_ERROR(...) securewatch::Logger::Error(__VA_ARGS__)
#define LOG_CRITICAL(...) securewatch::Logger::Critical(__VA_ARGS__)

} // namespace securewatch
