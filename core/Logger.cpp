#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace securewatch {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::mutex Logger::mutex_;

bool ParseLogLevel(const std::string& text, LogLevel& level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") level = LogLevel::TRACE;
    else if (lower == "debug") level = LogLevel::DEBUG;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "warn" || lower == "warning") level = LogLevel::WARN;
    else if (lower == "error") level = LogLevel::ERROR;
    else if (lower == "critical") level = LogLevel::CRITICAL;
    else return false;
    return true;
}

void Logger::Initialize(const std::string& log_file_path, size_t max_file_size, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    InitializeLocked(log_file_path, max_file_size, max_files);
}

void Logger::InitializeLocked(const std::string& log_file_path, size_t max_file_size, size_t max_files) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }
        auto logger = std::make_shared<spdlog::logger>("SecureWatch", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::err);

        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

        if (log_file_path.empty()) {
            logger->debug("Logger initialized (console only)");
        } else {
            logger->info("Logger initialized: {}", log_file_path);
        }
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        throw;
    }
}

void Logger::SetLevel(LogLevel level) {
    auto logger = Get();

    switch (level) {
        case LogLevel::TRACE:    logger->set_level(spdlog::level::trace); break;
        case LogLevel::DEBUG:    logger->set_level(spdlog::level::debug); break;
        case LogLevel::INFO:     logger->set_level(spdlog::level::info); break;
        case LogLevel::WARN:     logger->set_level(spdlog::level::warn); break;
        case LogLevel::ERROR:    logger->set_level(spdlog::level::err); break;
        case LogLevel::CRITICAL: logger->set_level(spdlog::level::critical); break;
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::shutdown();
        std::atomic_store(&logger_, std::shared_ptr<spdlog::logger>());
    }
}

bool Logger::IsInitialized() {
    return std::atomic_load(&logger_) != nullptr;
}

std::shared_ptr<spdlog::logger> Logger::Get() {
    auto logger = std::atomic_load(&logger_);
    if (logger) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        InitializeLocked("", 0, 0);
    }
    return logger_;
}

} // namespace securewatch
