#include "redis_objects/utils/logger.hpp"
#include "redis_objects/core/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace redis_objects {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;

    throw ConfigurationError("unknown log level '" + name + "'");
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "INFO";
    }
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                        size_t max_file_size, size_t max_files, bool console_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("redis_objects", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->flush_on(spdlog::level::warn);
        current_level_ = level;

        // Re-initialization replaces the previous logger
        spdlog::drop("redis_objects");
        spdlog::register_logger(logger);
        std::atomic_store(&logger_, logger);

        Logger::info("Logger initialized at level {}", log_level_to_string(level));
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::initialize(const config::LoggingConfig& config) {
    initialize(config.file_path, parse_log_level(config.level),
               config.max_file_size, config.max_files, config.console_output);
}

void Logger::shutdown() {
    auto logger = std::atomic_exchange(&logger_, std::shared_ptr<spdlog::logger>());
    if (logger) {
        logger->flush();
        spdlog::drop("redis_objects");
    }
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (auto logger = std::atomic_load(&logger_)) {
        logger->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(current_level_.load());
}

bool Logger::is_initialized() {
    return std::atomic_load(&logger_) != nullptr;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time_);
    Logger::debug("TIMER | Operation: {} | Duration: {} us", operation_name_, duration.count());
}

} // namespace utils
} // namespace redis_objects
