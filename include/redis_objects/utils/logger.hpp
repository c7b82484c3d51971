#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "redis_objects/config/config_types.hpp"

namespace redis_objects {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Throws ConfigurationError for unknown names
LogLevel parse_log_level(const std::string& name);
std::string log_level_to_string(LogLevel level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "",
                           LogLevel level = LogLevel::INFO,
                           size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           size_t max_files = 3,
                           bool console_output = true);

    static void initialize(const config::LoggingConfig& config);

    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = std::atomic_load(&logger_)) {
            logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);
    static bool is_initialized();

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::atomic<LogLevel> current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// RAII logging scope for performance measurement
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define REDIS_OBJECTS_LOG_TRACE(...) ::redis_objects::utils::Logger::trace(__VA_ARGS__)
#define REDIS_OBJECTS_LOG_DEBUG(...) ::redis_objects::utils::Logger::debug(__VA_ARGS__)
#define REDIS_OBJECTS_LOG_INFO(...) ::redis_objects::utils::Logger::info(__VA_ARGS__)
#define REDIS_OBJECTS_LOG_WARN(...) ::redis_objects::utils::Logger::warn(__VA_ARGS__)
#define REDIS_OBJECTS_LOG_ERROR(...) ::redis_objects::utils::Logger::error(__VA_ARGS__)
#define REDIS_OBJECTS_LOG_CRITICAL(...) ::redis_objects::utils::Logger::critical(__VA_ARGS__)

#define REDIS_OBJECTS_SCOPED_TIMER(name) ::redis_objects::utils::ScopedTimer scoped_timer_(name)

} // namespace utils
} // namespace redis_objects
