#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace redis_objects {
namespace config {

struct ConnectionConfig {
    std::string host;
    int port;
    std::string username;
    std::string password;
    int database;

    std::chrono::milliseconds connection_timeout;
    std::chrono::milliseconds command_timeout;

    // Upper bound on simultaneously open server connections
    size_t max_connections;
    // Workers executing non-blocking commands
    size_t worker_threads;

    ConnectionConfig()
        : host("localhost"), port(6379), database(0)
        , connection_timeout(std::chrono::seconds(5))
        , command_timeout(std::chrono::seconds(5))
        , max_connections(8)
        , worker_threads(4) {}
};

struct LoggingConfig {
    std::string level;
    std::string file_path;
    size_t max_file_size;
    size_t max_files;
    bool console_output;

    LoggingConfig() : level("INFO"), max_file_size(10 * 1024 * 1024),
                      max_files(3), console_output(true) {}
};

// Missing keys keep the defaults above
void to_json(nlohmann::json& j, const ConnectionConfig& config);
void from_json(const nlohmann::json& j, ConnectionConfig& config);

void to_json(nlohmann::json& j, const LoggingConfig& config);
void from_json(const nlohmann::json& j, LoggingConfig& config);

} // namespace config
} // namespace redis_objects
