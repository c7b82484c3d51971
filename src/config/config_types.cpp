#include "redis_objects/config/config_types.hpp"

namespace redis_objects {
namespace config {

void to_json(nlohmann::json& j, const ConnectionConfig& config) {
    j = nlohmann::json{
        {"host", config.host},
        {"port", config.port},
        {"username", config.username},
        {"password", config.password},
        {"database", config.database},
        {"connection_timeout_ms", config.connection_timeout.count()},
        {"command_timeout_ms", config.command_timeout.count()},
        {"max_connections", config.max_connections},
        {"worker_threads", config.worker_threads}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& config) {
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.username = j.value("username", config.username);
    config.password = j.value("password", config.password);
    config.database = j.value("database", config.database);
    config.connection_timeout = std::chrono::milliseconds(
        j.value("connection_timeout_ms", static_cast<int64_t>(config.connection_timeout.count())));
    config.command_timeout = std::chrono::milliseconds(
        j.value("command_timeout_ms", static_cast<int64_t>(config.command_timeout.count())));
    config.max_connections = j.value("max_connections", config.max_connections);
    config.worker_threads = j.value("worker_threads", config.worker_threads);
}

void to_json(nlohmann::json& j, const LoggingConfig& config) {
    j = nlohmann::json{
        {"level", config.level},
        {"file_path", config.file_path},
        {"max_file_size", config.max_file_size},
        {"max_files", config.max_files},
        {"console_output", config.console_output}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    config.level = j.value("level", config.level);
    config.file_path = j.value("file_path", config.file_path);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    config.console_output = j.value("console_output", config.console_output);
}

} // namespace config
} // namespace redis_objects
