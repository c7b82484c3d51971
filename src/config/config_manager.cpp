#include "redis_objects/config/config_manager.hpp"
#include "redis_objects/core/exceptions.hpp"
#include "redis_objects/utils/logger.hpp"

#include <cstdlib>
#include <fstream>

namespace redis_objects {
namespace config {

const std::unordered_map<std::string, std::string> ConfigManager::ENV_VAR_MAPPINGS = {
    {"REDIS_OBJECTS_HOST", "redis.host"},
    {"REDIS_OBJECTS_PORT", "redis.port"},
    {"REDIS_OBJECTS_PASSWORD", "redis.password"},
    {"REDIS_OBJECTS_DB", "redis.database"},
    {"REDIS_OBJECTS_LOG_LEVEL", "logging.level"}
};

namespace {

bool parse_int(const std::string& text, int& out) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load_config(const std::string& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open config file: {}", config_file_path);
        return false;
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Error parsing config file {}: {}", config_file_path, e.what());
        return false;
    }

    if (!apply_json(document)) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_file_path_ = config_file_path;
    }
    utils::Logger::info("Configuration loaded from {}", config_file_path);
    return true;
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Error parsing configuration: {}", e.what());
        return false;
    }
    return apply_json(document);
}

bool ConfigManager::reload_config() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        path = config_file_path_;
    }
    if (path.empty()) {
        utils::Logger::warn("No configuration file to reload");
        return false;
    }
    return load_config(path);
}

bool ConfigManager::apply_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        utils::Logger::error("Configuration root must be a JSON object");
        return false;
    }

    // Parse into copies so a bad section leaves the current settings untouched
    ConnectionConfig connection;
    LoggingConfig logging;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        connection = connection_config_;
        logging = logging_config_;
    }

    try {
        if (document.contains("redis")) {
            from_json(document.at("redis"), connection);
        }
        if (document.contains("logging")) {
            from_json(document.at("logging"), logging);
        }
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Invalid configuration value: {}", e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    connection_config_ = connection;
    logging_config_ = logging;
    return true;
}

ConnectionConfig ConfigManager::get_connection_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return connection_config_;
}

void ConfigManager::set_connection_config(const ConnectionConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    connection_config_ = config;
}

LoggingConfig ConfigManager::get_logging_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return logging_config_;
}

void ConfigManager::set_logging_config(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    logging_config_ = config;
}

std::string ConfigManager::get_env_var(const std::string& var_name, const std::string& default_value) const {
    const char* value = std::getenv(var_name.c_str());
    return value ? std::string(value) : default_value;
}

void ConfigManager::load_env_overrides() {
    std::lock_guard<std::mutex> lock(config_mutex_);

    for (const auto& [var_name, setting] : ENV_VAR_MAPPINGS) {
        const char* raw = std::getenv(var_name.c_str());
        if (!raw) {
            continue;
        }
        std::string value(raw);

        if (setting == "redis.host") {
            connection_config_.host = value;
        } else if (setting == "redis.password") {
            connection_config_.password = value;
        } else if (setting == "redis.port" || setting == "redis.database") {
            int number = 0;
            if (!parse_int(value, number)) {
                utils::Logger::warn("Ignoring {}: '{}' is not an integer", var_name, value);
                continue;
            }
            if (setting == "redis.port") {
                connection_config_.port = number;
            } else {
                connection_config_.database = number;
            }
        } else if (setting == "logging.level") {
            logging_config_.level = value;
        }

        utils::Logger::debug("Applied environment override {} -> {}", var_name, setting);
    }
}

bool ConfigManager::validate_config() const {
    return get_validation_errors().empty();
}

std::vector<std::string> ConfigManager::get_validation_errors() const {
    std::vector<std::string> errors;
    std::lock_guard<std::mutex> lock(config_mutex_);
    validate_connection_config(connection_config_, errors);
    validate_logging_config(logging_config_, errors);
    return errors;
}

void ConfigManager::validate_connection_config(const ConnectionConfig& config,
                                               std::vector<std::string>& errors) const {
    if (config.host.empty()) {
        errors.push_back("redis.host must not be empty");
    }
    if (config.port < 1 || config.port > 65535) {
        errors.push_back("redis.port must be between 1 and 65535");
    }
    if (config.database < 0) {
        errors.push_back("redis.database must not be negative");
    }
    if (config.connection_timeout.count() <= 0) {
        errors.push_back("redis.connection_timeout_ms must be positive");
    }
    if (config.command_timeout.count() <= 0) {
        errors.push_back("redis.command_timeout_ms must be positive");
    }
    if (config.max_connections < 1) {
        errors.push_back("redis.max_connections must be at least 1");
    }
    if (config.worker_threads < 1) {
        errors.push_back("redis.worker_threads must be at least 1");
    }
}

void ConfigManager::validate_logging_config(const LoggingConfig& config,
                                            std::vector<std::string>& errors) const {
    try {
        utils::parse_log_level(config.level);
    } catch (const ConfigurationError&) {
        errors.push_back("logging.level '" + config.level + "' is not a known level");
    }
    if (!config.file_path.empty() && config.max_file_size == 0) {
        errors.push_back("logging.max_file_size must be positive");
    }
}

std::string ConfigManager::dump_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);

    nlohmann::json document;
    document["redis"] = connection_config_;
    document["logging"] = logging_config_;
    if (!connection_config_.password.empty()) {
        document["redis"]["password"] = "********";
    }
    return document.dump(2);
}

} // namespace config
} // namespace redis_objects
