#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "redis_objects/config/config_types.hpp"

namespace redis_objects {
namespace config {

// Loads connection and logging settings from a JSON document of the form
//   { "redis": { ... }, "logging": { ... } }
// with optional environment variable overrides.
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    bool load_config(const std::string& config_file_path);
    bool load_from_string(const std::string& json_text);
    bool reload_config();

    ConnectionConfig get_connection_config() const;
    void set_connection_config(const ConnectionConfig& config);

    LoggingConfig get_logging_config() const;
    void set_logging_config(const LoggingConfig& config);

    // Environment variable support
    std::string get_env_var(const std::string& var_name, const std::string& default_value = "") const;
    void load_env_overrides();

    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    // JSON text of the current settings with the password masked
    std::string dump_config() const;

    const std::string& config_file_path() const { return config_file_path_; }

private:
    mutable std::mutex config_mutex_;
    std::string config_file_path_;
    ConnectionConfig connection_config_;
    LoggingConfig logging_config_;

    bool apply_json(const nlohmann::json& document);

    void validate_connection_config(const ConnectionConfig& config, std::vector<std::string>& errors) const;
    void validate_logging_config(const LoggingConfig& config, std::vector<std::string>& errors) const;

    // Environment variable -> setting it overrides
    static const std::unordered_map<std::string, std::string> ENV_VAR_MAPPINGS;
};

} // namespace config
} // namespace redis_objects
