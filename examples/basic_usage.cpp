#include <iostream>
#include <string>

#include "redis_objects/redis_objects.hpp"

using namespace redis_objects;
using nlohmann::json;

struct Job {
    std::string name;
    int attempts;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Job, name, attempts)

int main(int argc, char* argv[]) {
    config::ConfigManager config_manager;
    if (argc > 1 && !config_manager.load_config(argv[1])) {
        std::cerr << "Failed to load configuration from " << argv[1] << std::endl;
        return 1;
    }
    config_manager.load_env_overrides();

    if (!config_manager.validate_config()) {
        for (const auto& error : config_manager.get_validation_errors()) {
            std::cerr << "Invalid configuration: " << error << std::endl;
        }
        return 1;
    }

    try {
        utils::Logger::initialize(config_manager.get_logging_config());
        utils::Logger::info("Effective configuration:\n{}", config_manager.dump_config());

        ObjectClient client = ObjectClient::connect(config_manager.get_connection_config());

        // Settings stored as a hash of JSON documents
        auto settings = client.hash("example:settings");
        settings.set("theme", "dark").get();
        settings.add("retries", 3).get();
        for (const auto& [field, value] : settings.get_all().get()) {
            utils::Logger::info("setting {} = {}", field, value.dump());
        }

        // Work handed out in arrival order
        auto jobs = client.queue<Job>("example:jobs");
        jobs.push(Job{"resize", 0}).get();
        jobs.push(Job{"upload", 0}).get();
        while (auto job = jobs.pop(std::chrono::seconds(1)).get()) {
            utils::Logger::info("processing job {} (attempt {})", job->name, job->attempts + 1);
        }

        // Urgent work first
        auto alerts = client.priority_queue<std::string>("example:alerts");
        alerts.push("disk almost full", 5).get();
        alerts.push("new login", 1).get();
        alerts.push("service down", 10).get();
        utils::Logger::info("{} alert(s) pending", alerts.length().get());
        while (auto alert = alerts.pop_ready().get()) {
            utils::Logger::info("alert: {}", *alert);
        }

        settings.clear().get();
        utils::Logger::shutdown();
        return 0;
    } catch (const RedisObjectsError& e) {
        utils::Logger::error("Example failed: {}", e.what());
        std::cerr << "FAILURE: " << e.what() << std::endl;
        utils::Logger::shutdown();
        return 1;
    }
}
