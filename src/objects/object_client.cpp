#include "redis_objects/objects/object_client.hpp"
#include "redis_objects/core/exceptions.hpp"
#include "redis_objects/utils/logger.hpp"

namespace redis_objects {

ObjectClient::ObjectClient(std::shared_ptr<client::RedisClient> connection,
                           std::shared_ptr<utils::ThreadPool> executor)
    : connection_(std::move(connection)), executor_(std::move(executor)) {
    if (!connection_) {
        throw ConfigurationError("ObjectClient requires a connection");
    }
    if (!executor_) {
        executor_ = std::make_shared<utils::ThreadPool>(kDefaultWorkerThreads);
    }
}

ObjectClient ObjectClient::connect(const config::ConnectionConfig& config) {
    if (config.worker_threads == 0) {
        throw ConfigurationError("worker_threads must be at least 1");
    }

    REDIS_OBJECTS_LOG_INFO("Creating object client for {}:{} with {} worker(s)",
                           config.host, config.port, config.worker_threads);
    return ObjectClient(client::create_redis_client(config),
                        std::make_shared<utils::ThreadPool>(config.worker_threads));
}

} // namespace redis_objects
