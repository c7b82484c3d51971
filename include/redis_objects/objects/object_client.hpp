#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "redis_objects/client/redis_client.hpp"
#include "redis_objects/config/config_types.hpp"
#include "redis_objects/objects/hash.hpp"
#include "redis_objects/objects/priority_queue.hpp"
#include "redis_objects/objects/queue.hpp"
#include "redis_objects/utils/thread_pool.hpp"

namespace redis_objects {

// Binds a connection to named structures. Building an accessor performs no I/O;
// two accessors with the same name and connection address the same remote state.
class ObjectClient {
public:
    static constexpr size_t kDefaultWorkerThreads = 4;

    // Without an executor a ThreadPool of kDefaultWorkerThreads workers is created
    explicit ObjectClient(std::shared_ptr<client::RedisClient> connection,
                          std::shared_ptr<utils::ThreadPool> executor = nullptr);

    // Connection and worker pool built from configuration
    static ObjectClient connect(const config::ConnectionConfig& config);

    template<typename T = nlohmann::json>
    Queue<T> queue(const std::string& name) const {
        return Queue<T>(name, connection_, executor_);
    }

    template<typename T = nlohmann::json>
    PriorityQueue<T> priority_queue(const std::string& name) const {
        return PriorityQueue<T>(name, connection_, executor_);
    }

    template<typename T = nlohmann::json>
    Hash<T> hash(const std::string& name) const {
        return Hash<T>(name, connection_, executor_);
    }

    const std::shared_ptr<client::RedisClient>& connection() const { return connection_; }
    const std::shared_ptr<utils::ThreadPool>& executor() const { return executor_; }

private:
    std::shared_ptr<client::RedisClient> connection_;
    std::shared_ptr<utils::ThreadPool> executor_;
};

} // namespace redis_objects
