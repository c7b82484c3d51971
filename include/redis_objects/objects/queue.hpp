#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "redis_objects/client/redis_client.hpp"
#include "redis_objects/utils/json_serializer.hpp"
#include "redis_objects/utils/logger.hpp"
#include "redis_objects/utils/thread_pool.hpp"

namespace redis_objects {

// FIFO queue over one remote list. Items enter at the head and leave at the tail.
template<typename T = nlohmann::json>
class Queue {
public:
    using value_type = T;

    static constexpr std::chrono::seconds kDefaultPopTimeout{1};

    Queue(std::string key,
          std::shared_ptr<client::RedisClient> client,
          std::shared_ptr<utils::ThreadPool> executor)
        : key_(std::move(key)), client_(std::move(client)), executor_(std::move(executor)) {
        if (!client_ || !executor_) {
            throw std::invalid_argument("Queue '" + key_ + "' needs a connection and an executor");
        }
    }

    const std::string& key() const { return key_; }

    std::future<void> push(const T& value) {
        return executor_->submit([client = client_, key = key_, value]() {
            utils::Logger::debug("LPUSH {}", key);
            client->lpush(key, utils::JsonSerializer::dump(value));
        });
    }

    // Waits up to `timeout` for the oldest item; a zero timeout waits forever.
    // Runs on its own thread so waiting never holds up other operations, and
    // dropping the future abandons the wait without blocking the caller.
    std::future<std::optional<T>> pop(std::chrono::seconds timeout = kDefaultPopTimeout) {
        return utils::spawn_detached([client = client_, key = key_, timeout]() {
            if (timeout.count() < 0) {
                throw std::invalid_argument("pop timeout must not be negative");
            }
            utils::Logger::debug("BRPOP {} {}s", key, timeout.count());
            return utils::JsonSerializer::load_optional<T>(client->brpop(key, timeout));
        });
    }

    // Oldest item if one is available right now
    std::future<std::optional<T>> pop_ready() {
        return executor_->submit([client = client_, key = key_]() {
            return utils::JsonSerializer::load_optional<T>(client->rpop(key));
        });
    }

    std::future<void> clear() {
        return executor_->submit([client = client_, key = key_]() {
            utils::Logger::debug("DEL {}", key);
            client->del(key);
        });
    }

    std::future<int64_t> length() {
        return executor_->submit([client = client_, key = key_]() {
            return client->llen(key);
        });
    }

private:
    std::string key_;
    std::shared_ptr<client::RedisClient> client_;
    std::shared_ptr<utils::ThreadPool> executor_;
};

} // namespace redis_objects
