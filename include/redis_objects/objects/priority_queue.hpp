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

// Priority queue over one remote sorted set.
//
// Membership is decided by the serialized value: pushing a value that is
// already queued replaces its priority instead of adding a second entry.
// Pops take the highest priority first; equal priorities fall back to the
// server's ordering, which for sorted sets is the greater serialized text.
template<typename T = nlohmann::json>
class PriorityQueue {
public:
    using value_type = T;

    static constexpr std::chrono::seconds kDefaultPopTimeout{1};

    PriorityQueue(std::string key,
                  std::shared_ptr<client::RedisClient> client,
                  std::shared_ptr<utils::ThreadPool> executor)
        : key_(std::move(key)), client_(std::move(client)), executor_(std::move(executor)) {
        if (!client_ || !executor_) {
            throw std::invalid_argument("PriorityQueue '" + key_ + "' needs a connection and an executor");
        }
    }

    const std::string& key() const { return key_; }

    std::future<void> push(const T& value, double priority = 0) {
        return executor_->submit([client = client_, key = key_, value, priority]() {
            utils::Logger::debug("ZADD {} {}", key, priority);
            client->zadd(key, priority, utils::JsonSerializer::dump(value));
        });
    }

    // Waits up to `timeout` for an item; a zero timeout waits forever.
    // Runs on its own thread so waiting never holds up other operations, and
    // dropping the future abandons the wait without blocking the caller.
    std::future<std::optional<T>> pop(std::chrono::seconds timeout = kDefaultPopTimeout) {
        return utils::spawn_detached([client = client_, key = key_, timeout]() -> std::optional<T> {
            if (timeout.count() < 0) {
                throw std::invalid_argument("pop timeout must not be negative");
            }
            utils::Logger::debug("BZPOPMAX {} {}s", key, timeout.count());
            auto popped = client->bzpopmax(key, timeout);
            if (!popped) {
                return std::nullopt;
            }
            return utils::JsonSerializer::load<T>(popped->first);
        });
    }

    std::future<std::optional<T>> pop_ready() {
        return executor_->submit([client = client_, key = key_]() -> std::optional<T> {
            auto popped = client->zpopmax(key);
            if (!popped) {
                return std::nullopt;
            }
            return utils::JsonSerializer::load<T>(popped->first);
        });
    }

    std::future<void> clear() {
        return executor_->submit([client = client_, key = key_]() {
            utils::Logger::debug("DEL {}", key);
            client->del(key);
        });
    }

    // Current priority of `value`, if queued
    std::future<std::optional<double>> score(const T& value) {
        return executor_->submit([client = client_, key = key_, value]() {
            return client->zscore(key, utils::JsonSerializer::dump(value));
        });
    }

    // Zero-based distance of `value` from the front of the queue, if queued
    std::future<std::optional<int64_t>> rank(const T& value) {
        return executor_->submit([client = client_, key = key_, value]() {
            return client->zrevrank(key, utils::JsonSerializer::dump(value));
        });
    }

    // Counts every entry whatever its priority
    std::future<int64_t> length() {
        return executor_->submit([client = client_, key = key_]() {
            return client->zcard(key);
        });
    }

private:
    std::string key_;
    std::shared_ptr<client::RedisClient> client_;
    std::shared_ptr<utils::ThreadPool> executor_;
};

} // namespace redis_objects
