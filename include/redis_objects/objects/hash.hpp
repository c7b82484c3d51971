#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "redis_objects/client/redis_client.hpp"
#include "redis_objects/core/exceptions.hpp"
#include "redis_objects/utils/json_serializer.hpp"
#include "redis_objects/utils/logger.hpp"
#include "redis_objects/utils/thread_pool.hpp"

namespace redis_objects {

// Field-level access to one remote hash.
//
// The accessor is a stateless view: it caches nothing and every call is one
// server command. An absent key behaves as an empty hash; the first write
// creates it and clear() removes it.
template<typename T = nlohmann::json>
class Hash {
public:
    using value_type = T;

    Hash(std::string key,
         std::shared_ptr<client::RedisClient> client,
         std::shared_ptr<utils::ThreadPool> executor)
        : key_(std::move(key)), client_(std::move(client)), executor_(std::move(executor)) {
        if (!client_ || !executor_) {
            throw std::invalid_argument("Hash '" + key_ + "' needs a connection and an executor");
        }
    }

    const std::string& key() const { return key_; }

    // Resolves to true if the field is new, false if an existing value was overwritten
    std::future<bool> set(const std::string& field, const T& value) {
        return executor_->submit([client = client_, key = key_, field, value]() {
            utils::Logger::debug("HSET {} {}", key, field);
            return client->hset(key, field, utils::JsonSerializer::dump(value)) == 1;
        });
    }

    // Writes only if the field is absent. Resolves to true if the value was inserted.
    std::future<bool> add(const std::string& field, const T& value) {
        return executor_->submit([client = client_, key = key_, field, value]() {
            utils::Logger::debug("HSETNX {} {}", key, field);
            return client->hsetnx(key, field, utils::JsonSerializer::dump(value));
        });
    }

    std::future<std::optional<T>> get(const std::string& field) {
        return executor_->submit([client = client_, key = key_, field]() {
            return utils::JsonSerializer::load_optional<T>(client->hget(key, field));
        });
    }

    // Every requested field appears in the result; missing ones map to std::nullopt
    std::future<std::unordered_map<std::string, std::optional<T>>> multi_get(std::vector<std::string> fields) {
        return executor_->submit([client = client_, key = key_, fields = std::move(fields)]() {
            std::unordered_map<std::string, std::optional<T>> result;
            if (fields.empty()) {
                return result;
            }

            auto raw_values = client->hmget(key, fields);
            if (raw_values.size() != fields.size()) {
                throw ProtocolError("HMGET returned " + std::to_string(raw_values.size()) +
                                    " values for " + std::to_string(fields.size()) + " fields");
            }

            for (size_t i = 0; i < fields.size(); ++i) {
                result.emplace(fields[i], utils::JsonSerializer::load_optional<T>(raw_values[i]));
            }
            return result;
        });
    }

    std::future<std::unordered_map<std::string, T>> get_all() {
        return executor_->submit([client = client_, key = key_]() {
            std::unordered_map<std::string, T> result;
            for (auto& [field, raw] : client->hgetall(key)) {
                result.emplace(field, utils::JsonSerializer::load<T>(raw));
            }
            return result;
        });
    }

    std::future<std::unordered_set<std::string>> keys() {
        return executor_->submit([client = client_, key = key_]() {
            auto fields = client->hkeys(key);
            return std::unordered_set<std::string>(fields.begin(), fields.end());
        });
    }

    std::future<int64_t> size() {
        return executor_->submit([client = client_, key = key_]() {
            return client->hlen(key);
        });
    }

    // Resolves to true if the field existed
    std::future<bool> remove(const std::string& field) {
        return executor_->submit([client = client_, key = key_, field]() {
            utils::Logger::debug("HDEL {} {}", key, field);
            return client->hdel(key, field) == 1;
        });
    }

    // Drops every field along with the key itself
    std::future<void> clear() {
        return executor_->submit([client = client_, key = key_]() {
            utils::Logger::debug("DEL {}", key);
            client->del(key);
        });
    }

private:
    std::string key_;
    std::shared_ptr<client::RedisClient> client_;
    std::shared_ptr<utils::ThreadPool> executor_;
};

} // namespace redis_objects
