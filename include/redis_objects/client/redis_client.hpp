#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "redis_objects/config/config_types.hpp"

namespace redis_objects {
namespace client {

// Member and score returned by the pop-max commands
using ScoredMember = std::pair<std::string, double>;

// Connection to the remote store. One method per server command, raw string
// payloads in and out. Implementations must be safe to call from several
// threads at once. Failures are reported by throwing ConnectionError,
// CommandError or ProtocolError; nil replies are std::nullopt.
class RedisClient {
public:
    RedisClient() = default;
    virtual ~RedisClient() = default;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    // Hash commands
    virtual int64_t hset(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual bool hsetnx(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual std::optional<std::string> hget(const std::string& key, const std::string& field) = 0;
    virtual std::vector<std::optional<std::string>> hmget(const std::string& key,
                                                          const std::vector<std::string>& fields) = 0;
    virtual std::unordered_map<std::string, std::string> hgetall(const std::string& key) = 0;
    virtual std::vector<std::string> hkeys(const std::string& key) = 0;
    virtual int64_t hlen(const std::string& key) = 0;
    virtual int64_t hdel(const std::string& key, const std::string& field) = 0;

    // Key commands
    virtual int64_t del(const std::string& key) = 0;

    // List commands. A zero timeout blocks forever.
    virtual int64_t lpush(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> brpop(const std::string& key, std::chrono::seconds timeout) = 0;
    virtual std::optional<std::string> rpop(const std::string& key) = 0;
    virtual int64_t llen(const std::string& key) = 0;

    // Sorted set commands. A zero timeout blocks forever.
    virtual int64_t zadd(const std::string& key, double score, const std::string& member) = 0;
    virtual std::optional<ScoredMember> bzpopmax(const std::string& key, std::chrono::seconds timeout) = 0;
    virtual std::optional<ScoredMember> zpopmax(const std::string& key) = 0;
    virtual std::optional<double> zscore(const std::string& key, const std::string& member) = 0;
    virtual std::optional<int64_t> zrevrank(const std::string& key, const std::string& member) = 0;
    virtual int64_t zcard(const std::string& key) = 0;

    // Connection
    virtual bool ping() = 0;
    virtual std::string connection_info() const = 0;
};

// hiredis-backed implementation; no I/O happens until the first command
std::shared_ptr<RedisClient> create_redis_client(const config::ConnectionConfig& config);

} // namespace client
} // namespace redis_objects
