#pragma once

#include <memory>
#include <string>

#include "redis_objects/client/redis_client.hpp"
#include "redis_objects/config/config_types.hpp"

namespace redis_objects {
namespace client {

// RedisClient over hiredis synchronous contexts.
//
// Each command borrows one connection exclusively from an internal pool, so
// concurrent callers never interleave on a socket. At most
// ConnectionConfig::max_connections connections serve regular commands;
// blocking pops never wait for a free slot and may open extra connections,
// which are closed again once returned while the pool is over its limit.
// A connection that saw an I/O error is closed instead of being reused.
class HiredisClient : public RedisClient {
public:
    explicit HiredisClient(const config::ConnectionConfig& config);
    ~HiredisClient() override;

    int64_t hset(const std::string& key, const std::string& field, const std::string& value) override;
    bool hsetnx(const std::string& key, const std::string& field, const std::string& value) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    std::vector<std::optional<std::string>> hmget(const std::string& key,
                                                  const std::vector<std::string>& fields) override;
    std::unordered_map<std::string, std::string> hgetall(const std::string& key) override;
    std::vector<std::string> hkeys(const std::string& key) override;
    int64_t hlen(const std::string& key) override;
    int64_t hdel(const std::string& key, const std::string& field) override;

    int64_t del(const std::string& key) override;

    int64_t lpush(const std::string& key, const std::string& value) override;
    std::optional<std::string> brpop(const std::string& key, std::chrono::seconds timeout) override;
    std::optional<std::string> rpop(const std::string& key) override;
    int64_t llen(const std::string& key) override;

    int64_t zadd(const std::string& key, double score, const std::string& member) override;
    std::optional<ScoredMember> bzpopmax(const std::string& key, std::chrono::seconds timeout) override;
    std::optional<ScoredMember> zpopmax(const std::string& key) override;
    std::optional<double> zscore(const std::string& key, const std::string& member) override;
    std::optional<int64_t> zrevrank(const std::string& key, const std::string& member) override;
    int64_t zcard(const std::string& key) override;

    bool ping() override;
    std::string connection_info() const override;

    size_t open_connections() const;
    size_t idle_connections() const;

    // Closes idle connections; borrowed ones close when returned
    void close_idle();

private:
    struct Implementation;
    class ConnectionLease;
    std::unique_ptr<Implementation> impl_;
};

} // namespace client
} // namespace redis_objects
