#include "redis_objects/client/hiredis_client.hpp"
#include "redis_objects/core/exceptions.hpp"
#include "redis_objects/utils/logger.hpp"

#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <sys/time.h>

#include <fmt/format.h>
#include <hiredis/hiredis.h>

namespace redis_objects {
namespace client {

namespace {

struct ContextDeleter {
    void operator()(redisContext* context) const {
        if (context) {
            redisFree(context);
        }
    }
};

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) {
            freeReplyObject(reply);
        }
    }
};

using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

struct timeval to_timeval(std::chrono::milliseconds duration) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    return tv;
}

std::string reply_string(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

std::string describe_reply_type(int type) {
    switch (type) {
        case REDIS_REPLY_STRING: return "string";
        case REDIS_REPLY_ARRAY: return "array";
        case REDIS_REPLY_INTEGER: return "integer";
        case REDIS_REPLY_NIL: return "nil";
        case REDIS_REPLY_STATUS: return "status";
        case REDIS_REPLY_ERROR: return "error";
        case REDIS_REPLY_DOUBLE: return "double";
        case REDIS_REPLY_MAP: return "map";
        default: return "type " + std::to_string(type);
    }
}

ProtocolError unexpected_reply(const std::string& command, const redisReply* reply) {
    return ProtocolError("unexpected " + describe_reply_type(reply->type) + " reply to " + command);
}

int64_t as_integer(const std::string& command, const redisReply* reply) {
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw unexpected_reply(command, reply);
    }
    return static_cast<int64_t>(reply->integer);
}

std::optional<std::string> as_optional_string(const std::string& command, const redisReply* reply) {
    switch (reply->type) {
        case REDIS_REPLY_NIL:
            return std::nullopt;
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
            return reply_string(reply);
        default:
            throw unexpected_reply(command, reply);
    }
}

double parse_score(const std::string& command, const std::string& text) {
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
        throw ProtocolError("invalid score '" + text + "' in reply to " + command);
    }
    return value;
}

double as_score(const std::string& command, const redisReply* reply) {
    switch (reply->type) {
        case REDIS_REPLY_DOUBLE:
            return reply->dval;
        case REDIS_REPLY_STRING:
            return parse_score(command, reply_string(reply));
        default:
            throw unexpected_reply(command, reply);
    }
}

// Scores go over the wire in their shortest round-trip form
std::string format_score(double score) {
    return fmt::format("{}", score);
}

} // namespace

struct HiredisClient::Implementation {
    config::ConnectionConfig config;

    mutable std::mutex pool_mutex;
    std::condition_variable pool_cv;
    std::vector<ContextPtr> idle_connections;
    size_t open_connections = 0;

    explicit Implementation(const config::ConnectionConfig& cfg) : config(cfg) {}

    ContextPtr connect();
    ContextPtr acquire(bool blocking_command);
    void release(ContextPtr context, bool healthy);

    ReplyPtr execute(redisContext* context, const std::vector<std::string>& args, bool& healthy);
};

// Borrowed connection, handed back to the pool on scope exit
class HiredisClient::ConnectionLease {
public:
    ConnectionLease(Implementation& impl, bool blocking_command)
        : impl_(impl), context_(impl.acquire(blocking_command)) {}

    ~ConnectionLease() {
        impl_.release(std::move(context_), healthy_);
    }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    redisContext* get() const { return context_.get(); }

    ReplyPtr execute(const std::vector<std::string>& args) {
        return impl_.execute(context_.get(), args, healthy_);
    }

private:
    Implementation& impl_;
    ContextPtr context_;
    bool healthy_ = true;
};

ContextPtr HiredisClient::Implementation::connect() {
    REDIS_OBJECTS_SCOPED_TIMER("redis connect " + config.host + ":" + std::to_string(config.port));
    struct timeval timeout = to_timeval(config.connection_timeout);
    ContextPtr context(redisConnectWithTimeout(config.host.c_str(), config.port, timeout));

    if (!context) {
        utils::Logger::error("Redis connection error: cannot allocate context for {}:{}",
                             config.host, config.port);
        throw ConnectionError("cannot allocate context for " + config.host + ":" + std::to_string(config.port));
    }
    if (context->err) {
        std::string reason = context->errstr;
        utils::Logger::error("Redis connection error: {}", reason);
        throw ConnectionError(config.host + ":" + std::to_string(config.port) + ": " + reason);
    }

    if (redisSetTimeout(context.get(), to_timeval(config.command_timeout)) != REDIS_OK) {
        throw ConnectionError("cannot set command timeout: " + std::string(context->errstr));
    }

    bool healthy = true;
    if (!config.password.empty()) {
        std::vector<std::string> args{"AUTH"};
        if (!config.username.empty()) {
            args.push_back(config.username);
        }
        args.push_back(config.password);
        try {
            execute(context.get(), args, healthy);
        } catch (const CommandError& e) {
            REDIS_OBJECTS_LOG_ERROR("Redis authentication failed: {}", e.what());
            throw ConnectionError("authentication failed for " + config.host + ":" + std::to_string(config.port));
        }
    }

    if (config.database != 0) {
        execute(context.get(), {"SELECT", std::to_string(config.database)}, healthy);
    }

    utils::Logger::info("Connected to Redis at {}:{}/{}", config.host, config.port, config.database);
    return context;
}

ContextPtr HiredisClient::Implementation::acquire(bool blocking_command) {
    std::unique_lock<std::mutex> lock(pool_mutex);
    if (!blocking_command) {
        pool_cv.wait(lock, [this] {
            return !idle_connections.empty() || open_connections < config.max_connections;
        });
    }

    if (!idle_connections.empty()) {
        ContextPtr context = std::move(idle_connections.back());
        idle_connections.pop_back();
        return context;
    }

    ++open_connections;
    lock.unlock();

    try {
        return connect();
    } catch (...) {
        {
            std::lock_guard<std::mutex> relock(pool_mutex);
            --open_connections;
        }
        pool_cv.notify_one();
        throw;
    }
}

void HiredisClient::Implementation::release(ContextPtr context, bool healthy) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex);
        if (healthy && context && open_connections <= config.max_connections) {
            idle_connections.push_back(std::move(context));
        } else {
            --open_connections;
            context.reset();
        }
    }
    pool_cv.notify_one();
}

ReplyPtr HiredisClient::Implementation::execute(redisContext* context,
                                                const std::vector<std::string>& args,
                                                bool& healthy) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(context, static_cast<int>(argv.size()), argv.data(), argvlen.data())));

    const std::string& command = args.front();
    if (!reply) {
        healthy = false;
        std::string reason = context->err ? context->errstr : "no reply";
        utils::Logger::error("Redis {} failed on {}:{}: {}", command, config.host, config.port, reason);
        throw ConnectionError(command + ": " + reason);
    }

    if (reply->type == REDIS_REPLY_ERROR) {
        throw CommandError(command, reply_string(reply.get()));
    }

    return reply;
}

HiredisClient::HiredisClient(const config::ConnectionConfig& config)
    : impl_(std::make_unique<Implementation>(config)) {
    if (impl_->config.max_connections == 0) {
        throw ConfigurationError("max_connections must be at least 1");
    }
}

HiredisClient::~HiredisClient() {
    close_idle();
}

int64_t HiredisClient::hset(const std::string& key, const std::string& field, const std::string& value) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HSET", key, field, value});
    return as_integer("HSET", reply.get());
}

bool HiredisClient::hsetnx(const std::string& key, const std::string& field, const std::string& value) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HSETNX", key, field, value});
    return as_integer("HSETNX", reply.get()) == 1;
}

std::optional<std::string> HiredisClient::hget(const std::string& key, const std::string& field) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HGET", key, field});
    return as_optional_string("HGET", reply.get());
}

std::vector<std::optional<std::string>> HiredisClient::hmget(const std::string& key,
                                                             const std::vector<std::string>& fields) {
    if (fields.empty()) {
        return {};
    }

    std::vector<std::string> args{"HMGET", key};
    args.insert(args.end(), fields.begin(), fields.end());

    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute(args);
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != fields.size()) {
        throw unexpected_reply("HMGET", reply.get());
    }

    std::vector<std::optional<std::string>> values;
    values.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        values.push_back(as_optional_string("HMGET", reply->element[i]));
    }
    return values;
}

std::unordered_map<std::string, std::string> HiredisClient::hgetall(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HGETALL", key});
    if ((reply->type != REDIS_REPLY_ARRAY && reply->type != REDIS_REPLY_MAP) || reply->elements % 2 != 0) {
        throw unexpected_reply("HGETALL", reply.get());
    }

    std::unordered_map<std::string, std::string> values;
    values.reserve(reply->elements / 2);
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        values.emplace(reply_string(reply->element[i]), reply_string(reply->element[i + 1]));
    }
    return values;
}

std::vector<std::string> HiredisClient::hkeys(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HKEYS", key});
    if (reply->type != REDIS_REPLY_ARRAY) {
        throw unexpected_reply("HKEYS", reply.get());
    }

    std::vector<std::string> fields;
    fields.reserve(reply->elements);
    for (size_t i = 0; i < reply->elements; ++i) {
        fields.push_back(reply_string(reply->element[i]));
    }
    return fields;
}

int64_t HiredisClient::hlen(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HLEN", key});
    return as_integer("HLEN", reply.get());
}

int64_t HiredisClient::hdel(const std::string& key, const std::string& field) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"HDEL", key, field});
    return as_integer("HDEL", reply.get());
}

int64_t HiredisClient::del(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"DEL", key});
    return as_integer("DEL", reply.get());
}

int64_t HiredisClient::lpush(const std::string& key, const std::string& value) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"LPUSH", key, value});
    return as_integer("LPUSH", reply.get());
}

namespace {

// Widens the socket timeout of a borrowed connection for one blocking command
class BlockingTimeoutScope {
public:
    BlockingTimeoutScope(redisContext* context, std::chrono::seconds timeout,
                         std::chrono::milliseconds command_timeout)
        : context_(context), command_timeout_(command_timeout) {
        // A zero socket timeout disables it, matching the server's "wait forever"
        std::chrono::milliseconds socket_timeout(0);
        if (timeout.count() > 0) {
            socket_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout) + command_timeout;
        }
        if (redisSetTimeout(context_, to_timeval(socket_timeout)) != REDIS_OK) {
            throw ConnectionError("cannot set blocking timeout: " + std::string(context_->errstr));
        }
    }

    ~BlockingTimeoutScope() {
        if (redisSetTimeout(context_, to_timeval(command_timeout_)) != REDIS_OK) {
            utils::Logger::warn("Failed to restore Redis command timeout: {}", std::string(context_->errstr));
        }
    }

    BlockingTimeoutScope(const BlockingTimeoutScope&) = delete;
    BlockingTimeoutScope& operator=(const BlockingTimeoutScope&) = delete;

private:
    redisContext* context_;
    std::chrono::milliseconds command_timeout_;
};

} // namespace

std::optional<std::string> HiredisClient::brpop(const std::string& key, std::chrono::seconds timeout) {
    ConnectionLease connection(*impl_, true);
    ReplyPtr reply;
    {
        BlockingTimeoutScope scope(connection.get(), timeout, impl_->config.command_timeout);
        reply = connection.execute({"BRPOP", key, std::to_string(timeout.count())});
    }

    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
        throw unexpected_reply("BRPOP", reply.get());
    }
    return reply_string(reply->element[1]);
}

std::optional<std::string> HiredisClient::rpop(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"RPOP", key});
    return as_optional_string("RPOP", reply.get());
}

int64_t HiredisClient::llen(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"LLEN", key});
    return as_integer("LLEN", reply.get());
}

int64_t HiredisClient::zadd(const std::string& key, double score, const std::string& member) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"ZADD", key, format_score(score), member});
    return as_integer("ZADD", reply.get());
}

std::optional<ScoredMember> HiredisClient::bzpopmax(const std::string& key, std::chrono::seconds timeout) {
    ConnectionLease connection(*impl_, true);
    ReplyPtr reply;
    {
        BlockingTimeoutScope scope(connection.get(), timeout, impl_->config.command_timeout);
        reply = connection.execute({"BZPOPMAX", key, std::to_string(timeout.count())});
    }

    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 3) {
        throw unexpected_reply("BZPOPMAX", reply.get());
    }
    return ScoredMember(reply_string(reply->element[1]), as_score("BZPOPMAX", reply->element[2]));
}

std::optional<ScoredMember> HiredisClient::zpopmax(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"ZPOPMAX", key});
    if (reply->type != REDIS_REPLY_ARRAY) {
        throw unexpected_reply("ZPOPMAX", reply.get());
    }
    if (reply->elements == 0) {
        return std::nullopt;
    }

    // RESP3 nests each member/score pair in its own array
    const redisReply* pair = reply.get();
    if (pair->elements == 1 && pair->element[0]->type == REDIS_REPLY_ARRAY) {
        pair = pair->element[0];
    }
    if (pair->elements != 2) {
        throw unexpected_reply("ZPOPMAX", reply.get());
    }
    return ScoredMember(reply_string(pair->element[0]), as_score("ZPOPMAX", pair->element[1]));
}

std::optional<double> HiredisClient::zscore(const std::string& key, const std::string& member) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"ZSCORE", key, member});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    return as_score("ZSCORE", reply.get());
}

std::optional<int64_t> HiredisClient::zrevrank(const std::string& key, const std::string& member) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"ZREVRANK", key, member});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    return as_integer("ZREVRANK", reply.get());
}

int64_t HiredisClient::zcard(const std::string& key) {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"ZCARD", key});
    return as_integer("ZCARD", reply.get());
}

bool HiredisClient::ping() {
    ConnectionLease connection(*impl_, false);
    auto reply = connection.execute({"PING"});
    return reply->type == REDIS_REPLY_STATUS && reply_string(reply.get()) == "PONG";
}

std::string HiredisClient::connection_info() const {
    return impl_->config.host + ":" + std::to_string(impl_->config.port) + "/" +
           std::to_string(impl_->config.database);
}

size_t HiredisClient::open_connections() const {
    std::lock_guard<std::mutex> lock(impl_->pool_mutex);
    return impl_->open_connections;
}

size_t HiredisClient::idle_connections() const {
    std::lock_guard<std::mutex> lock(impl_->pool_mutex);
    return impl_->idle_connections.size();
}

void HiredisClient::close_idle() {
    std::vector<ContextPtr> closing;
    {
        std::lock_guard<std::mutex> lock(impl_->pool_mutex);
        closing.swap(impl_->idle_connections);
        impl_->open_connections -= closing.size();
    }
    if (!closing.empty()) {
        utils::Logger::info("Closing {} idle Redis connection(s) to {}", closing.size(), connection_info());
    }
    impl_->pool_cv.notify_all();
}

std::shared_ptr<RedisClient> create_redis_client(const config::ConnectionConfig& config) {
    return std::make_shared<HiredisClient>(config);
}

} // namespace client
} // namespace redis_objects
