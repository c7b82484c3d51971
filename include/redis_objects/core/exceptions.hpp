#pragma once

#include <stdexcept>
#include <string>

namespace redis_objects {

class RedisObjectsError : public std::runtime_error {
public:
    explicit RedisObjectsError(const std::string& message) : std::runtime_error(message) {}
    explicit RedisObjectsError(const char* message) : std::runtime_error(message) {}
};

// Server unreachable, socket failure or I/O timeout
class ConnectionError : public RedisObjectsError {
public:
    explicit ConnectionError(const std::string& message)
        : RedisObjectsError("Connection Error: " + message) {}
};

// The server answered with an error reply
class CommandError : public RedisObjectsError {
public:
    CommandError(const std::string& command, const std::string& message)
        : RedisObjectsError("Command Error: " + command + ": " + message), command_(command) {}

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

class ProtocolError : public RedisObjectsError {
public:
    explicit ProtocolError(const std::string& message)
        : RedisObjectsError("Protocol Error: " + message) {}
};

// Stored data could not be decoded into the requested type
class DeserializationError : public RedisObjectsError {
public:
    DeserializationError(const std::string& payload, const std::string& message)
        : RedisObjectsError("Deserialization Error: " + message + " (payload: " + payload + ")"),
          payload_(payload) {}

    const std::string& payload() const { return payload_; }

private:
    std::string payload_;
};

// The value has no JSON encoding (e.g. invalid UTF-8 in a string)
class SerializationError : public RedisObjectsError {
public:
    explicit SerializationError(const std::string& message)
        : RedisObjectsError("Serialization Error: " + message) {}
};

class ConfigurationError : public RedisObjectsError {
public:
    explicit ConfigurationError(const std::string& message)
        : RedisObjectsError("Configuration Error: " + message) {}
};

} // namespace redis_objects
