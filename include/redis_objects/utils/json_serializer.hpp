#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "redis_objects/core/exceptions.hpp"

namespace redis_objects {
namespace utils {

// Single place where values cross between application types and stored text.
// Any T with nlohmann to_json/from_json overloads is accepted.
class JsonSerializer {
public:
    // Longest payload excerpt carried by DeserializationError
    static constexpr size_t kMaxPayloadExcerpt = 128;

    // Compact encoding; equal values produce identical text, which sorted-set
    // membership relies on.
    template<typename T>
    static std::string dump(const T& value) {
        try {
            return nlohmann::json(value).dump();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(e.what());
        }
    }

    template<typename T>
    static T load(const std::string& raw) {
        try {
            return nlohmann::json::parse(raw).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw DeserializationError(excerpt(raw), e.what());
        }
    }

    // Absent or empty raw data is absence, never a parse attempt
    template<typename T>
    static std::optional<T> load_optional(const std::optional<std::string>& raw) {
        if (!raw || raw->empty()) {
            return std::nullopt;
        }
        return load<T>(*raw);
    }

    static bool is_valid(const std::string& raw) {
        return nlohmann::json::accept(raw);
    }

private:
    static std::string excerpt(const std::string& raw) {
        if (raw.size() <= kMaxPayloadExcerpt) {
            return raw;
        }
        return raw.substr(0, kMaxPayloadExcerpt) + "...";
    }
};

} // namespace utils
} // namespace redis_objects
