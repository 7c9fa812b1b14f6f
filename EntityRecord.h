// EntityRecord.h
#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

constexpr const char* kUnknownBroadcaster = "Unknown";

// --- EntityRecord ---
// Latest value reported for one entity. state and attributes are opaque JSON.
struct EntityRecord {
    std::string entity_id;
    nlohmann::json state;                               // null when absent
    nlohmann::json attributes = nlohmann::json::object();
    std::string broadcaster_name = kUnknownBroadcaster;
    std::string source_ip;
    TimePoint last_updated{};
};

inline bool operator==(const EntityRecord& a, const EntityRecord& b) {
    return a.entity_id == b.entity_id &&
        a.state == b.state &&
        a.attributes == b.attributes &&
        a.broadcaster_name == b.broadcaster_name &&
        a.source_ip == b.source_ip &&
        a.last_updated == b.last_updated;
}

inline bool operator!=(const EntityRecord& a, const EntityRecord& b) {
    return !(a == b);
}

// last_updated is a monotonic clock reading and is not serialized.
inline void to_json(nlohmann::json& j, const EntityRecord& record) {
    j = nlohmann::json{
        { "entity_id", record.entity_id },
        { "state", record.state },
        { "attributes", record.attributes },
        { "broadcaster_name", record.broadcaster_name },
        { "source_ip", record.source_ip }
    };
}
