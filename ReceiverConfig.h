// ReceiverConfig.h
#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

// --- Helper Types ---
using ConfigMap = std::map<std::string, std::string>;

enum class ListenerMode {
    ASYNC, // async_receive_from chain
    POLL   // timer-driven drain of the non-blocking socket
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// --- Defaults ---
constexpr uint16_t kDefaultUdpPort = 8888;
constexpr uint16_t kMinUdpPort = 1024;
constexpr const char* kDefaultBroadcasterName = "Remote Home Assistant";
constexpr size_t kDefaultBufferSize = 4096;

struct ReceiverConfig {
    uint16_t udp_port = kDefaultUdpPort;
    std::string broadcaster_name = kDefaultBroadcasterName;
    size_t buffer_size = kDefaultBufferSize;
    ListenerMode listener_mode = ListenerMode::ASYNC;
    std::chrono::milliseconds poll_interval{ 100 };
    std::chrono::milliseconds cleanup_interval{ 30000 };
    std::chrono::milliseconds stale_after{ 10 * 60 * 1000 };
    std::chrono::milliseconds receive_retry_delay{ 1000 };
    bool start_enabled = true;
};

// Throws ConfigError on out-of-range or malformed values. Unknown keys are ignored.
ReceiverConfig ReceiverConfigFromMap(const ConfigMap& config);

// Flattens the top-level members of a JSON object file into a ConfigMap.
ConfigMap LoadConfigMap(const std::string& path);

ReceiverConfig LoadReceiverConfig(const std::string& path);

std::string ListenerModeName(ListenerMode mode);
