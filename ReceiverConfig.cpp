#include "ReceiverConfig.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace {

long long ParseInteger(const ConfigMap& config, const std::string& key) {
    const std::string& raw = config.at(key);
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &used);
    }
    catch (const std::exception&) {
        throw ConfigError("Config '" + key + "' is not an integer: " + raw);
    }
    if (used != raw.size()) {
        throw ConfigError("Config '" + key + "' is not an integer: " + raw);
    }
    return value;
}

std::chrono::milliseconds ParsePositiveMs(const ConfigMap& config, const std::string& key) {
    long long ms = ParseInteger(config, key);
    if (ms <= 0) {
        throw ConfigError("Config '" + key + "' must be positive, got " + std::to_string(ms));
    }
    return std::chrono::milliseconds(ms);
}

bool ParseBool(const ConfigMap& config, const std::string& key) {
    const std::string& raw = config.at(key);
    if (raw == "true" || raw == "1") return true;
    if (raw == "false" || raw == "0") return false;
    throw ConfigError("Config '" + key + "' is not a boolean: " + raw);
}

} // namespace

std::string ListenerModeName(ListenerMode mode) {
    return mode == ListenerMode::POLL ? "poll" : "async";
}

ReceiverConfig ReceiverConfigFromMap(const ConfigMap& config) {
    ReceiverConfig cfg;

    if (config.count("udp_port")) {
        long long port = ParseInteger(config, "udp_port");
        if (port < kMinUdpPort || port > 65535) {
            throw ConfigError("Config 'udp_port' must be in 1024..65535, got " + std::to_string(port));
        }
        cfg.udp_port = static_cast<uint16_t>(port);
    }
    if (config.count("broadcaster_name")) {
        cfg.broadcaster_name = config.at("broadcaster_name");
    }
    if (config.count("buffer_size")) {
        long long size = ParseInteger(config, "buffer_size");
        if (size <= 0 || size > 65535) {
            throw ConfigError("Config 'buffer_size' must be in 1..65535, got " + std::to_string(size));
        }
        cfg.buffer_size = static_cast<size_t>(size);
    }
    if (config.count("listener_mode")) {
        const std::string& mode = config.at("listener_mode");
        if (mode == "async") cfg.listener_mode = ListenerMode::ASYNC;
        else if (mode == "poll") cfg.listener_mode = ListenerMode::POLL;
        else throw ConfigError("Config 'listener_mode' must be 'async' or 'poll', got " + mode);
    }
    if (config.count("poll_interval_ms")) cfg.poll_interval = ParsePositiveMs(config, "poll_interval_ms");
    if (config.count("cleanup_interval_ms")) cfg.cleanup_interval = ParsePositiveMs(config, "cleanup_interval_ms");
    if (config.count("stale_after_ms")) cfg.stale_after = ParsePositiveMs(config, "stale_after_ms");
    if (config.count("receive_retry_delay_ms")) cfg.receive_retry_delay = ParsePositiveMs(config, "receive_retry_delay_ms");
    if (config.count("start_enabled")) cfg.start_enabled = ParseBool(config, "start_enabled");

    return cfg;
}

ConfigMap LoadConfigMap(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Config file " + path + " is not valid JSON: " + std::string(e.what()));
    }
    if (!j.is_object()) {
        throw ConfigError("Config file " + path + " must contain a JSON object");
    }

    ConfigMap config;
    for (auto& [key, value] : j.items()) {
        if (value.is_string()) config[key] = value.get<std::string>();
        else if (value.is_boolean()) config[key] = value.get<bool>() ? "true" : "false";
        else if (value.is_number_integer()) config[key] = value.dump();
        else throw ConfigError("Config '" + key + "' has unsupported type " + std::string(value.type_name()));
    }
    return config;
}

ReceiverConfig LoadReceiverConfig(const std::string& path) {
    return ReceiverConfigFromMap(LoadConfigMap(path));
}
