#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "ReceiverConfig.h"

using namespace std::chrono_literals;

namespace {

std::string WriteTempFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST(ReceiverConfigTest, DefaultsMatchDocumentedValues) {
    ReceiverConfig cfg = ReceiverConfigFromMap({});
    EXPECT_EQ(cfg.udp_port, 8888);
    EXPECT_EQ(cfg.broadcaster_name, "Remote Home Assistant");
    EXPECT_EQ(cfg.buffer_size, 4096u);
    EXPECT_EQ(cfg.listener_mode, ListenerMode::ASYNC);
    EXPECT_EQ(cfg.poll_interval, 100ms);
    EXPECT_EQ(cfg.cleanup_interval, 30s);
    EXPECT_EQ(cfg.stale_after, 10min);
    EXPECT_EQ(cfg.receive_retry_delay, 1s);
    EXPECT_TRUE(cfg.start_enabled);
}

TEST(ReceiverConfigTest, ParsesAllKeys) {
    ConfigMap map{
        { "udp_port", "9000" },
        { "broadcaster_name", "Garage" },
        { "buffer_size", "8192" },
        { "listener_mode", "poll" },
        { "poll_interval_ms", "50" },
        { "cleanup_interval_ms", "1000" },
        { "stale_after_ms", "60000" },
        { "receive_retry_delay_ms", "250" },
        { "start_enabled", "false" },
        { "something_else", "ignored" },
    };
    ReceiverConfig cfg = ReceiverConfigFromMap(map);
    EXPECT_EQ(cfg.udp_port, 9000);
    EXPECT_EQ(cfg.broadcaster_name, "Garage");
    EXPECT_EQ(cfg.buffer_size, 8192u);
    EXPECT_EQ(cfg.listener_mode, ListenerMode::POLL);
    EXPECT_EQ(cfg.poll_interval, 50ms);
    EXPECT_EQ(cfg.cleanup_interval, 1s);
    EXPECT_EQ(cfg.stale_after, 1min);
    EXPECT_EQ(cfg.receive_retry_delay, 250ms);
    EXPECT_FALSE(cfg.start_enabled);
}

TEST(ReceiverConfigTest, RejectsPortOutsideRange) {
    EXPECT_THROW(ReceiverConfigFromMap({ { "udp_port", "1023" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "udp_port", "65536" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "udp_port", "-1" } }), ConfigError);
    EXPECT_EQ(ReceiverConfigFromMap({ { "udp_port", "1024" } }).udp_port, 1024);
    EXPECT_EQ(ReceiverConfigFromMap({ { "udp_port", "65535" } }).udp_port, 65535);
}

TEST(ReceiverConfigTest, RejectsMalformedValues) {
    EXPECT_THROW(ReceiverConfigFromMap({ { "udp_port", "eighty" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "udp_port", "80x" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "listener_mode", "blocking" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "poll_interval_ms", "0" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "start_enabled", "maybe" } }), ConfigError);
    EXPECT_THROW(ReceiverConfigFromMap({ { "buffer_size", "0" } }), ConfigError);
}

TEST(ReceiverConfigTest, LoadsJsonFile) {
    std::string path = WriteTempFile("receiver_config_ok.json",
        R"({"udp_port": 9100, "broadcaster_name": "Shed", "start_enabled": false, "listener_mode": "poll"})");

    ReceiverConfig cfg = LoadReceiverConfig(path);
    EXPECT_EQ(cfg.udp_port, 9100);
    EXPECT_EQ(cfg.broadcaster_name, "Shed");
    EXPECT_FALSE(cfg.start_enabled);
    EXPECT_EQ(cfg.listener_mode, ListenerMode::POLL);
    std::remove(path.c_str());
}

TEST(ReceiverConfigTest, RejectsBadFiles) {
    EXPECT_THROW(LoadConfigMap(::testing::TempDir() + "does_not_exist.json"), ConfigError);

    std::string broken = WriteTempFile("receiver_config_broken.json", "{ \"udp_port\": ");
    EXPECT_THROW(LoadConfigMap(broken), ConfigError);
    std::remove(broken.c_str());

    std::string array = WriteTempFile("receiver_config_array.json", "[1, 2]");
    EXPECT_THROW(LoadConfigMap(array), ConfigError);
    std::remove(array.c_str());

    std::string nested = WriteTempFile("receiver_config_nested.json", R"({"udp_port": {"value": 1}})");
    EXPECT_THROW(LoadConfigMap(nested), ConfigError);
    std::remove(nested.c_str());
}
