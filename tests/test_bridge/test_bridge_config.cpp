/**
 * @file test_bridge_config.cpp
 * @brief BridgeConfig and LoggingConfig parsing.
 */
#include "bridge/bridge_config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace irbridge::bridge;
using namespace ::testing;
using nlohmann::json;
using namespace std::chrono_literals;

namespace
{
// Runs `fn` and returns the std::runtime_error message it throws, or "" if none.
template <typename Fn>
std::string runtime_error_of(Fn fn)
{
    try
    {
        fn();
    }
    catch (const std::runtime_error &e)
    {
        return e.what();
    }
    return {};
}
} // namespace

TEST(BridgeConfigTest, EmptyObjectGivesDefaults)
{
    const auto cfg = BridgeConfig::from_json(json::object());
    EXPECT_EQ(cfg.bus.host, "localhost");
    EXPECT_EQ(cfg.bus.port, 1883);
    EXPECT_EQ(cfg.bus.publish_port, 0);
    EXPECT_EQ(cfg.bus.effective_publish_port(), 1884);
    EXPECT_EQ(cfg.discovery.service_type, "_irkit._tcp.local.");
    EXPECT_EQ(cfg.discovery.query_interval, 10000ms);
    EXPECT_EQ(cfg.device.poll_interval, 5000ms);
    EXPECT_EQ(cfg.device.drain_ticks, 60);
    EXPECT_EQ(cfg.device.get_timeout, 3000ms);
    EXPECT_EQ(cfg.device.post_timeout, 5000ms);
    EXPECT_EQ(cfg.device.recent_cache_size, 5u);
    EXPECT_EQ(cfg.topic_base, "irkit/");
}

TEST(BridgeConfigTest, AllKeysOverride)
{
    const auto cfg = BridgeConfig::from_json(json::parse(R"({
        "bus": { "host": "broker.lan", "port": 5555, "publish_port": 6666 },
        "discovery": { "service_type": "_other._tcp.local.", "query_interval_ms": 2000,
                       "interface": "192.168.1.5" },
        "device": { "poll_interval_ms": 1000, "drain_ticks": 10, "get_timeout_ms": 500,
                    "post_timeout_ms": 700, "recent_cache_size": 8 },
        "topic_base": "home/ir/"
    })"));
    EXPECT_EQ(cfg.bus.host, "broker.lan");
    EXPECT_EQ(cfg.bus.port, 5555);
    EXPECT_EQ(cfg.bus.effective_publish_port(), 6666);
    EXPECT_EQ(cfg.discovery.service_type, "_other._tcp.local.");
    EXPECT_EQ(cfg.discovery.query_interval, 2000ms);
    EXPECT_EQ(cfg.discovery.interface_address, "192.168.1.5");
    EXPECT_EQ(cfg.device.poll_interval, 1000ms);
    EXPECT_EQ(cfg.device.drain_ticks, 10);
    EXPECT_EQ(cfg.device.get_timeout, 500ms);
    EXPECT_EQ(cfg.device.post_timeout, 700ms);
    EXPECT_EQ(cfg.device.recent_cache_size, 8u);
    EXPECT_EQ(cfg.topic_base, "home/ir/");
}

TEST(BridgeConfigTest, InvalidValuesNameTheKey)
{
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"bus": {"port": 0}})")); }),
                HasSubstr("'port'"));
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"bus": {"port": "x"}})")); }),
                HasSubstr("'port'"));
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"bus": {"host": ""}})")); }),
                HasSubstr("'host'"));
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"device": {"drain_ticks": 0}})")); }),
                HasSubstr("'drain_ticks'"));
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"device": 5})")); }),
                HasSubstr("'device'"));
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::array()); }),
                HasSubstr("top level"));
}

TEST(BridgeConfigTest, TopPortNeedsExplicitPublishPort)
{
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json(json::parse(R"({"bus": {"port": 65535}})")); }),
                HasSubstr("'publish_port'"));

    const auto cfg =
        BridgeConfig::from_json(json::parse(R"({"bus": {"port": 65535, "publish_port": 65534}})"));
    EXPECT_EQ(cfg.bus.effective_publish_port(), 65534);

    BusConfig overridden;
    overridden.port = 65535;
    EXPECT_THROW(overridden.validate(), std::runtime_error);
    overridden.publish_port = 1;
    EXPECT_NO_THROW(overridden.validate());
}

TEST(BridgeConfigTest, MissingFileThrows)
{
    EXPECT_THAT(runtime_error_of([] { BridgeConfig::from_json_file("/nonexistent/irbridge.json"); }),
                HasSubstr("cannot open file"));
}

TEST(BridgeConfigTest, LoadsFromFile)
{
    const auto path =
        fs::temp_directory_path() / ("irbridge_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"bus": {"host": "10.0.0.2"}, "topic_base": "ir"})";
    }
    const auto cfg = BridgeConfig::from_json_file(path.string());
    EXPECT_EQ(cfg.bus.host, "10.0.0.2");
    EXPECT_EQ(cfg.topic_base, "ir");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THAT(runtime_error_of([&] { BridgeConfig::from_json_file(path.string()); }),
                HasSubstr("JSON parse error"));
    fs::remove(path);
}

TEST(LoggingConfigTest, Defaults)
{
    const auto cfg = LoggingConfig::from_json(json::object());
    EXPECT_EQ(cfg.level, "info");
    EXPECT_EQ(cfg.sink, LoggingConfig::Sink::Console);
    EXPECT_TRUE(cfg.path.empty());
}

TEST(LoggingConfigTest, FileSinkNeedsPath)
{
    const auto cfg = LoggingConfig::from_json(
        json::parse(R"({"level": "debug", "sink": "file", "path": "/tmp/irbridge.log"})"));
    EXPECT_EQ(cfg.level, "debug");
    EXPECT_EQ(cfg.sink, LoggingConfig::Sink::File);
    EXPECT_EQ(cfg.path, "/tmp/irbridge.log");

    EXPECT_THAT(runtime_error_of([] { LoggingConfig::from_json(json::parse(R"({"sink": "file"})")); }),
                HasSubstr("requires 'path'"));
}

TEST(LoggingConfigTest, RejectsUnknownLevelAndSink)
{
    EXPECT_THAT(runtime_error_of([] { LoggingConfig::from_json(json::parse(R"({"level": "loud"})")); }),
                HasSubstr("'level'"));
    EXPECT_THAT(runtime_error_of([] { LoggingConfig::from_json(json::parse(R"({"sink": "pager"})")); }),
                HasSubstr("'sink'"));
}
