/**
 * @file test_bridge_service.cpp
 * @brief BridgeService wiring: discovery and bus events through the dispatch loop.
 */
#include "bridge/bridge_service.hpp"
#include "bridge_test_doubles.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

using namespace irbridge::bridge;
using namespace irbridge::tests;
using namespace ::testing;
using nlohmann::json;

class BridgeServiceTest : public ::testing::Test
{
  protected:
    RecordingBusClient bus_;
    FakeDiscoverySource discovery_;
    FakeEndpointFactory endpoints_;
    std::unique_ptr<BridgeService> service_;
    std::thread runner_;
    std::atomic<bool> ready_{false};

    void SetUp() override
    {
        BridgeService::Config cfg;
        cfg.device.poll_interval = std::chrono::hours(1);
        cfg.on_ready = [this] { ready_ = true; };
        service_ = std::make_unique<BridgeService>(std::move(cfg), bus_, discovery_, endpoints_);
        runner_ = std::thread([this] { service_->run(); });
        ASSERT_TRUE(eventually([this] { return ready_.load(); }));
    }

    void TearDown() override
    {
        service_->stop();
        if (runner_.joinable())
            runner_.join();
        service_.reset();
    }

    void announce(const std::string &name, const std::string &address)
    {
        discovery_.listener()->on_service_added({name, "_irkit._tcp.local.", address, 80});
    }
};

TEST_F(BridgeServiceTest, RunStartsCollaboratorsAndStopEndsIt)
{
    EXPECT_EQ(bus_.starts(), 1);
    EXPECT_NE(bus_.listener(), nullptr);
    EXPECT_NE(discovery_.listener(), nullptr);

    service_->stop();
    runner_.join();
    EXPECT_EQ(bus_.stops(), 1);
    EXPECT_TRUE(discovery_.stopped());
}

TEST_F(BridgeServiceTest, AnnouncedDeviceReceivesBusMessageExactlyOnce)
{
    announce("abc123.local", "192.168.1.20");
    ASSERT_TRUE(eventually([this] { return bus_.publications_on("irkit/abc123").size() == 1; }));
    EXPECT_EQ(service_->registry().size(), 1u);

    const auto status = bus_.publications_on("irkit/abc123");
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(json::parse(status[0].payload).at("status").get<std::string>(), "added");
    EXPECT_EQ(bus_.subscribed().count("irkit/abc123/messages"), 1u);

    const std::string payload = R"({"format":"raw","data":[1,2,3]})";
    bus_.listener()->on_message("irkit/abc123/messages", payload);

    auto device = endpoints_.state(0);
    ASSERT_TRUE(device->wait_for_posts(1));
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(device->posts().size(), 1u);
    EXPECT_EQ(json::parse(device->posts()[0]), json::parse(payload));
}

TEST_F(BridgeServiceTest, ReconnectResubscribes)
{
    announce("abc123.local", "192.168.1.20");
    ASSERT_TRUE(eventually([this] { return service_->registry().size() == 1; }));

    bus_.listener()->on_connected();
    ASSERT_TRUE(eventually([this] { return bus_.subscribe_calls("irkit/all/messages") == 1; }));
    EXPECT_EQ(bus_.subscribe_calls("irkit/abc123/messages"), 2);
}

TEST_F(BridgeServiceTest, MalformedMessageDoesNotStopDispatch)
{
    bus_.listener()->on_message("irkit/all/messages", "not json");
    ASSERT_TRUE(eventually([this] { return bus_.publications_on("irkit/error").size() == 1; }));

    discovery_.listener()->on_service_removed("abc123.local", "_irkit._tcp.local.");
    ASSERT_TRUE(eventually([this] { return bus_.publications_on("irkit/abc123").size() == 1; }));
    EXPECT_EQ(json::parse(bus_.publications_on("irkit/abc123")[0].payload)
                  .at("status")
                  .get<std::string>(),
              "removed");
}

TEST_F(BridgeServiceTest, StopJoinsDeviceWorkers)
{
    announce("a.local", "192.168.1.20");
    announce("b.local", "192.168.1.21");
    ASSERT_TRUE(eventually([this] { return service_->registry().size() == 2; }));

    service_->stop();
    runner_.join();
    EXPECT_EQ(service_->registry().size(), 0u);
}
