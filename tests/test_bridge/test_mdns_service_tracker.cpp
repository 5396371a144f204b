/**
 * @file test_mdns_service_tracker.cpp
 * @brief mDNS record bookkeeping: when instances are reported added or removed.
 */
#include "bridge/mdns_service_tracker.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace irbridge::bridge;
using namespace ::testing;
using namespace std::chrono_literals;

namespace
{

const std::string kType = "_irkit._tcp.local.";
const std::string kInstance = "IRKitD2A4._irkit._tcp.local";
const std::string kHost = "IRKitD2A4.local";

class MockDiscoveryListener : public DiscoveryListener
{
  public:
    MOCK_METHOD(void, on_service_added, (const ServiceInfo &info), (override));
    MOCK_METHOD(void, on_service_removed, (const std::string &name, const std::string &type),
                (override));
};

dns::ResourceRecord ptr(const std::string &service, const std::string &instance,
                        std::uint32_t ttl = 4500)
{
    dns::ResourceRecord rr;
    rr.name = service;
    rr.type = static_cast<std::uint16_t>(dns::RecordType::PTR);
    rr.rclass = dns::kClassIn;
    rr.ttl = ttl;
    rr.target = instance;
    return rr;
}

dns::ResourceRecord srv(const std::string &instance, const std::string &host, std::uint16_t port,
                        std::uint32_t ttl = 120)
{
    dns::ResourceRecord rr;
    rr.name = instance;
    rr.type = static_cast<std::uint16_t>(dns::RecordType::SRV);
    rr.rclass = dns::kClassIn | dns::kCacheFlushBit;
    rr.ttl = ttl;
    rr.target = host;
    rr.port = port;
    return rr;
}

dns::ResourceRecord a(const std::string &host, const std::string &address, std::uint32_t ttl = 120)
{
    dns::ResourceRecord rr;
    rr.name = host;
    rr.type = static_cast<std::uint16_t>(dns::RecordType::A);
    rr.rclass = dns::kClassIn | dns::kCacheFlushBit;
    rr.ttl = ttl;
    rr.address = address;
    return rr;
}

dns::Message response(std::vector<dns::ResourceRecord> records)
{
    dns::Message msg;
    msg.flags = dns::kFlagResponse | 0x0400;
    msg.records = std::move(records);
    return msg;
}

dns::Message full_announcement(const std::string &address = "192.168.1.20",
                               std::uint16_t port = 80)
{
    return response({ptr("_irkit._tcp.local", kInstance), srv(kInstance, kHost, port),
                     a(kHost, address)});
}

auto IsService(const std::string &name, const std::string &address, std::uint16_t port)
{
    return AllOf(Field(&ServiceInfo::name, name), Field(&ServiceInfo::type, kType),
                 Field(&ServiceInfo::address, address), Field(&ServiceInfo::port, port));
}

} // namespace

class MdnsServiceTrackerTest : public ::testing::Test
{
  protected:
    StrictMock<MockDiscoveryListener> listener_;
    MdnsServiceTracker tracker_{kType, listener_};
    MdnsServiceTracker::Clock::time_point t0_ = MdnsServiceTracker::Clock::now();
};

TEST_F(MdnsServiceTrackerTest, AnnouncesCompleteInstance)
{
    EXPECT_CALL(listener_,
                on_service_added(IsService("IRKitD2A4._irkit._tcp.local.", "192.168.1.20", 80)));
    tracker_.ingest(full_announcement(), t0_);
    EXPECT_EQ(tracker_.known_instances(), 1u);
}

TEST_F(MdnsServiceTrackerTest, IgnoresQueries)
{
    auto msg = full_announcement();
    msg.flags = 0;
    tracker_.ingest(msg, t0_);
    EXPECT_EQ(tracker_.known_instances(), 0u);
}

TEST_F(MdnsServiceTrackerTest, IgnoresOtherServiceTypes)
{
    tracker_.ingest(response({ptr("_http._tcp.local", "Printer._http._tcp.local"),
                              srv("Printer._http._tcp.local", "printer.local", 631),
                              a("printer.local", "192.168.1.9")}),
                    t0_);
    EXPECT_EQ(tracker_.known_instances(), 0u);
}

TEST_F(MdnsServiceTrackerTest, WaitsForAddressRecord)
{
    tracker_.ingest(response({ptr("_irkit._tcp.local", kInstance), srv(kInstance, kHost, 80)}),
                    t0_);
    Mock::VerifyAndClearExpectations(&listener_);

    EXPECT_CALL(listener_, on_service_added(IsService(kInstance + ".", "192.168.1.20", 80)));
    tracker_.ingest(response({a(kHost, "192.168.1.20")}), t0_ + 1s);
}

TEST_F(MdnsServiceTrackerTest, NameMatchingIgnoresCase)
{
    EXPECT_CALL(listener_, on_service_added(IsService(kInstance + ".", "192.168.1.20", 80)));
    tracker_.ingest(response({ptr("_IRKIT._tcp.local", kInstance),
                              srv("irkitd2a4._irkit._tcp.local", "irkitd2a4.local", 80),
                              a(kHost, "192.168.1.20")}),
                    t0_);
}

TEST_F(MdnsServiceTrackerTest, RepeatedAnnouncementReportedOnce)
{
    EXPECT_CALL(listener_, on_service_added(_)).Times(1);
    tracker_.ingest(full_announcement(), t0_);
    tracker_.ingest(full_announcement(), t0_ + 10s);
    tracker_.ingest(response({a(kHost, "192.168.1.20")}), t0_ + 20s);
}

TEST_F(MdnsServiceTrackerTest, AddressOrPortChangeIsReannounced)
{
    InSequence seq;
    EXPECT_CALL(listener_, on_service_added(IsService(kInstance + ".", "192.168.1.20", 80)));
    EXPECT_CALL(listener_, on_service_added(IsService(kInstance + ".", "192.168.1.44", 80)));
    EXPECT_CALL(listener_, on_service_added(IsService(kInstance + ".", "192.168.1.44", 8080)));

    tracker_.ingest(full_announcement("192.168.1.20", 80), t0_);
    tracker_.ingest(full_announcement("192.168.1.44", 80), t0_ + 1s);
    tracker_.ingest(full_announcement("192.168.1.44", 8080), t0_ + 2s);
}

TEST_F(MdnsServiceTrackerTest, GoodbyeRemovesAnnouncedInstance)
{
    EXPECT_CALL(listener_, on_service_added(_));
    tracker_.ingest(full_announcement(), t0_);

    EXPECT_CALL(listener_, on_service_removed(kInstance + ".", kType)).Times(1);
    tracker_.ingest(response({ptr("_irkit._tcp.local", kInstance, 0)}), t0_ + 1s);
    tracker_.ingest(response({srv(kInstance, kHost, 80, 0)}), t0_ + 1s);
    EXPECT_EQ(tracker_.known_instances(), 0u);
}

TEST_F(MdnsServiceTrackerTest, GoodbyeForUnannouncedInstanceIsSilent)
{
    tracker_.ingest(response({ptr("_irkit._tcp.local", kInstance)}), t0_);
    EXPECT_EQ(tracker_.known_instances(), 1u);
    tracker_.ingest(response({ptr("_irkit._tcp.local", kInstance, 0)}), t0_ + 1s);
    EXPECT_EQ(tracker_.known_instances(), 0u);
}

TEST_F(MdnsServiceTrackerTest, ExpiredInstanceIsRemoved)
{
    EXPECT_CALL(listener_, on_service_added(_));
    tracker_.ingest(full_announcement(), t0_);

    tracker_.expire(t0_ + 4499s);
    EXPECT_EQ(tracker_.known_instances(), 1u);
    Mock::VerifyAndClearExpectations(&listener_);

    EXPECT_CALL(listener_, on_service_removed(kInstance + ".", kType));
    tracker_.expire(t0_ + 4500s);
    EXPECT_EQ(tracker_.known_instances(), 0u);
}

TEST_F(MdnsServiceTrackerTest, RefreshExtendsLifetime)
{
    EXPECT_CALL(listener_, on_service_added(_));
    tracker_.ingest(full_announcement(), t0_);
    tracker_.ingest(response({ptr("_irkit._tcp.local", kInstance)}), t0_ + 4000s);

    tracker_.expire(t0_ + 4600s);
    EXPECT_EQ(tracker_.known_instances(), 1u);
}
