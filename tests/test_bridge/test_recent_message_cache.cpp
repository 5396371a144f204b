/**
 * @file test_recent_message_cache.cpp
 * @brief The consume-on-hit dedup gate.
 */
#include "bridge/recent_message_cache.hpp"
#include "gtest/gtest.h"

#include <stdexcept>
#include <thread>
#include <vector>

using irbridge::bridge::RecentMessageCache;
using nlohmann::json;

namespace
{
json signal(int n)
{
    return json{{"format", "raw"}, {"freq", 38}, {"data", {n, n + 1, n + 2}}};
}
} // namespace

TEST(RecentMessageCacheTest, DefaultCapacityIsFive)
{
    RecentMessageCache cache;
    EXPECT_EQ(cache.capacity(), 5u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(RecentMessageCacheTest, ZeroCapacityRejected)
{
    EXPECT_THROW(RecentMessageCache(0), std::invalid_argument);
}

TEST(RecentMessageCacheTest, HasConsumesOnHit)
{
    RecentMessageCache cache;
    cache.put(signal(1));
    EXPECT_TRUE(cache.has(signal(1)));
    EXPECT_FALSE(cache.has(signal(1)));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(RecentMessageCacheTest, MissLeavesContentsAlone)
{
    RecentMessageCache cache;
    cache.put(signal(1));
    EXPECT_FALSE(cache.has(signal(2)));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(RecentMessageCacheTest, EqualityIsStructural)
{
    RecentMessageCache cache;
    cache.put(json::parse(R"({"format":"raw","freq":38,"data":[1,2,3]})"));
    // Same object, different key order and whitespace.
    EXPECT_TRUE(cache.has(json::parse(R"({ "data": [1, 2, 3], "freq": 38, "format": "raw" })")));
}

TEST(RecentMessageCacheTest, DuplicatesAreConsumedOneAtATime)
{
    RecentMessageCache cache;
    cache.put(signal(1));
    cache.put(signal(1));
    EXPECT_TRUE(cache.has(signal(1)));
    EXPECT_TRUE(cache.has(signal(1)));
    EXPECT_FALSE(cache.has(signal(1)));
}

TEST(RecentMessageCacheTest, NeverExceedsCapacity)
{
    RecentMessageCache cache(3);
    for (int i = 0; i < 10; ++i)
    {
        cache.put(signal(i));
        EXPECT_LE(cache.size(), 3u);
    }
    EXPECT_EQ(cache.size(), 3u);
}

TEST(RecentMessageCacheTest, EvictsOldestFirst)
{
    RecentMessageCache cache(3);
    for (int i = 0; i < 4; ++i)
    {
        cache.put(signal(i));
    }
    EXPECT_FALSE(cache.has(signal(0)));
    EXPECT_TRUE(cache.has(signal(1)));
    EXPECT_TRUE(cache.has(signal(2)));
    EXPECT_TRUE(cache.has(signal(3)));
}

TEST(RecentMessageCacheTest, ConcurrentPutAndHas)
{
    RecentMessageCache cache(64);
    constexpr int kPerThread = 500;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&cache, t]()
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    cache.put(signal(t * kPerThread + i));
                    static_cast<void>(cache.has(signal(t * kPerThread + i)));
                }
            });
    }
    for (auto &th : threads)
    {
        th.join();
    }
    EXPECT_LE(cache.size(), 64u);
}
