/**
 * @file test_topics.cpp
 * @brief Topic naming and event payloads.
 */
#include "bridge/topics.hpp"
#include "gtest/gtest.h"

#include <string>

using irbridge::bridge::TopicScheme;
using irbridge::bridge::make_error_event;
using irbridge::bridge::make_status_event;

TEST(TopicSchemeTest, DefaultBase)
{
    TopicScheme topics;
    EXPECT_EQ(topics.base(), "irkit/");
    EXPECT_EQ(topics.broadcast_topic(), "irkit/all/messages");
    EXPECT_EQ(topics.error_topic(), "irkit/error");
}

TEST(TopicSchemeTest, BaseGetsTrailingSlash)
{
    TopicScheme topics("home/ir");
    EXPECT_EQ(topics.base(), "home/ir/");
    EXPECT_EQ(topics.broadcast_topic(), "home/ir/all/messages");
}

TEST(TopicSchemeTest, NameIsTruncatedAtFirstDot)
{
    TopicScheme topics;
    EXPECT_EQ(topics.base_topic("abc123.local"), "irkit/abc123");
    EXPECT_EQ(topics.base_topic("IRKitD2A4._irkit._tcp.local."), "irkit/IRKitD2A4");
    EXPECT_EQ(topics.message_topic("IRKitD2A4._irkit._tcp.local."), "irkit/IRKitD2A4/messages");
}

TEST(TopicSchemeTest, NameWithoutDotIsUsedWhole)
{
    TopicScheme topics;
    EXPECT_EQ(topics.base_topic("bare"), "irkit/bare");
    EXPECT_EQ(topics.message_topic("bare"), "irkit/bare/messages");
}

TEST(TopicSchemeTest, IsMessageTopic)
{
    TopicScheme topics;
    EXPECT_TRUE(topics.is_message_topic("irkit/abc123/messages"));
    EXPECT_TRUE(topics.is_message_topic("irkit/all/messages"));
    EXPECT_FALSE(topics.is_message_topic("irkit/abc123"));
    EXPECT_FALSE(topics.is_message_topic("irkit/messages"));
    EXPECT_FALSE(topics.is_message_topic("other/abc123/messages"));
    EXPECT_FALSE(topics.is_message_topic("irkit/error"));
    EXPECT_FALSE(topics.is_message_topic(""));
}

TEST(TopicEventsTest, StatusEvent)
{
    const auto ev = make_status_event("added", "_irkit._tcp.local.", "abc123.local");
    EXPECT_EQ(ev.at("status").get<std::string>(), "added");
    EXPECT_EQ(ev.at("type").get<std::string>(), "_irkit._tcp.local.");
    EXPECT_EQ(ev.at("name").get<std::string>(), "abc123.local");
    EXPECT_EQ(ev.size(), 3u);
}

TEST(TopicEventsTest, ErrorEvent)
{
    const auto ev = make_error_event("bad payload");
    EXPECT_EQ(ev.at("message").get<std::string>(), "Error occurred: bad payload");
    EXPECT_EQ(ev.size(), 1u);
}
