#include "bridge/topics.hpp"

#include <fmt/format.h>

namespace irbridge::bridge
{

TopicScheme::TopicScheme(std::string base) : m_base(std::move(base))
{
    if (m_base.empty() || m_base.back() != '/')
    {
        m_base.push_back('/');
    }
}

std::string TopicScheme::base_topic(std::string_view discovery_name) const
{
    const auto dot = discovery_name.find('.');
    return m_base + std::string(discovery_name.substr(0, dot));
}

std::string TopicScheme::message_topic(std::string_view discovery_name) const
{
    return base_topic(discovery_name) + std::string(kMessagesSuffix);
}

std::string TopicScheme::broadcast_topic() const
{
    return m_base + std::string(kBroadcastName) + std::string(kMessagesSuffix);
}

std::string TopicScheme::error_topic() const
{
    return m_base + std::string(kErrorName);
}

bool TopicScheme::is_message_topic(std::string_view topic) const noexcept
{
    if (topic.size() <= m_base.size() + kMessagesSuffix.size())
    {
        return false;
    }
    return topic.substr(0, m_base.size()) == m_base &&
           topic.substr(topic.size() - kMessagesSuffix.size()) == kMessagesSuffix;
}

nlohmann::json make_status_event(std::string_view status, std::string_view service_type,
                                 std::string_view discovery_name)
{
    return nlohmann::json{{"status", std::string(status)},
                          {"type", std::string(service_type)},
                          {"name", std::string(discovery_name)}};
}

nlohmann::json make_error_event(std::string_view what)
{
    return nlohmann::json{{"message", fmt::format("Error occurred: {}", what)}};
}

} // namespace irbridge::bridge
