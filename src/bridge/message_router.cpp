#include "bridge/message_router.hpp"

#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

namespace irbridge::bridge
{

MessageRouter::MessageRouter(DeviceRegistry& registry, BusClient& bus)
    : m_registry(registry), m_bus(bus)
{
}

void MessageRouter::on_bus_message(const std::string& topic, const std::string& payload)
{
    m_last_fanout = 0;
    const auto& topics = m_registry.topics();
    if (!topics.is_message_topic(topic))
    {
        publish_error(fmt::format("unexpected topic '{}'", topic));
        return;
    }

    nlohmann::json message;
    try
    {
        message = nlohmann::json::parse(payload);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        publish_error(e.what());
        return;
    }

    const bool broadcast = topic == topics.broadcast_topic();
    for (const auto& worker : m_registry.workers())
    {
        if (broadcast || worker->message_topic() == topic)
        {
            worker->post(message);
            ++m_last_fanout;
        }
    }
    LOGGER_DEBUG("MessageRouter: '{}' handed to {} device(s)", topic, m_last_fanout);
}

void MessageRouter::on_bus_connected()
{
    const auto broadcast = m_registry.topics().broadcast_topic();
    m_bus.subscribe(broadcast);
    std::size_t count = 1;
    for (const auto& worker : m_registry.workers())
    {
        m_bus.subscribe(worker->message_topic());
        ++count;
    }
    LOGGER_INFO("MessageRouter: connected, {} topic(s) subscribed", count);
}

void MessageRouter::publish_error(const std::string& what)
{
    auto event = make_error_event(what);
    LOGGER_WARN("MessageRouter: {}", event["message"].get<std::string>());
    m_bus.publish(m_registry.topics().error_topic(), event.dump());
}

} // namespace irbridge::bridge
