#pragma once
/**
 * @file message_router.hpp
 * @brief Dispatches bus messages to device workers.
 */
#include "bridge/bus_client.hpp"
#include "bridge/device_registry.hpp"

#include <string>

namespace irbridge::bridge
{

/**
 * @class MessageRouter
 * @brief Maps inbound bus topics onto DeviceWorker::post().
 *
 * A message on "<base>/all/messages" goes to every known device; a message
 * on "<base>/<id>/messages" goes to the devices whose message topic is
 * exactly that topic. A payload that is not JSON, or a topic that is not a
 * message topic, produces one error event on "<base>/error".
 */
class MessageRouter
{
public:
    MessageRouter(DeviceRegistry& registry, BusClient& bus);

    void on_bus_message(const std::string& topic, const std::string& payload);

    /// Subscribes the broadcast topic and every known device's message topic.
    void on_bus_connected();

    /// Number of workers the last message was handed to.
    [[nodiscard]] std::size_t last_fanout() const noexcept { return m_last_fanout; }

private:
    void publish_error(const std::string& what);

    DeviceRegistry& m_registry;
    BusClient& m_bus;
    std::size_t m_last_fanout{0};
};

} // namespace irbridge::bridge
