#pragma once
/**
 * @file bridge_service.hpp
 * @brief Wires discovery, the bus and the device registry together.
 *
 * Discovery and bus callbacks arrive on the threads of their sources. They
 * are turned into commands and handled one at a time on the thread that
 * calls run(), so registry and router never see two events concurrently.
 */
#include "bridge/bridge_config.hpp"
#include "bridge/bus_client.hpp"
#include "bridge/device_endpoint.hpp"
#include "bridge/device_registry.hpp"
#include "bridge/discovery_source.hpp"
#include "bridge/message_router.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>

namespace irbridge::bridge
{

class BridgeService : public DiscoveryListener, public BusListener
{
public:
    struct Config
    {
        std::string service_type{kDefaultServiceType};
        std::string topic_base{"irkit/"};
        DeviceWorkerOptions device;
        /// Optional: called from run() once the bus and discovery are started.
        std::function<void()> on_ready;
    };

    BridgeService(Config cfg, BusClient& bus, DiscoverySource& discovery,
                  DeviceEndpointFactory& endpoints);
    ~BridgeService() override;

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    /**
     * @brief Starts the bus and discovery, then dispatches events until stop().
     * On return discovery and the bus are stopped and all workers joined.
     */
    void run();

    /// Signal the run() loop to exit. Thread-safe.
    void stop();

    // DiscoveryListener
    void on_service_added(const ServiceInfo& info) override;
    void on_service_removed(const std::string& name, const std::string& type) override;

    // BusListener
    void on_connected() override;
    void on_message(const std::string& topic, const std::string& payload) override;

    [[nodiscard]] DeviceRegistry& registry() noexcept { return m_registry; }

private:
    struct ServiceAddedCmd
    {
        ServiceInfo info;
    };
    struct ServiceRemovedCmd
    {
        std::string name;
    };
    struct BusMessageCmd
    {
        std::string topic;
        std::string payload;
    };
    struct BusConnectedCmd
    {
    };

    using Command = std::variant<ServiceAddedCmd, ServiceRemovedCmd, BusMessageCmd, BusConnectedCmd>;

    void enqueue(Command&& cmd);
    void handle_command(ServiceAddedCmd& cmd);
    void handle_command(ServiceRemovedCmd& cmd);
    void handle_command(BusMessageCmd& cmd);
    void handle_command(BusConnectedCmd& cmd);

    Config m_cfg;
    BusClient& m_bus;
    DiscoverySource& m_discovery;
    DeviceRegistry m_registry;
    MessageRouter m_router;

    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::deque<Command> m_queue;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace irbridge::bridge
