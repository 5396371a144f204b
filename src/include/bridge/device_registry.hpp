#pragma once
/**
 * @file device_registry.hpp
 * @brief The set of known devices, keyed by discovery name.
 *
 * The registry is the only writer of the device map. Discovery callbacks
 * (on_service_added / on_service_removed) are expected to arrive serially on
 * one dispatch thread. Workers that finish draining report from their own
 * thread through on_worker_finished(), which only records the name; the
 * entry is deleted, and its topic unsubscribed, at the start of the next
 * discovery callback. Pending removals are always applied before any new
 * add or remove is processed.
 */
#include "bridge/bus_client.hpp"
#include "bridge/device_endpoint.hpp"
#include "bridge/device_worker.hpp"
#include "bridge/topics.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace irbridge::bridge
{

class DeviceRegistry : public DeviceWorkerListener
{
public:
    DeviceRegistry(BusClient& bus, DeviceEndpointFactory& endpoints, TopicScheme topics,
                   std::string service_type, DeviceWorkerOptions options = {});

    /// Calls shutdown().
    ~DeviceRegistry() override;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Creates and starts a worker for an unknown name, or re-activates
     *        a known one. Publishes {status: "added"} in both cases.
     */
    void on_service_added(const std::string& name, const std::string& address,
                          std::uint16_t port);

    /// Publishes {status: "removed"} and starts the drain of a known worker.
    void on_service_removed(const std::string& name);

    /// Worker-thread entry point; queues the name for removal.
    void on_worker_finished(const std::string& name) override;

    /// Stops and joins every worker and clears the map. Idempotent.
    void shutdown();

    [[nodiscard]] std::vector<std::shared_ptr<DeviceWorker>> workers() const;
    [[nodiscard]] std::shared_ptr<DeviceWorker> find(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t pending_removals() const;

    [[nodiscard]] const TopicScheme& topics() const noexcept { return m_topics; }
    [[nodiscard]] const std::string& service_type() const noexcept { return m_service_type; }

private:
    // Caller holds m_map_mutex.
    void drain_pending_removals();
    void retire_locked(const std::string& name);
    void publish_status(const char* status, const std::string& name);

    BusClient& m_bus;
    DeviceEndpointFactory& m_endpoints;
    const TopicScheme m_topics;
    const std::string m_service_type;
    const DeviceWorkerOptions m_options;

    mutable std::mutex m_map_mutex;
    std::unordered_map<std::string, std::shared_ptr<DeviceWorker>> m_workers;

    mutable std::mutex m_pending_mutex;
    std::vector<std::string> m_pending_removals;
};

} // namespace irbridge::bridge
