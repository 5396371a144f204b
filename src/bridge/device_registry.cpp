#include "bridge/device_registry.hpp"

#include "utils/logger.hpp"

#include <algorithm>

namespace irbridge::bridge
{

DeviceRegistry::DeviceRegistry(BusClient& bus, DeviceEndpointFactory& endpoints,
                               TopicScheme topics, std::string service_type,
                               DeviceWorkerOptions options)
    : m_bus(bus)
    , m_endpoints(endpoints)
    , m_topics(std::move(topics))
    , m_service_type(std::move(service_type))
    , m_options(options)
{
}

DeviceRegistry::~DeviceRegistry()
{
    shutdown();
}

void DeviceRegistry::on_service_added(const std::string& name, const std::string& address,
                                      std::uint16_t port)
{
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        drain_pending_removals();

        auto it = m_workers.find(name);
        if (it != m_workers.end() && it->second->activate())
        {
            LOGGER_INFO("DeviceRegistry: '{}' re-announced, back to Active", name);
        }
        else
        {
            const bool replacing = it != m_workers.end();
            if (replacing)
            {
                // The worker ran out of drain ticks but has not been collected yet.
                retire_locked(name);
            }

            auto worker = std::make_shared<DeviceWorker>(name, m_topics.message_topic(name),
                                                         m_endpoints.create(address, port), m_bus,
                                                         *this, m_options);
            m_workers.emplace(name, worker);
            worker->start();
            if (!replacing)
            {
                m_bus.subscribe(worker->message_topic());
            }
            LOGGER_INFO("DeviceRegistry: '{}' added at {}:{} ({} known)", name, address, port,
                        m_workers.size());
        }
    }
    publish_status("added", name);
}

void DeviceRegistry::on_service_removed(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_map_mutex);
    drain_pending_removals();
    publish_status("removed", name);

    auto it = m_workers.find(name);
    if (it == m_workers.end())
    {
        LOGGER_DEBUG("DeviceRegistry: removal of unknown '{}' ignored", name);
        return;
    }
    it->second->inactivate();
    LOGGER_INFO("DeviceRegistry: '{}' removed, draining for {} ticks", name,
                m_options.drain_ticks);
}

void DeviceRegistry::on_worker_finished(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending_removals.push_back(name);
}

void DeviceRegistry::drain_pending_removals()
{
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        names.swap(m_pending_removals);
    }

    for (const auto& name : names)
    {
        auto it = m_workers.find(name);
        if (it == m_workers.end())
        {
            continue;
        }
        const auto topic = it->second->message_topic();
        it->second->stop();
        m_workers.erase(it);

        const bool topic_shared =
            std::any_of(m_workers.begin(), m_workers.end(),
                        [&topic](const auto& entry) { return entry.second->message_topic() == topic; });
        if (!topic_shared)
        {
            m_bus.unsubscribe(topic);
        }
        LOGGER_INFO("DeviceRegistry: '{}' deleted ({} known)", name, m_workers.size());
    }
}

void DeviceRegistry::retire_locked(const std::string& name)
{
    auto it = m_workers.find(name);
    if (it == m_workers.end())
    {
        return;
    }
    // Joining guarantees the worker has queued its finish notification, which
    // must not later delete the replacement.
    it->second->stop();
    m_workers.erase(it);

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending_removals.erase(std::remove(m_pending_removals.begin(), m_pending_removals.end(), name),
                             m_pending_removals.end());
}

void DeviceRegistry::publish_status(const char* status, const std::string& name)
{
    m_bus.publish(m_topics.base_topic(name),
                  make_status_event(status, m_service_type, name).dump());
}

void DeviceRegistry::shutdown()
{
    std::unordered_map<std::string, std::shared_ptr<DeviceWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(m_map_mutex);
        workers.swap(m_workers);
    }
    for (auto& [name, worker] : workers)
    {
        worker->stop();
    }
    if (!workers.empty())
    {
        LOGGER_INFO("DeviceRegistry: {} worker(s) stopped", workers.size());
    }

    std::lock_guard<std::mutex> lock(m_pending_mutex);
    m_pending_removals.clear();
}

std::vector<std::shared_ptr<DeviceWorker>> DeviceRegistry::workers() const
{
    std::lock_guard<std::mutex> lock(m_map_mutex);
    std::vector<std::shared_ptr<DeviceWorker>> out;
    out.reserve(m_workers.size());
    for (const auto& [name, worker] : m_workers)
    {
        out.push_back(worker);
    }
    return out;
}

std::shared_ptr<DeviceWorker> DeviceRegistry::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(m_map_mutex);
    auto it = m_workers.find(name);
    return it != m_workers.end() ? it->second : nullptr;
}

std::size_t DeviceRegistry::size() const
{
    std::lock_guard<std::mutex> lock(m_map_mutex);
    return m_workers.size();
}

std::size_t DeviceRegistry::pending_removals() const
{
    std::lock_guard<std::mutex> lock(m_pending_mutex);
    return m_pending_removals.size();
}

} // namespace irbridge::bridge
