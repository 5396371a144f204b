#include "bridge/bridge_service.hpp"

#include "utils/logger.hpp"

#include <chrono>

namespace irbridge::bridge
{

namespace
{
constexpr std::chrono::milliseconds kDispatchWaitTimeout{100};
} // namespace

BridgeService::BridgeService(Config cfg, BusClient& bus, DiscoverySource& discovery,
                             DeviceEndpointFactory& endpoints)
    : m_cfg(std::move(cfg))
    , m_bus(bus)
    , m_discovery(discovery)
    , m_registry(bus, endpoints, TopicScheme(m_cfg.topic_base), m_cfg.service_type, m_cfg.device)
    , m_router(m_registry, bus)
{
}

BridgeService::~BridgeService() = default;

void BridgeService::run()
{
    m_bus.start(*this);
    m_discovery.start(*this);
    LOGGER_INFO("BridgeService: running (service type '{}', topic base '{}')",
                m_cfg.service_type, m_registry.topics().base());
    if (m_cfg.on_ready)
    {
        m_cfg.on_ready();
    }

    std::deque<Command> batch;
    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_queue_cv.wait_for(lock, kDispatchWaitTimeout,
                                [this] { return !m_queue.empty() || m_stop_requested.load(); });
            batch.swap(m_queue);
        }

        for (auto& cmd : batch)
        {
            try
            {
                std::visit([this](auto& c) { handle_command(c); }, cmd);
            }
            catch (const std::exception& e)
            {
                LOGGER_ERROR("BridgeService: event handling failed: {}", e.what());
            }
        }
        batch.clear();
    }

    LOGGER_INFO("BridgeService: stopping");
    m_discovery.stop();
    m_bus.stop();
    m_registry.shutdown();
    LOGGER_INFO("BridgeService: stopped");
}

void BridgeService::stop()
{
    m_stop_requested.store(true, std::memory_order_release);
    m_queue_cv.notify_all();
}

void BridgeService::enqueue(Command&& cmd)
{
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.push_back(std::move(cmd));
    }
    m_queue_cv.notify_one();
}

void BridgeService::on_service_added(const ServiceInfo& info)
{
    enqueue(ServiceAddedCmd{info});
}

void BridgeService::on_service_removed(const std::string& name, const std::string& /*type*/)
{
    enqueue(ServiceRemovedCmd{name});
}

void BridgeService::on_connected()
{
    enqueue(BusConnectedCmd{});
}

void BridgeService::on_message(const std::string& topic, const std::string& payload)
{
    enqueue(BusMessageCmd{topic, payload});
}

void BridgeService::handle_command(ServiceAddedCmd& cmd)
{
    m_registry.on_service_added(cmd.info.name, cmd.info.address, cmd.info.port);
}

void BridgeService::handle_command(ServiceRemovedCmd& cmd)
{
    m_registry.on_service_removed(cmd.name);
}

void BridgeService::handle_command(BusMessageCmd& cmd)
{
    m_router.on_bus_message(cmd.topic, cmd.payload);
}

void BridgeService::handle_command(BusConnectedCmd& /*cmd*/)
{
    m_router.on_bus_connected();
}

} // namespace irbridge::bridge
