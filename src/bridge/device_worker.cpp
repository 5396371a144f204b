#include "bridge/device_worker.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

namespace irbridge::bridge
{

const char* to_string(DeviceState state) noexcept
{
    switch (state)
    {
    case DeviceState::Active:
        return "Active";
    case DeviceState::Draining:
        return "Draining";
    case DeviceState::Terminated:
        return "Terminated";
    default:
        return "Unknown";
    }
}

DeviceWorker::DeviceWorker(std::string name, std::string message_topic,
                           std::unique_ptr<DeviceEndpoint> endpoint, BusClient& bus,
                           DeviceWorkerListener& listener, DeviceWorkerOptions options)
    : m_name(std::move(name))
    , m_message_topic(std::move(message_topic))
    , m_options(options)
    , m_endpoint(std::move(endpoint))
    , m_bus(bus)
    , m_listener(listener)
    , m_recent(options.recent_cache_size)
{
}

DeviceWorker::~DeviceWorker()
{
    stop();
}

void DeviceWorker::start()
{
    std::lock_guard<std::mutex> lock(m_thread_mutex);
    if (!m_thread.joinable())
    {
        m_thread = std::thread(&DeviceWorker::run, this);
    }
}

void DeviceWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_stop_requested = true;
    }
    m_wakeup.notify_all();

    std::lock_guard<std::mutex> lock(m_thread_mutex);
    if (m_thread.joinable())
    {
        m_thread.join();
    }
}

bool DeviceWorker::activate()
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_state == DeviceState::Terminated)
    {
        return false;
    }
    m_state = DeviceState::Active;
    m_remaining_ticks = 0;
    return true;
}

void DeviceWorker::inactivate()
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (m_state == DeviceState::Terminated)
    {
        return;
    }
    m_state = DeviceState::Draining;
    m_remaining_ticks = m_options.drain_ticks;
}

DeviceState DeviceWorker::state() const
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

int DeviceWorker::remaining_ticks() const
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_remaining_ticks;
}

std::size_t DeviceWorker::queued_posts() const
{
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_outbox.size();
}

bool DeviceWorker::check_in_service()
{
    std::lock_guard<std::mutex> lock(m_state_mutex);
    switch (m_state)
    {
    case DeviceState::Active:
        return true;
    case DeviceState::Draining:
        if (--m_remaining_ticks > 0)
        {
            return true;
        }
        m_remaining_ticks = 0;
        m_state = DeviceState::Terminated;
        return false;
    case DeviceState::Terminated:
    default:
        return false;
    }
}

void DeviceWorker::poll_once()
{
    DeviceIoResult result;
    {
        std::lock_guard<std::mutex> wire(m_wire_mutex);
        result = m_endpoint->get_messages(m_options.get_timeout);
    }
    if (result.is_error())
    {
        LOGGER_WARN("DeviceWorker[{}]: GET /messages failed: {} ({})", m_name,
                    to_string(result.error()), result.error_code());
        return;
    }

    const auto body = format_tools::trim(result.content());
    if (body.empty())
    {
        return;
    }

    nlohmann::json message;
    try
    {
        message = nlohmann::json::parse(body.begin(), body.end());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        LOGGER_WARN("DeviceWorker[{}]: unparsable GET /messages body: {}", m_name, e.what());
        return;
    }

    if (m_recent.has(message))
    {
        LOGGER_DEBUG("DeviceWorker[{}]: echo of a posted message suppressed", m_name);
        return;
    }
    m_recent.put(message);
    m_bus.publish(m_message_topic, message.dump());
    LOGGER_INFO("DeviceWorker[{}]: signal received, published on '{}'", m_name, m_message_topic);
}

void DeviceWorker::post(const nlohmann::json& message)
{
    if (state() == DeviceState::Terminated)
    {
        LOGGER_DEBUG("DeviceWorker[{}]: terminated, message dropped", m_name);
        return;
    }
    if (m_recent.has(message))
    {
        LOGGER_DEBUG("DeviceWorker[{}]: signal just received from the device, not sent back",
                     m_name);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_outbox.push_back(message);
    }
    m_wakeup.notify_all();
}

void DeviceWorker::flush_posts()
{
    std::deque<nlohmann::json> batch;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        batch.swap(m_outbox);
    }
    for (const auto& message : batch)
    {
        send(message);
    }
}

std::size_t DeviceWorker::discard_posts()
{
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        dropped = m_outbox.size();
        m_outbox.clear();
    }
    if (dropped > 0)
    {
        LOGGER_WARN("DeviceWorker[{}]: {} queued message(s) dropped on exit", m_name, dropped);
    }
    return dropped;
}

void DeviceWorker::send(const nlohmann::json& message)
{
    DeviceIoResult result;
    {
        std::lock_guard<std::mutex> wire(m_wire_mutex);
        result = m_endpoint->post_messages(message.dump(), m_options.post_timeout);
    }
    if (result.is_error())
    {
        LOGGER_WARN("DeviceWorker[{}]: POST /messages failed: {} ({})", m_name,
                    to_string(result.error()), result.error_code());
        return;
    }
    LOGGER_INFO("DeviceWorker[{}]: POST /messages successful", m_name);
}

void DeviceWorker::run()
{
    LOGGER_INFO("DeviceWorker[{}]: started for {}", m_name, m_endpoint->describe());

    auto next_tick = std::chrono::steady_clock::now();
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_wakeup.wait_until(lock, next_tick,
                                [this] { return m_stop_requested || !m_outbox.empty(); });
            if (m_stop_requested)
            {
                lock.unlock();
                discard_posts();
                LOGGER_INFO("DeviceWorker[{}]: stopped", m_name);
                return;
            }
        }

        flush_posts();

        if (std::chrono::steady_clock::now() < next_tick)
        {
            continue;
        }
        if (!check_in_service())
        {
            break;
        }
        poll_once();
        next_tick = std::chrono::steady_clock::now() + m_options.poll_interval;
    }

    discard_posts();
    LOGGER_INFO("DeviceWorker[{}]: drained, exiting", m_name);
    m_listener.on_worker_finished(m_name);
}

} // namespace irbridge::bridge
