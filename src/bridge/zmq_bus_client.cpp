#include "zmq_bus_client.hpp"

#include "utils/logger.hpp"

#include <zmq_addon.hpp>

#include <chrono>
#include <iterator>

namespace irbridge::bridge
{

namespace
{
constexpr std::chrono::milliseconds kPollTimeout{100};
constexpr int kLingerMs = 200;
constexpr const char* kMonitorEndpoint = "inproc://irbridge.bus.sub.monitor";

std::string tcp_endpoint(const std::string& host, std::uint16_t port)
{
    return "tcp://" + host + ":" + std::to_string(port);
}

// Reports connects of the SUB socket; every one of them (first connect or
// reconnect after the proxy restarted) is forwarded to the listener.
class ConnectMonitor : public zmq::monitor_t
{
public:
    explicit ConnectMonitor(BusListener& listener) : m_listener(listener) {}

    void on_event_connected(const zmq_event_t& /*event*/, const char* addr) override
    {
        LOGGER_INFO("ZmqBusClient: connected to {}", addr);
        m_listener.on_connected();
    }

    void on_event_disconnected(const zmq_event_t& /*event*/, const char* addr) override
    {
        LOGGER_WARN("ZmqBusClient: disconnected from {}", addr);
    }

private:
    BusListener& m_listener;
};
} // namespace

ZmqBusClient::ZmqBusClient(zmq::context_t& context, Config cfg)
    : m_context(context), m_cfg(std::move(cfg))
{
}

ZmqBusClient::~ZmqBusClient()
{
    stop();
}

void ZmqBusClient::start(BusListener& listener)
{
    {
        std::lock_guard<std::mutex> lock(m_pub_mutex);
        m_pub = std::make_unique<zmq::socket_t>(m_context, zmq::socket_type::pub);
        m_pub->set(zmq::sockopt::linger, kLingerMs);
        m_pub->connect(tcp_endpoint(m_cfg.host, m_cfg.port));
    }
    m_stop_requested.store(false, std::memory_order_release);
    m_rx_thread = std::thread(&ZmqBusClient::run, this, std::ref(listener));
    LOGGER_INFO("ZmqBusClient: publishing to {}, subscribing from {}",
                tcp_endpoint(m_cfg.host, m_cfg.port),
                tcp_endpoint(m_cfg.host, m_cfg.publish_port));
}

void ZmqBusClient::stop()
{
    m_stop_requested.store(true, std::memory_order_release);
    if (m_rx_thread.joinable())
    {
        m_rx_thread.join();
    }
    std::lock_guard<std::mutex> lock(m_pub_mutex);
    m_pub.reset();
}

void ZmqBusClient::publish(const std::string& topic, const std::string& payload)
{
    std::lock_guard<std::mutex> lock(m_pub_mutex);
    if (!m_pub)
    {
        LOGGER_WARN("ZmqBusClient: not started, dropped message for '{}'", topic);
        return;
    }
    try
    {
        m_pub->send(zmq::buffer(topic), zmq::send_flags::sndmore);
        m_pub->send(zmq::buffer(payload), zmq::send_flags::none);
    }
    catch (const zmq::error_t& e)
    {
        LOGGER_WARN("ZmqBusClient: publish to '{}' failed: {}", topic, e.what());
    }
}

void ZmqBusClient::subscribe(const std::string& topic)
{
    std::lock_guard<std::mutex> lock(m_sub_mutex);
    if (m_topics.insert(topic).second)
    {
        m_pending_changes.push_back({true, topic});
    }
}

void ZmqBusClient::unsubscribe(const std::string& topic)
{
    std::lock_guard<std::mutex> lock(m_sub_mutex);
    if (m_topics.erase(topic) != 0)
    {
        m_pending_changes.push_back({false, topic});
    }
}

void ZmqBusClient::apply_subscription_changes(zmq::socket_t& sub)
{
    std::vector<SubscriptionChange> changes;
    {
        std::lock_guard<std::mutex> lock(m_sub_mutex);
        changes.swap(m_pending_changes);
    }
    for (const auto& change : changes)
    {
        if (change.subscribe)
        {
            sub.set(zmq::sockopt::subscribe, change.topic);
            LOGGER_DEBUG("ZmqBusClient: subscribed '{}'", change.topic);
        }
        else
        {
            sub.set(zmq::sockopt::unsubscribe, change.topic);
            LOGGER_DEBUG("ZmqBusClient: unsubscribed '{}'", change.topic);
        }
    }
}

void ZmqBusClient::run(BusListener& listener)
{
    zmq::socket_t sub(m_context, zmq::socket_type::sub);
    sub.set(zmq::sockopt::linger, 0);

    ConnectMonitor monitor(listener);
    monitor.init(sub, kMonitorEndpoint, ZMQ_EVENT_CONNECTED | ZMQ_EVENT_DISCONNECTED);
    sub.connect(tcp_endpoint(m_cfg.host, m_cfg.publish_port));

    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        apply_subscription_changes(sub);
        while (monitor.check_event(0))
        {
        }

        std::vector<zmq::pollitem_t> items = {{sub.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);
        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            continue;
        }

        std::vector<zmq::message_t> frames;
        try
        {
            static_cast<void>(zmq::recv_multipart(sub, std::back_inserter(frames),
                                                  zmq::recv_flags::dontwait));
        }
        catch (const zmq::error_t& e)
        {
            LOGGER_WARN("ZmqBusClient: receive failed: {}", e.what());
            continue;
        }
        if (frames.size() != 2)
        {
            LOGGER_WARN("ZmqBusClient: dropped message with {} frame(s)", frames.size());
            continue;
        }

        auto topic = frames[0].to_string();
        {
            // SUB filters by prefix; deliver exact matches only.
            std::lock_guard<std::mutex> lock(m_sub_mutex);
            if (m_topics.count(topic) == 0)
            {
                continue;
            }
        }
        listener.on_message(topic, frames[1].to_string());
    }

    monitor.abort();
}

} // namespace irbridge::bridge
