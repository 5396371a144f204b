#pragma once
/**
 * @file zmq_bus_client.hpp
 * @brief BusClient over ZeroMQ PUB/SUB, talking to an XSUB/XPUB proxy.
 *
 * Wire format: two-frame multipart message [topic][JSON payload].
 *
 * The SUB socket belongs to the receive thread. subscribe()/unsubscribe()
 * only queue a request, which the receive thread applies on its next cycle.
 * The PUB socket is shared by all publishers under a mutex.
 */
#include "bridge/bus_client.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace irbridge::bridge
{

class ZmqBusClient : public BusClient
{
public:
    struct Config
    {
        std::string host{"localhost"};
        std::uint16_t port{1883};         ///< Proxy XSUB (publishers connect here)
        std::uint16_t publish_port{1884}; ///< Proxy XPUB (subscribers connect here)
    };

    ZmqBusClient(zmq::context_t& context, Config cfg);
    ~ZmqBusClient() override;

    ZmqBusClient(const ZmqBusClient&) = delete;
    ZmqBusClient& operator=(const ZmqBusClient&) = delete;

    void start(BusListener& listener) override;
    void stop() override;

    void publish(const std::string& topic, const std::string& payload) override;
    void subscribe(const std::string& topic) override;
    void unsubscribe(const std::string& topic) override;

private:
    struct SubscriptionChange
    {
        bool subscribe;
        std::string topic;
    };

    void run(BusListener& listener);
    void apply_subscription_changes(zmq::socket_t& sub);

    zmq::context_t& m_context;
    Config m_cfg;

    std::mutex m_pub_mutex;
    std::unique_ptr<zmq::socket_t> m_pub;

    std::mutex m_sub_mutex;
    std::vector<SubscriptionChange> m_pending_changes;
    std::set<std::string> m_topics; // guarded by m_sub_mutex

    std::atomic<bool> m_stop_requested{false};
    std::thread m_rx_thread;
};

} // namespace irbridge::bridge
