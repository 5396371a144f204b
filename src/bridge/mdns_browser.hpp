#pragma once
/**
 * @file mdns_browser.hpp
 * @brief DiscoverySource that browses one service type over multicast DNS.
 *
 * Runs its own Boost.Asio I/O thread: it listens on 224.0.0.251:5353,
 * sends a PTR query for the service type on start and every query
 * interval, and feeds every response into an MdnsServiceTracker.
 */
#include "bridge/discovery_source.hpp"
#include "bridge/mdns_service_tracker.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace irbridge::bridge
{

class MdnsBrowser : public DiscoverySource
{
public:
    struct Config
    {
        std::string service_type{"_irkit._tcp.local."};
        std::chrono::milliseconds query_interval{10000};
        std::string interface_address{"0.0.0.0"};
    };

    explicit MdnsBrowser(Config cfg);
    ~MdnsBrowser() override;

    MdnsBrowser(const MdnsBrowser&) = delete;
    MdnsBrowser& operator=(const MdnsBrowser&) = delete;

    /// @throws boost::system::system_error if the multicast socket cannot be set up.
    void start(DiscoveryListener& listener) override;
    void stop() override;

private:
    void open_socket();
    void do_receive();
    void schedule_query();
    void send_query();

    Config m_cfg;
    boost::asio::io_context m_ioc;
    boost::asio::ip::udp::socket m_socket;
    boost::asio::steady_timer m_query_timer;
    boost::asio::ip::udp::endpoint m_sender;
    boost::asio::ip::udp::endpoint m_group;
    std::array<std::uint8_t, 9000> m_rx_buffer{};
    std::vector<std::uint8_t> m_query;
    std::unique_ptr<MdnsServiceTracker> m_tracker;
    std::thread m_thread;
};

} // namespace irbridge::bridge
