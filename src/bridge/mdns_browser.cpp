#include "mdns_browser.hpp"

#include "utils/logger.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>

namespace irbridge::bridge
{

namespace net = boost::asio;
using udp = net::ip::udp;

namespace
{
constexpr const char* kMdnsGroup = "224.0.0.251";
constexpr unsigned short kMdnsPort = 5353;
} // namespace

MdnsBrowser::MdnsBrowser(Config cfg)
    : m_cfg(std::move(cfg))
    , m_socket(m_ioc)
    , m_query_timer(m_ioc)
    , m_group(net::ip::make_address_v4(kMdnsGroup), kMdnsPort)
    , m_query(dns::build_ptr_query(m_cfg.service_type))
{
}

MdnsBrowser::~MdnsBrowser()
{
    stop();
}

void MdnsBrowser::open_socket()
{
    const auto iface = net::ip::make_address_v4(m_cfg.interface_address);
    const udp::endpoint listen_ep(net::ip::address_v4::any(), kMdnsPort);

    m_socket.open(listen_ep.protocol());
    m_socket.set_option(udp::socket::reuse_address(true));
    m_socket.bind(listen_ep);
    m_socket.set_option(net::ip::multicast::join_group(m_group.address().to_v4(), iface));
    if (!iface.is_unspecified())
    {
        m_socket.set_option(net::ip::multicast::outbound_interface(iface));
    }
    m_socket.set_option(net::ip::multicast::hops(255));
}

void MdnsBrowser::start(DiscoveryListener& listener)
{
    m_tracker = std::make_unique<MdnsServiceTracker>(m_cfg.service_type, listener);
    open_socket();
    do_receive();
    send_query();
    schedule_query();

    m_thread = std::thread(
        [this]()
        {
            try
            {
                m_ioc.run();
            }
            catch (const std::exception& e)
            {
                LOGGER_ERROR("mDNS: I/O thread terminated: {}", e.what());
            }
        });
    LOGGER_INFO("mDNS: browsing '{}' every {} ms", m_cfg.service_type,
                m_cfg.query_interval.count());
}

void MdnsBrowser::stop()
{
    if (!m_thread.joinable())
    {
        return;
    }
    net::post(m_ioc,
              [this]()
              {
                  boost::system::error_code ec;
                  m_query_timer.cancel();
                  m_socket.close(ec);
              });
    // With the socket closed and the timer cancelled, run() runs out of work.
    m_thread.join();
    LOGGER_INFO("mDNS: stopped");
}

void MdnsBrowser::do_receive()
{
    m_socket.async_receive_from(
        net::buffer(m_rx_buffer), m_sender,
        [this](const boost::system::error_code& ec, std::size_t bytes)
        {
            if (ec == net::error::operation_aborted)
            {
                return;
            }
            if (ec)
            {
                LOGGER_WARN("mDNS: receive failed: {}", ec.message());
            }
            else
            {
                try
                {
                    const auto msg = dns::parse(m_rx_buffer.data(), bytes);
                    m_tracker->ingest(msg, MdnsServiceTracker::Clock::now());
                }
                catch (const dns::ParseError& e)
                {
                    LOGGER_DEBUG("mDNS: dropped malformed packet from {}: {}",
                                 m_sender.address().to_string(), e.what());
                }
            }
            do_receive();
        });
}

void MdnsBrowser::send_query()
{
    boost::system::error_code ec;
    m_socket.send_to(net::buffer(m_query), m_group, 0, ec);
    if (ec)
    {
        LOGGER_WARN("mDNS: query send failed: {}", ec.message());
    }
}

void MdnsBrowser::schedule_query()
{
    m_query_timer.expires_after(m_cfg.query_interval);
    m_query_timer.async_wait(
        [this](const boost::system::error_code& ec)
        {
            if (ec)
            {
                return;
            }
            m_tracker->expire(MdnsServiceTracker::Clock::now());
            send_query();
            schedule_query();
        });
}

} // namespace irbridge::bridge
