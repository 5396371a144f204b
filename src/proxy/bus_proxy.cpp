#include "bus_proxy.hpp"

#include "utils/logger.hpp"

#include <zmq_addon.hpp>

#include <chrono>
#include <iterator>
#include <vector>

namespace irbridge::proxy
{

namespace
{
constexpr std::chrono::milliseconds kPollTimeout{100};
} // namespace

BusProxy::BusProxy(zmq::context_t& context, Config cfg) : m_context(context), m_cfg(std::move(cfg))
{
}

void BusProxy::stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

// Moves one multipart message; returns false if it could not be sent.
bool BusProxy::forward(zmq::socket_t& from, zmq::socket_t& to)
{
    std::vector<zmq::message_t> frames;
    static_cast<void>(zmq::recv_multipart(from, std::back_inserter(frames)));
    if (frames.empty())
    {
        return false;
    }
    return zmq::send_multipart(to, frames).has_value();
}

void BusProxy::run()
{
    zmq::socket_t frontend(m_context, zmq::socket_type::xsub);
    zmq::socket_t backend(m_context, zmq::socket_type::xpub);
    frontend.set(zmq::sockopt::linger, 0);
    backend.set(zmq::sockopt::linger, 0);

    frontend.bind(m_cfg.frontend);
    backend.bind(m_cfg.backend);
    const std::string bound_front = frontend.get(zmq::sockopt::last_endpoint);
    const std::string bound_back = backend.get(zmq::sockopt::last_endpoint);
    LOGGER_INFO("BusProxy: publishers -> {}, subscribers -> {}", bound_front, bound_back);
    if (m_cfg.on_ready)
    {
        m_cfg.on_ready(bound_front, bound_back);
    }

    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        std::vector<zmq::pollitem_t> items = {{frontend.handle(), 0, ZMQ_POLLIN, 0},
                                              {backend.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);

        try
        {
            if ((items[0].revents & ZMQ_POLLIN) != 0 && forward(frontend, backend))
            {
                m_forwarded.fetch_add(1, std::memory_order_relaxed);
            }
            if ((items[1].revents & ZMQ_POLLIN) != 0)
            {
                // Subscription frames: first byte 1 = subscribe, 0 = unsubscribe.
                static_cast<void>(forward(backend, frontend));
            }
        }
        catch (const zmq::error_t& e)
        {
            LOGGER_WARN("BusProxy: forwarding failed: {}", e.what());
        }
    }

    frontend.close();
    backend.close();
    LOGGER_INFO("BusProxy: stopped after {} message(s).", m_forwarded.load());
}

} // namespace irbridge::proxy
