#pragma once
/**
 * @file bus_proxy.hpp
 * @brief XSUB/XPUB forwarder that acts as the message bus for irbridge.
 *
 * Publishers connect to the frontend (XSUB), subscribers to the backend
 * (XPUB). Messages flow frontend -> backend; subscription requests flow
 * backend -> frontend.
 */
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace irbridge::proxy
{

class BusProxy
{
public:
    struct Config
    {
        std::string frontend{"tcp://0.0.0.0:1883"};
        std::string backend{"tcp://0.0.0.0:1884"};
        /// Optional: called from run() after bind() with the bound endpoints.
        /// Useful for tests using dynamic port assignment ("tcp://127.0.0.1:*").
        std::function<void(const std::string& frontend, const std::string& backend)> on_ready;
    };

    BusProxy(zmq::context_t& context, Config cfg);

    BusProxy(const BusProxy&) = delete;
    BusProxy& operator=(const BusProxy&) = delete;

    /**
     * @brief Main loop. Blocks until stop() is called.
     * Polls both sockets with a 100ms timeout; checks m_stop_requested each cycle.
     */
    void run();

    /// Signal the run() loop to exit. Thread-safe.
    void stop();

    [[nodiscard]] std::uint64_t forwarded_messages() const noexcept
    {
        return m_forwarded.load(std::memory_order_relaxed);
    }

private:
    static bool forward(zmq::socket_t& from, zmq::socket_t& to);

    zmq::context_t& m_context;
    Config m_cfg;
    std::atomic<bool> m_stop_requested{false};
    std::atomic<std::uint64_t> m_forwarded{0};
};

} // namespace irbridge::proxy
