#include "irb_service.hpp"
#include "bus_proxy.hpp"

#include <csignal>
#include <string>

namespace
{
irbridge::proxy::BusProxy* g_proxy = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_proxy != nullptr)
    {
        g_proxy->stop();
    }
}
} // namespace

// Usage: irbridge_proxy [frontend-endpoint [backend-endpoint]]
int main(int argc, char* argv[])
{
    irbridge::utils::LifecycleGuard lifecycle(irbridge::utils::MakeModDefList(
        irbridge::utils::Logger::GetLifecycleModule(), irbridge::GetZMQContextModule()));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    irbridge::proxy::BusProxy::Config cfg;
    if (argc >= 2) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    {
        cfg.frontend = argv[1]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (argc >= 3)
    {
        cfg.backend = argv[2]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    irbridge::proxy::BusProxy proxy(irbridge::get_zmq_context(), cfg);
    g_proxy = &proxy;

    LOGGER_INFO("irbridge-proxy starting on {} / {}", cfg.frontend, cfg.backend);
    proxy.run();
    g_proxy = nullptr;

    return 0;
}
