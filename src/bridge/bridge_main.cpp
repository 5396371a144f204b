/**
 * @file bridge_main.cpp
 * @brief irbridge: IRKit <-> ZeroMQ bus bridge.
 *
 * Usage:
 *   irbridge [-H <host>] [-p <port>] [--publish-port <port>]
 *            [-c <bridge.json>] [-l <logging.json>]
 *
 * Command-line options override the values in the bridge config file.
 */
#include "irb_service.hpp"

#include "bridge/bridge_config.hpp"
#include "bridge/bridge_service.hpp"
#include "http_device_endpoint.hpp"
#include "mdns_browser.hpp"
#include "zmq_bus_client.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace irbridge::utils;

// ---------------------------------------------------------------------------
// Global shutdown flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static std::atomic<bool>                   g_shutdown{false};
static irbridge::bridge::BridgeService    *g_service_ptr{nullptr}; // NOLINT

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // second signal: fast exit
    g_shutdown.store(true, std::memory_order_relaxed);
    if (g_service_ptr != nullptr)
        g_service_ptr->stop();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct BridgeArgs
{
    std::string                  config_path;
    std::string                  logging_path;
    std::optional<std::string>   host;
    std::optional<std::uint16_t> port;
    std::optional<std::uint16_t> publish_port;
};

void print_usage(const char *prog)
{
    std::cout << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -H, --host <host>         Bus proxy host (default: localhost)\n"
              << "  -p, --port <port>         Bus proxy port (default: 1883)\n"
              << "      --publish-port <port> Bus proxy subscriber port (default: port + 1)\n"
              << "  -c, --config <path>       Bridge configuration JSON file\n"
              << "  -l, --logging <path>      Logging configuration JSON file\n"
              << "  -h, --help                Show this message\n";
}

std::uint16_t parse_port(std::string_view opt, const char *value)
{
    char *end = nullptr;
    const long port = std::strtol(value, &end, 10);
    if (end == value || *end != '\0' || port < 1 || port > 65535)
    {
        std::cerr << "Error: invalid value for " << opt << ": '" << value << "'\n";
        std::exit(1);
    }
    return static_cast<std::uint16_t>(port);
}

BridgeArgs parse_args(int argc, char *argv[])
{
    BridgeArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        const auto next_value = [&]() -> const char *
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires an argument\n";
                std::exit(1);
            }
            return argv[++i]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        };

        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        else if (arg == "--host" || arg == "-H")
        {
            args.host = next_value();
        }
        else if (arg == "--port" || arg == "-p")
        {
            args.port = parse_port(arg, next_value());
        }
        else if (arg == "--publish-port")
        {
            args.publish_port = parse_port(arg, next_value());
        }
        else if (arg == "--config" || arg == "-c")
        {
            args.config_path = next_value();
        }
        else if (arg == "--logging" || arg == "-l")
        {
            args.logging_path = next_value();
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const BridgeArgs args = parse_args(argc, argv);

    // ── Load config (before lifecycle, so errors go straight to stderr) ───────
    irbridge::bridge::BridgeConfig  config;
    irbridge::bridge::LoggingConfig logging;
    try
    {
        if (!args.config_path.empty())
            config = irbridge::bridge::BridgeConfig::from_json_file(args.config_path);
        if (!args.logging_path.empty())
            logging = irbridge::bridge::LoggingConfig::from_json_file(args.logging_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (args.host)
        config.bus.host = *args.host;
    if (args.port)
        config.bus.port = *args.port;
    if (args.publish_port)
        config.bus.publish_port = *args.publish_port;
    try
    {
        config.bus.validate();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // ── Lifecycle ─────────────────────────────────────────────────────────────
    LifecycleGuard lifecycle(
        MakeModDefList(Logger::GetLifecycleModule(), irbridge::GetZMQContextModule()));

    if (!logging.apply())
    {
        std::cerr << "Logging setup failed; continuing on the console.\n";
    }

    // ── Collaborators ─────────────────────────────────────────────────────────
    irbridge::bridge::ZmqBusClient bus(
        irbridge::get_zmq_context(),
        {config.bus.host, config.bus.port, config.bus.effective_publish_port()});

    irbridge::bridge::MdnsBrowser discovery({config.discovery.service_type,
                                             config.discovery.query_interval,
                                             config.discovery.interface_address});

    irbridge::bridge::HttpDeviceEndpointFactory endpoints;

    irbridge::bridge::BridgeService::Config service_cfg;
    service_cfg.service_type = config.discovery.service_type;
    service_cfg.topic_base   = config.topic_base;
    service_cfg.device       = config.device;

    irbridge::bridge::BridgeService service(std::move(service_cfg), bus, discovery, endpoints);
    g_service_ptr = &service;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LOGGER_INFO("irbridge: bus {}:{}/{}, browsing '{}'", config.bus.host, config.bus.port,
                config.bus.effective_publish_port(), config.discovery.service_type);

    try
    {
        service.run();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("irbridge: fatal: {}", e.what());
        g_service_ptr = nullptr;
        return 1;
    }

    g_service_ptr = nullptr;
    return 0;
}
