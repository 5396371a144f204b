#pragma once
/**
 * @file bridge_config.hpp
 * @brief Bridge configuration, loaded from JSON and overridden by the CLI.
 *
 * Example:
 * @code{.json}
 * {
 *   "bus":       { "host": "localhost", "port": 1883, "publish_port": 1884 },
 *   "discovery": { "service_type": "_irkit._tcp.local.", "query_interval_ms": 10000,
 *                  "interface": "0.0.0.0" },
 *   "device":    { "poll_interval_ms": 5000, "drain_ticks": 60, "get_timeout_ms": 3000,
 *                  "post_timeout_ms": 5000, "recent_cache_size": 5 },
 *   "topic_base": "irkit/"
 * }
 * @endcode
 * Every key is optional. A present key with a wrong type or out-of-range
 * value throws std::runtime_error naming the key.
 */
#include "bridge/device_worker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace irbridge::bridge
{

inline constexpr const char* kDefaultServiceType = "_irkit._tcp.local.";

struct BusConfig
{
    std::string host{"localhost"};
    std::uint16_t port{1883};
    /// Subscriber side of the proxy; 0 means port + 1.
    std::uint16_t publish_port{0};

    [[nodiscard]] std::uint16_t effective_publish_port() const noexcept
    {
        return publish_port != 0 ? publish_port : static_cast<std::uint16_t>(port + 1);
    }

    /// @throws std::runtime_error if port is 65535 and publish_port is unset.
    void validate() const;
};

struct DiscoveryConfig
{
    std::string service_type{kDefaultServiceType};
    std::chrono::milliseconds query_interval{10000};
    /// Local IPv4 address of the interface used for multicast.
    std::string interface_address{"0.0.0.0"};
};

struct BridgeConfig
{
    BusConfig bus;
    DiscoveryConfig discovery;
    DeviceWorkerOptions device;
    std::string topic_base{"irkit/"};

    /// @throws std::runtime_error on unreadable file, bad JSON or invalid value.
    static BridgeConfig from_json_file(const std::string& path);
    /// @throws std::runtime_error on invalid value.
    static BridgeConfig from_json(const nlohmann::json& j);
};

/**
 * @brief Logger settings: {"level": "info", "sink": "console"|"file"|"syslog", "path": "..."}
 */
struct LoggingConfig
{
    enum class Sink
    {
        Console,
        File,
        Syslog
    };

    std::string level{"info"};
    Sink sink{Sink::Console};
    std::string path;

    /// @throws std::runtime_error on unreadable file, bad JSON or invalid value.
    static LoggingConfig from_json_file(const std::string& path);
    static LoggingConfig from_json(const nlohmann::json& j);

    /// Applies level and sink to the running Logger. Returns false if the sink failed.
    bool apply() const;
};

} // namespace irbridge::bridge
