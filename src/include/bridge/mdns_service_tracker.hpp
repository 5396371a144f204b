#pragma once
/**
 * @file mdns_service_tracker.hpp
 * @brief Turns decoded mDNS responses into added/removed service events.
 *
 * An instance is announced once its PTR, SRV and A records are all known,
 * and again if its address or port changes. It is removed on a goodbye
 * (TTL 0) for its PTR or SRV record, or when its PTR record expires.
 *
 * Not thread-safe; the browser drives it from its I/O thread.
 */
#include "bridge/discovery_source.hpp"
#include "bridge/dns_message.hpp"

#include <chrono>
#include <string>
#include <unordered_map>

namespace irbridge::bridge
{

class MdnsServiceTracker
{
public:
    using Clock = std::chrono::steady_clock;

    MdnsServiceTracker(std::string service_type, DiscoveryListener& listener);

    void ingest(const dns::Message& message, Clock::time_point now);

    /// Removes instances whose PTR record has expired.
    void expire(Clock::time_point now);

    [[nodiscard]] std::size_t known_instances() const noexcept { return m_instances.size(); }

private:
    struct Instance
    {
        std::string name; ///< As announced, with trailing dot
        std::string target;
        std::uint16_t port{0};
        Clock::time_point expires;
        bool announced{false};
        std::string announced_address;
        std::uint16_t announced_port{0};
    };

    struct Host
    {
        std::string address;
        Clock::time_point expires;
    };

    void remove(const std::string& key);
    void resolve(Instance& inst);

    const std::string m_service_type;  ///< As configured, reported in events
    const std::string m_service_key;   ///< Normalized, for matching
    DiscoveryListener& m_listener;
    std::unordered_map<std::string, Instance> m_instances; // key: normalized instance name
    std::unordered_map<std::string, Host> m_hosts;         // key: normalized host name
};

} // namespace irbridge::bridge
