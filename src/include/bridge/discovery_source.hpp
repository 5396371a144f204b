#pragma once
/**
 * @file discovery_source.hpp
 * @brief Service discovery events consumed by the bridge.
 *
 * Sources may announce the same service more than once and may report a
 * removal concurrently with an addition; consumers must tolerate both.
 */
#include <cstdint>
#include <string>

namespace irbridge::bridge
{

struct ServiceInfo
{
    std::string name;    ///< Instance name, e.g. "IRKitD2A4._irkit._tcp.local."
    std::string type;    ///< Service type, e.g. "_irkit._tcp.local."
    std::string address; ///< Dotted IPv4 address
    std::uint16_t port{0};
};

class DiscoveryListener
{
public:
    virtual ~DiscoveryListener() = default;

    virtual void on_service_added(const ServiceInfo& info) = 0;
    virtual void on_service_removed(const std::string& name, const std::string& type) = 0;
};

class DiscoverySource
{
public:
    virtual ~DiscoverySource() = default;

    virtual void start(DiscoveryListener& listener) = 0;
    virtual void stop() = 0;
};

} // namespace irbridge::bridge
