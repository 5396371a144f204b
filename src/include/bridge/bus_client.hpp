#pragma once
/**
 * @file bus_client.hpp
 * @brief Abstract publish/subscribe bus used by the bridge.
 *
 * Payloads are JSON text. Implementations deliver a message only for topics
 * that were subscribed exactly (no prefix or wildcard matching).
 */
#include <string>

namespace irbridge::bridge
{

class BusListener
{
public:
    virtual ~BusListener() = default;

    /// Called on every (re)connection to the bus.
    virtual void on_connected() = 0;

    virtual void on_message(const std::string& topic, const std::string& payload) = 0;
};

class BusClient
{
public:
    virtual ~BusClient() = default;

    virtual void start(BusListener& listener) = 0;
    virtual void stop() = 0;

    /// Thread-safe. Failures are logged by the implementation, not thrown.
    virtual void publish(const std::string& topic, const std::string& payload) = 0;

    /// Thread-safe and idempotent.
    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;
};

} // namespace irbridge::bridge
