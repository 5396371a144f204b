#pragma once
/**
 * @file device_endpoint.hpp
 * @brief The device's HTTP control surface, as seen by a DeviceWorker.
 *
 * GET  /messages   returns the last received signal (or an empty body)
 * POST /messages   transmits a signal
 */
#include "utils/result.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace irbridge::bridge
{

enum class DeviceIoError
{
    Timeout,          ///< No complete response within the call's timeout
    ConnectionFailed, ///< Resolve or connect failed (error_code() holds the system error)
    HttpStatus,       ///< Non-2xx response (error_code() holds the status)
    Protocol          ///< Malformed HTTP exchange
};

inline const char* to_string(DeviceIoError err) noexcept
{
    switch (err)
    {
    case DeviceIoError::Timeout:
        return "Timeout";
    case DeviceIoError::ConnectionFailed:
        return "ConnectionFailed";
    case DeviceIoError::HttpStatus:
        return "HttpStatus";
    case DeviceIoError::Protocol:
        return "Protocol";
    default:
        return "Unknown";
    }
}

/// Response body on success.
using DeviceIoResult = Result<std::string, DeviceIoError>;

class DeviceEndpoint
{
public:
    virtual ~DeviceEndpoint() = default;

    [[nodiscard]] virtual DeviceIoResult get_messages(std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual DeviceIoResult post_messages(const std::string& body,
                                                       std::chrono::milliseconds timeout) = 0;

    /// "address:port", for log lines.
    [[nodiscard]] virtual std::string describe() const = 0;
};

class DeviceEndpointFactory
{
public:
    virtual ~DeviceEndpointFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<DeviceEndpoint> create(const std::string& address,
                                                                 std::uint16_t port) = 0;
};

} // namespace irbridge::bridge
