#pragma once
/**
 * @file http_device_endpoint.hpp
 * @brief DeviceEndpoint over plain HTTP/1.1 (Boost.Beast, synchronous).
 */
#include "bridge/device_endpoint.hpp"

#include <boost/beast/http/verb.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace irbridge::bridge
{

class HttpDeviceEndpoint : public DeviceEndpoint
{
public:
    HttpDeviceEndpoint(std::string address, std::uint16_t port);

    [[nodiscard]] DeviceIoResult get_messages(std::chrono::milliseconds timeout) override;
    [[nodiscard]] DeviceIoResult post_messages(const std::string& body,
                                               std::chrono::milliseconds timeout) override;
    [[nodiscard]] std::string describe() const override;

private:
    DeviceIoResult request(boost::beast::http::verb method, const std::string& body,
                           std::chrono::milliseconds timeout);

    std::string m_address;
    std::uint16_t m_port;
};

class HttpDeviceEndpointFactory : public DeviceEndpointFactory
{
public:
    [[nodiscard]] std::unique_ptr<DeviceEndpoint> create(const std::string& address,
                                                         std::uint16_t port) override;
};

} // namespace irbridge::bridge
