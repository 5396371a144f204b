#include "http_device_endpoint.hpp"

#include "utils/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace irbridge::bridge
{

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace
{
constexpr const char* kMessagesPath = "/messages";
constexpr int kHttpVersion = 11;

DeviceIoResult map_error(const beast::error_code& ec)
{
    if (ec == beast::error::timeout)
    {
        return DeviceIoResult::error(DeviceIoError::Timeout);
    }
    if (ec.category() == http::make_error_code(http::error::end_of_stream).category() || ec == net::error::eof)
    {
        return DeviceIoResult::error(DeviceIoError::Protocol, ec.value());
    }
    return DeviceIoResult::error(DeviceIoError::ConnectionFailed, ec.value());
}
} // namespace

HttpDeviceEndpoint::HttpDeviceEndpoint(std::string address, std::uint16_t port)
    : m_address(std::move(address)), m_port(port)
{
}

std::string HttpDeviceEndpoint::describe() const
{
    return m_address + ":" + std::to_string(m_port);
}

DeviceIoResult HttpDeviceEndpoint::get_messages(std::chrono::milliseconds timeout)
{
    return request(http::verb::get, {}, timeout);
}

DeviceIoResult HttpDeviceEndpoint::post_messages(const std::string& body,
                                                 std::chrono::milliseconds timeout)
{
    return request(http::verb::post, body, timeout);
}

// One connection per request. tcp_stream applies its deadline to
// asynchronous operations only, so the exchange runs as an async chain on a
// private io_context; the single deadline covers connect, write and read.
DeviceIoResult HttpDeviceEndpoint::request(http::verb method, const std::string& body,
                                           std::chrono::milliseconds timeout)
{
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    const auto endpoints = resolver.resolve(m_address, std::to_string(m_port), ec);
    if (ec)
    {
        return DeviceIoResult::error(DeviceIoError::ConnectionFailed, ec.value());
    }

    http::request<http::string_body> req{method, kMessagesPath, kHttpVersion};
    req.set(http::field::host, describe());
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    // IRKit refuses requests that do not carry this header.
    req.set("X-Requested-With", "curl");
    if (method == http::verb::post)
    {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    stream.expires_after(timeout);
    stream.async_connect(
        endpoints,
        [&](beast::error_code connect_ec, const tcp::endpoint& /*ep*/)
        {
            if (connect_ec)
            {
                ec = connect_ec;
                return;
            }
            http::async_write(
                stream, req,
                [&](beast::error_code write_ec, std::size_t /*bytes*/)
                {
                    if (write_ec)
                    {
                        ec = write_ec;
                        return;
                    }
                    http::async_read(stream, buffer, res,
                                     [&](beast::error_code read_ec, std::size_t /*bytes*/)
                                     { ec = read_ec; });
                });
        });
    ioc.run();

    if (ec)
    {
        return map_error(ec);
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    const auto status = static_cast<int>(res.result_int());
    if (status < 200 || status >= 300)
    {
        return DeviceIoResult::error(DeviceIoError::HttpStatus, status);
    }
    return DeviceIoResult::ok(std::move(res.body()));
}

std::unique_ptr<DeviceEndpoint> HttpDeviceEndpointFactory::create(const std::string& address,
                                                                  std::uint16_t port)
{
    return std::make_unique<HttpDeviceEndpoint>(address, port);
}

} // namespace irbridge::bridge
