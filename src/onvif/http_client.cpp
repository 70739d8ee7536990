#include "http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace onvifcore
{
namespace onvif
{
namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;
using boost::system::error_code;
using boost::system::system_error;
using std::chrono::steady_clock;


static std::string host_header(const HttpRequest& request)
{
    auto host = request.host;
    if (host.find(':') != std::string::npos)
    {
        host = "[" + host + "]";
    }
    if (request.port != "80")
    {
        host += ":" + request.port;
    }
    return host;
}


HttpResponse http_post(const HttpRequest& request, steady_clock::duration timeout)
{
    boost::asio::io_context io;
    tcp::resolver resolver(io);
    beast::tcp_stream stream(io);
    const auto deadline = steady_clock::now() + timeout;

    http::request<http::string_body> req { http::verb::post, request.target, 11 };
    req.set(http::field::host, host_header(request));
    req.set(http::field::user_agent, "onvifcore");
    req.set(http::field::content_type, request.content_type);
    if (!request.authorization.empty())
    {
        req.set(http::field::authorization, request.authorization);
    }
    req.body() = request.body;
    req.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    error_code result;

    auto on_read = [&](const error_code& ec, std::size_t) {
        result = ec;
        error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    };
    auto on_write = [&](const error_code& ec, std::size_t) {
        if (ec) { result = ec; return; }
        http::async_read(stream, buffer, res, on_read);
    };
    auto on_connect = [&](const error_code& ec, const tcp::endpoint&) {
        if (ec) { result = ec; return; }
        http::async_write(stream, req, on_write);
    };
    resolver.async_resolve(request.host, request.port,
        [&](const error_code& ec, const tcp::resolver::results_type& endpoints) {
            if (ec) { result = ec; return; }
            stream.expires_at(deadline);
            stream.async_connect(endpoints, on_connect);
        });

    io.run_until(deadline);
    if (!io.stopped())
    {
        resolver.cancel();
        stream.cancel();
        io.run();
        result = boost::asio::error::timed_out;
    }
    if (result == beast::error::timeout)
    {
        result = boost::asio::error::timed_out;
    }
    if (result)
    {
        throw system_error(result, request.host + ":" + request.port + request.target);
    }

    HttpResponse response;
    response.status = res.result_int();
    const auto challenges = res.equal_range(http::field::www_authenticate);
    for (auto it = challenges.first; it != challenges.second; ++it)
    {
        response.www_authenticate.emplace_back(it->value());
    }
    response.body = std::move(res.body());
    return response;
}

} //end namespace onvif
} //end namespace onvifcore
