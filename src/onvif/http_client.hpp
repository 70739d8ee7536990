#ifndef __ONVIFCORE_HTTP_CLIENT_H__
#define __ONVIFCORE_HTTP_CLIENT_H__
/**
 * @file http_client.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Minimal blocking HTTP/1.1 client used to reach device services
 */
#include <chrono>
#include <string>
#include <vector>

namespace onvifcore
{
namespace onvif
{

struct HttpRequest
{
    std::string host;
    std::string port { "80" };
    std::string target { "/" };
    std::string content_type;
    std::string authorization;      // Authorization header value, omitted when empty
    std::string body;
};

struct HttpResponse
{
    unsigned status { 0 };
    std::vector<std::string> www_authenticate;     // every WWW-Authenticate header, in order
    std::string body;
};

/// @brief POST request and wait for the complete response.
///  Name resolution, connect, write and read must all complete within timeout.
/// @throw boost::system::system_error on network failures, error::timed_out when the timeout expires
HttpResponse http_post(const HttpRequest& request, std::chrono::steady_clock::duration timeout);

} //end namespace onvif
} //end namespace onvifcore

#endif // __ONVIFCORE_HTTP_CLIENT_H__
