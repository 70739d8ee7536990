#include "xaddr.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <algorithm>

namespace onvifcore
{

HostPort address_and_port(const std::string& xaddr)
{
    std::string scheme;
    std::string rest = xaddr;
    const auto scheme_end = xaddr.find("://");
    if (scheme_end != std::string::npos)
    {
        scheme = boost::algorithm::to_lower_copy(xaddr.substr(0, scheme_end));
        rest = xaddr.substr(scheme_end + 3);
    }

    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    const auto at = authority.rfind('@');
    if (at != std::string::npos)
    {
        authority = authority.substr(at + 1);
    }

    HostPort result;
    if (!authority.empty() && (authority.front() == '['))
    {
        const auto close = authority.find(']');
        result.host = authority.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        if ((close != std::string::npos) && (close + 1 < authority.size()) && (authority[close + 1] == ':'))
        {
            result.port = authority.substr(close + 2);
        }
    }
    else if (std::count(authority.begin(), authority.end(), ':') == 1)
    {
        const auto colon = authority.find(':');
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    }
    else
    {
        // no port, or an unbracketed IPv6 address
        result.host = authority;
    }

    if (result.port.empty())
    {
        result.port = (scheme == "https") ? "443" : "80";
    }
    return result;
}

} // end namespace onvifcore
