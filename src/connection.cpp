#include "connection.hpp"
#include "comm_ip/udp_connection.hpp"

#include <string>

namespace onvifcore
{

std::unique_ptr<PacketConnection_T> PacketConnection_T::create(const std::string& host, uint16_t port)
{
    // IPv6 literals may come bracketed (as found in URLs), the resolver wants them bare
    auto bare_host = host;
    if ((bare_host.size() > 2) && (bare_host.front() == '[') && (bare_host.back() == ']'))
    {
        bare_host = bare_host.substr(1, bare_host.size() - 2);
    }
    return std::make_unique<UdpConnection>(bare_host, port);
}

} //end namespace onvifcore
