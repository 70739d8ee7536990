#ifndef __ONVIFCORE_XADDR_H__
#define __ONVIFCORE_XADDR_H__

#include <string>

namespace onvifcore
{

struct HostPort
{
    std::string host;
    std::string port;
};

/// @brief Extract the host and port of a device service address.
///
/// Accepts full URLs (http://10.0.0.5:8080/onvif/device_service) as well as bare host[:port]
/// values. Bracketed IPv6 hosts are returned without brackets. When no port is present the
/// scheme default is used: 443 for https, 80 otherwise.
HostPort address_and_port(const std::string& xaddr);

} // end namespace onvifcore

#endif // __ONVIFCORE_XADDR_H__
