#if !defined(_ONVIFCORE_PROBE_MATCH_PARSER_HPP_)
#define _ONVIFCORE_PROBE_MATCH_PARSER_HPP_

#include "device_discovery.hpp"
#include <string>
#include <vector>

namespace onvifcore
{
namespace wsdiscovery
{

/// @brief Decode the ProbeMatches found in the responses of one probe.
///
/// All responses of a probe are decoded together: a match repeating an XAddr already seen
/// in the batch is dropped.
/// @return One OnvifDevice per distinct ProbeMatch, empty if the responses hold no match.
/// @throw std::runtime_error if any response is not a well formed SOAP envelope
std::vector<OnvifDevice> devices_from_probe_responses(const std::vector<std::string>& responses);

/// @brief Pick the address used to reach the device service from an XAddrs list.
/// @return The first http or https address, the first entry if there is none, or "" for an empty list.
std::string select_service_address(const std::vector<std::string>& xaddrs);

} //end namespace wsdiscovery
} //end namespace onvifcore

#endif //_ONVIFCORE_PROBE_MATCH_PARSER_HPP_
