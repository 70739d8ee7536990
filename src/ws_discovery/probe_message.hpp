#if !defined(_ONVIFCORE_PROBE_MESSAGE_HPP_)
#define _ONVIFCORE_PROBE_MESSAGE_HPP_

#include <map>
#include <string>
#include <vector>

namespace onvifcore
{
namespace wsdiscovery
{

inline constexpr auto NS_SOAP_ENVELOPE  { "http://www.w3.org/2003/05/soap-envelope" };
inline constexpr auto NS_ADDRESSING     { "http://schemas.xmlsoap.org/ws/2004/08/addressing" };
inline constexpr auto NS_DISCOVERY      { "http://schemas.xmlsoap.org/ws/2005/04/discovery" };
inline constexpr auto NS_ONVIF_NETWORK  { "http://www.onvif.org/ver10/network/wsdl" };

inline constexpr auto ACTION_PROBE      { "http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe" };
inline constexpr auto TO_DISCOVERY      { "urn:schemas-xmlsoap-org:ws:2005:04:discovery" };
inline constexpr auto ADDRESS_ANONYMOUS { "http://schemas.xmlsoap.org/ws/2004/08/addressing/role/anonymous" };

/// @brief Build a WS-Discovery Probe message
///
/// The message is a SOAP 1.2 envelope with the WS-Addressing Probe action in its header.
/// @param message_id Unique id of this probe, sent as "uuid:<message_id>"
/// @param scopes Scopes filter, omitted from the message when empty
/// @param types Types filter (qualified names, ex: dn:NetworkVideoTransmitter), omitted when empty
/// @param namespaces Extra prefix -> namespace declarations placed on the envelope, used to
///  qualify the entries of types. The prefixes soap-env, a and d are reserved and ignored.
/// @return The serialized XML document
std::string build_probe_message(const std::string& message_id,
                                const std::vector<std::string>& scopes,
                                const std::vector<std::string>& types,
                                const std::map<std::string, std::string>& namespaces);

} //end namespace wsdiscovery
} //end namespace onvifcore

#endif //_ONVIFCORE_PROBE_MESSAGE_HPP_
