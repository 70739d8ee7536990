#if !defined(_ONVIFCORE_PROBE_TRANSPORT_HPP_)
#define _ONVIFCORE_PROBE_TRANSPORT_HPP_

#include "CommonTypes.hpp"
#include "connection.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace onvifcore
{
namespace wsdiscovery
{

/// Largest datagram accepted from a responder, longer ones are truncated.
inline constexpr std::size_t PROBE_READ_BUFFER_SIZE { 8192 };

/// @brief Send a probe over connection and collect every response until timeout expires.
///
/// The deadline is applied once, before the probe is written. Reading stops silently when the
/// deadline expires; any other read error also stops reading, is logged at debug level and the
/// responses received so far are returned.
/// @return The raw responses in arrival order, empty if nothing answered.
/// @throw boost::system::system_error if the deadline cannot be set or the probe cannot be written
std::vector<std::string> send_probe(PacketConnection_T& connection,
                                    const std::string& message,
                                    std::chrono::steady_clock::duration timeout,
                                    const log_callback_t& log = nullptr);

} //end namespace wsdiscovery
} //end namespace onvifcore

#endif //_ONVIFCORE_PROBE_TRANSPORT_HPP_
