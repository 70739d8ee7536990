#if !defined(_ONVIFCORE_CONNECTION_HPP)
#define _ONVIFCORE_CONNECTION_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace onvifcore
{

/// @brief A datagram oriented connection to a single remote endpoint.
///
/// Discovery protocols receive one of these from the scanning orchestrator once the
/// remote host:port has been dialed. Every operation is blocking and bounded by the
/// deadline set with set_deadline().
class PacketConnection_T
{
public:
    virtual ~PacketConnection_T() = default;

    /// @brief "host:port" of the remote endpoint, used for log messages.
    virtual std::string remote_address() const = 0;

    /// @brief Apply a deadline to all following reads and writes.
    /// @throw boost::system::system_error if the connection can no longer be used.
    virtual void set_deadline(std::chrono::steady_clock::time_point deadline) = 0;

    /// @brief Send one datagram.
    /// @throw boost::system::system_error on failure (including an expired deadline)
    virtual std::size_t write(boost::asio::const_buffer data) = 0;

    /// @brief Receive one datagram into buf.
    /// @param ec set to boost::asio::error::timed_out once the deadline has expired,
    ///  or to the transport error that ended the read.
    /// @return number of bytes received, 0 when ec is set.
    virtual std::size_t read_from(boost::asio::mutable_buffer buf, boost::system::error_code& ec) = 0;

    /// @brief Abort any pending operation and release the socket.
    virtual void close() = 0;

    /// @brief Construct a connected UDP packet connection.
    /// @param host IPv4/IPv6 address or hostname of the remote endpoint
    /// @param port UDP port of the remote endpoint
    /// @throw boost::system::system_error if the host cannot be resolved or connected.
    static std::unique_ptr<PacketConnection_T> create(const std::string& host, uint16_t port);
}; //end class PacketConnection_T

} //end namespace onvifcore

#endif
