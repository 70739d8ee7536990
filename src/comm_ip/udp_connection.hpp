/**
 * @file udp_connection.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Connected UDP socket with deadline bound blocking operations
 * @{
 */
#ifndef _UDP_CONNECTION_H_
#define _UDP_CONNECTION_H_

#include "connection.hpp"

namespace onvifcore
{

/// @brief PacketConnection_T over a connected UDP socket.
///  Each instance runs its own io_context so instances never share state.
class UdpConnection : public PacketConnection_T
{
public:
    /// @throw boost::system::system_error if host cannot be resolved or the socket cannot be connected
    UdpConnection(const std::string& host, uint16_t port);

    virtual ~UdpConnection() override;

    virtual std::string remote_address() const override;
    virtual void set_deadline(std::chrono::steady_clock::time_point deadline) override;
    virtual std::size_t write(boost::asio::const_buffer data) override;
    virtual std::size_t read_from(boost::asio::mutable_buffer buf, boost::system::error_code& ec) override;

    /// Safe to call from another thread while a read is blocked, the read then fails with
    /// boost::asio::error::operation_aborted.
    virtual void close() override;

    /// Local port the socket is bound to.
    uint16_t local_port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl;
};

} //end namespace

#endif // _UDP_CONNECTION_H_

/** @} */
