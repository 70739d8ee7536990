#ifndef __MOCK_PACKET_CONNECTION_H_
#define __MOCK_PACKET_CONNECTION_H_
/**
 * @file mock_packet_connection.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Mock of the datagram connection used by the probe transport
 * for unit testing.
 */

#include <gmock/gmock.h>
#include "connection.hpp"

namespace onvifcore {
class MockPacketConnection : public PacketConnection_T
{
public:
    MOCK_METHOD(std::string, remote_address, (), (const, override));
    MOCK_METHOD(void, set_deadline, (std::chrono::steady_clock::time_point deadline), (override));
    MOCK_METHOD(std::size_t, write, (boost::asio::const_buffer data), (override));
    MOCK_METHOD(std::size_t, read_from, (boost::asio::mutable_buffer buffer, boost::system::error_code& ec), (override));
    MOCK_METHOD(void, close, (), (override));
};

/// Action for read_from() that copies a datagram into the buffer and reports success
inline auto Datagram(const std::string& payload)
{
    return [payload](boost::asio::mutable_buffer buffer, boost::system::error_code& ec) {
        ec = {};
        return boost::asio::buffer_copy(buffer, boost::asio::buffer(payload));
    };
}

/// Action for read_from() that reports error e
inline auto ReadError(boost::system::error_code e)
{
    return [e](boost::asio::mutable_buffer, boost::system::error_code& ec) {
        ec = e;
        return std::size_t { 0 };
    };
}
} // end namespace onvifcore
#endif // __MOCK_PACKET_CONNECTION_H_
