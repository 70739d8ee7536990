/**
 * @file testUdpConnection.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "comm_ip/udp_connection.hpp"
#include "ws_discovery/probe_transport.hpp"
#include <gtest/gtest.h>
#include <array>
#include <mutex>
#include <thread>

using namespace onvifcore;
using boost::asio::ip::udp;
using namespace std::chrono_literals;

/// UDP responder on the loopback interface that answers every datagram with a fixed set of replies
class FakeCamera
{
public:
    explicit FakeCamera(std::vector<std::string> replies) :
        m_socket(m_io, udp::endpoint(boost::asio::ip::address_v4::loopback(), 0)),
        m_endpoint(m_socket.local_endpoint()),
        m_replies(std::move(replies))
    {
        m_thread = std::thread([this]() { serve(); });
    }

    ~FakeCamera()
    {
        // wake up a responder still waiting for its datagram
        boost::system::error_code ignored;
        udp::socket waker(m_io, udp::v4());
        waker.send_to(boost::asio::buffer("", 0), m_endpoint, 0, ignored);
        m_thread.join();
    }

    uint16_t port() const { return m_endpoint.port(); }

    std::string received()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_received;
    }

private:
    void serve()
    {
        std::array<char, 8192> buf {};
        udp::endpoint sender;
        boost::system::error_code ec;
        const auto n = m_socket.receive_from(boost::asio::buffer(buf), sender, 0, ec);
        if (ec)
        {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_received.assign(buf.data(), n);
        }
        for (const auto& reply : m_replies)
        {
            m_socket.send_to(boost::asio::buffer(reply), sender, 0, ec);
        }
    }

    boost::asio::io_context m_io;
    udp::socket m_socket;
    udp::endpoint m_endpoint;
    std::vector<std::string> m_replies;
    std::mutex m_mutex;
    std::string m_received;
    std::thread m_thread;
};

TEST(testUdpConnection, probeRoundTrip)
{
    FakeCamera camera({ "<match-1/>", "<match-2/>" });
    auto conn = PacketConnection_T::create("127.0.0.1", camera.port());
    EXPECT_EQ(conn->remote_address(), "127.0.0.1:" + std::to_string(camera.port()));

    const auto start = std::chrono::steady_clock::now();
    const auto responses = wsdiscovery::send_probe(*conn, "<probe/>", 500ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0], "<match-1/>");
    EXPECT_EQ(responses[1], "<match-2/>");
    EXPECT_EQ(camera.received(), "<probe/>");
    EXPECT_GE(elapsed, 450ms) << "reading should continue until the deadline";
    EXPECT_LT(elapsed, 3s);
}

TEST(testUdpConnection, readTimesOut)
{
    FakeCamera camera({});
    UdpConnection conn("127.0.0.1", camera.port());
    conn.set_deadline(std::chrono::steady_clock::now() + 100ms);
    conn.write(boost::asio::buffer(std::string("hello")));

    std::array<char, 64> buf {};
    boost::system::error_code ec;
    EXPECT_EQ(conn.read_from(boost::asio::buffer(buf), ec), 0u);
    EXPECT_EQ(ec, boost::asio::error::timed_out);

    // once the deadline has passed reads fail immediately
    EXPECT_EQ(conn.read_from(boost::asio::buffer(buf), ec), 0u);
    EXPECT_EQ(ec, boost::asio::error::timed_out);
}

TEST(testUdpConnection, writeAfterDeadline)
{
    FakeCamera camera({});
    UdpConnection conn("127.0.0.1", camera.port());
    conn.set_deadline(std::chrono::steady_clock::now() - 1ms);
    EXPECT_THROW(conn.write(boost::asio::buffer(std::string("late"))), boost::system::system_error);
}

TEST(testUdpConnection, bracketedIpv6Host)
{
    boost::asio::io_context io;
    udp::socket listener(io);
    boost::system::error_code ec;
    listener.open(udp::v6(), ec);
    if (ec)
    {
        GTEST_SKIP() << "IPv6 is not available";
    }
    listener.bind(udp::endpoint(boost::asio::ip::address_v6::loopback(), 0), ec);
    if (ec)
    {
        GTEST_SKIP() << "IPv6 loopback is not available";
    }
    auto conn = PacketConnection_T::create("[::1]", listener.local_endpoint().port());
    EXPECT_EQ(conn->remote_address(), "::1:" + std::to_string(listener.local_endpoint().port()));
}

TEST(testUdpConnection, unresolvableHost)
{
    EXPECT_THROW(PacketConnection_T::create("no-such-host.invalid", 3702), boost::system::system_error);
}

TEST(testUdpConnection, closeAbortsBlockedRead)
{
    FakeCamera camera({});
    UdpConnection conn("127.0.0.1", camera.port());
    conn.set_deadline(std::chrono::steady_clock::now() + 3s);

    std::thread closer([&conn]()
        {
            std::this_thread::sleep_for(200ms);
            conn.close();
        });

    std::array<char, 64> buf {};
    boost::system::error_code ec;
    const auto start = std::chrono::steady_clock::now();
    const auto n = conn.read_from(boost::asio::buffer(buf), ec);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    closer.join();

    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(ec);
    EXPECT_NE(ec, boost::asio::error::timed_out);
    EXPECT_LT(elapsed, 1s);
}

TEST(testUdpConnection, operationsFailAfterIdleClose)
{
    FakeCamera camera({});
    UdpConnection conn("127.0.0.1", camera.port());
    conn.close();

    EXPECT_THROW(conn.set_deadline(std::chrono::steady_clock::now() + 1s), boost::system::system_error);
    EXPECT_THROW(conn.write(boost::asio::buffer(std::string("hello"))), boost::system::system_error);

    std::array<char, 64> buf {};
    boost::system::error_code ec;
    EXPECT_EQ(conn.read_from(boost::asio::buffer(buf), ec), 0u);
    EXPECT_EQ(ec, boost::asio::error::operation_aborted);
}
