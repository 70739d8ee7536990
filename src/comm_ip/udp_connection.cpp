#include "udp_connection.hpp"

#include <atomic>


namespace onvifcore
{
using namespace boost;
using namespace boost::system;
using namespace boost::asio;
using boost::asio::ip::udp;
using std::chrono::steady_clock;


struct UdpConnection::Impl
{
    io_context m_io;
    udp::socket m_socket;
    std::string m_remote;
    steady_clock::time_point m_deadline { steady_clock::time_point::max() };
    std::atomic<bool> m_closed { false };

    Impl() : m_socket(m_io)
    {
    }

    /// Run the pending operation until it completes or the deadline passes.
    /// @return false if the deadline passed first, the operation has then been canceled.
    bool run_until_deadline()
    {
        m_io.restart();
        m_io.run_until(m_deadline);
        if (!m_io.stopped())
        {
            error_code ignored;
            m_socket.cancel(ignored);
            m_io.run();
            return false;
        }
        return true;
    }
};


UdpConnection::UdpConnection(const std::string& host, uint16_t port) :
    pimpl { new Impl() }
{
    udp::resolver resolver(pimpl->m_io);
    const auto endpoints = resolver.resolve(host, std::to_string(port));
    const auto endpoint = asio::connect(pimpl->m_socket, endpoints);
    pimpl->m_remote = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}


UdpConnection::~UdpConnection()
{
    error_code ignored;
    pimpl->m_socket.close(ignored);
}


std::string UdpConnection::remote_address() const
{
    return pimpl->m_remote;
}


void UdpConnection::set_deadline(std::chrono::steady_clock::time_point deadline)
{
    if (pimpl->m_closed || !pimpl->m_socket.is_open())
    {
        throw system_error(asio::error::bad_descriptor, pimpl->m_remote + ": connection is closed");
    }
    pimpl->m_deadline = deadline;
}


std::size_t UdpConnection::write(const_buffer data)
{
    if (pimpl->m_closed)
    {
        throw system_error(asio::error::bad_descriptor, pimpl->m_remote + ": connection is closed");
    }
    if (steady_clock::now() >= pimpl->m_deadline)
    {
        throw system_error(asio::error::timed_out, pimpl->m_remote + ": deadline expired before write");
    }

    error_code error = asio::error::would_block;
    std::size_t length = 0;
    pimpl->m_socket.async_send(asio::buffer(data),
        [&](const error_code& ec, std::size_t n)
        {
            error = ec;
            length = n;
        });

    if (!pimpl->run_until_deadline() && (error == asio::error::operation_aborted))
    {
        error = asio::error::timed_out;
    }
    if (error)
    {
        throw system_error(error, pimpl->m_remote + ": write failed");
    }
    return length;
}


std::size_t UdpConnection::read_from(mutable_buffer buf, error_code& ec)
{
    ec = {};
    if (pimpl->m_closed)
    {
        ec = asio::error::operation_aborted;
        return 0;
    }
    if (steady_clock::now() >= pimpl->m_deadline)
    {
        ec = asio::error::timed_out;
        return 0;
    }

    error_code error = asio::error::would_block;
    std::size_t length = 0;
    udp::endpoint sender;
    pimpl->m_socket.async_receive_from(asio::buffer(buf), sender,
        [&](const error_code& e, std::size_t n)
        {
            error = e;
            length = n;
        });

    if (!pimpl->run_until_deadline() && (error == asio::error::operation_aborted))
    {
        ec = asio::error::timed_out;
        return 0;
    }
    ec = error;
    return ec ? 0 : length;
}


void UdpConnection::close()
{
    Impl* impl = pimpl.get();
    // A read blocked on another thread sees the close through the io_context,
    // later calls see the flag.
    impl->m_closed = true;
    asio::post(impl->m_io, [impl]()
        {
            error_code ignored;
            impl->m_socket.close(ignored);
        });
}


uint16_t UdpConnection::local_port() const
{
    return pimpl->m_socket.local_endpoint().port();
}

} //end namespace onvifcore
