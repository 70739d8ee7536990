#include "probe_transport.hpp"
#include "logging.hpp"

#include <array>

namespace onvifcore
{
namespace wsdiscovery
{
using namespace boost::system;
using std::chrono::steady_clock;

std::vector<std::string> send_probe(PacketConnection_T& connection,
                                    const std::string& message,
                                    std::chrono::steady_clock::duration timeout,
                                    const log_callback_t& log)
{
    const auto addr = connection.remote_address();

    try
    {
        connection.set_deadline(steady_clock::now() + timeout);
    }
    catch (const system_error& e)
    {
        throw system_error(e.code(), addr + ": failed to set read/write deadline");
    }

    try
    {
        connection.write(boost::asio::buffer(message));
    }
    catch (const system_error& e)
    {
        throw system_error(e.code(), addr + ": failed to write probe message");
    }

    std::vector<std::string> responses;
    auto buf = std::array<char, PROBE_READ_BUFFER_SIZE>{};
    // keep reading until the deadline expires or an error occurs
    for (;;)
    {
        error_code ec;
        const auto n = connection.read_from(boost::asio::buffer(buf), ec);
        if (ec)
        {
            // timed_out is expected once the deadline has passed
            if (ec != boost::asio::error::timed_out)
            {
                ONVIFCORE_LOG(log, LOG_LVL_DEBUG,
                    addr << ": Unexpected error occurred while reading ws-discovery responses: " << ec.message());
            }
            break;
        }
        responses.emplace_back(buf.data(), n);
    }
    return responses;
}

} //end namespace wsdiscovery
} //end namespace onvifcore
