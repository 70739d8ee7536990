/**
 * @file testScanRunner.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "mock_device_information.hpp"
#include "mock_packet_connection.hpp"
#include "probe_match_samples.hpp"
#include "device_discovery.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <stdexcept>

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::UnorderedElementsAre;

using namespace onvifcore;

/// Discovery stub that reports one device per dialed host:port
class CountingDiscovery : public ProtocolDiscovery_T
{
public:
    std::vector<uint16_t> probe_filter(const std::string& host, const std::vector<uint16_t>& ports) override
    {
        if (host == "skip")
        {
            return {};
        }
        return ports;
    }

    std::vector<ProbeResult> on_connection_dialed(const std::string& host, uint16_t port,
                                                  PacketConnection_T&, const ScanParams&) override
    {
        const auto now = ++m_active;
        auto peak = m_peak.load();
        while ((now > peak) && !m_peak.compare_exchange_weak(peak, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --m_active;

        if (host == "broken")
        {
            throw std::runtime_error("no route to host");
        }
        if (host == "empty")
        {
            return { ProbeResult { host, port, std::monostate {} } };
        }
        return { ProbeResult { host, port, OnvifDevice { "http://" + host + "/onvif", "urn:" + host, {}, {} } } };
    }

    DiscoveredDevice convert_probe_result(const ProbeResult& result, const ScanParams&) override
    {
        if (!std::holds_alternative<OnvifDevice>(result.data))
        {
            throw std::invalid_argument("no device");
        }
        DiscoveredDevice device;
        device.name = result.host + ":" + std::to_string(result.port);
        return device;
    }

    int peak() const { return m_peak; }

private:
    std::atomic<int> m_active { 0 };
    std::atomic<int> m_peak { 0 };
};

static std::unique_ptr<PacketConnection_T> dial_mock(const std::string& host, uint16_t)
{
    if (host == "unreachable")
    {
        throw boost::system::system_error(boost::asio::error::host_not_found, host);
    }
    auto conn = std::make_unique<NiceMock<MockPacketConnection>>();
    ON_CALL(*conn, remote_address()).WillByDefault(Return(host));
    return conn;
}

static std::vector<std::string> names(const std::vector<DiscoveredDevice>& devices)
{
    std::vector<std::string> result;
    for (const auto& d : devices)
    {
        result.push_back(d.name);
    }
    return result;
}

TEST(testScanRunner, everyHostAndPort)
{
    CountingDiscovery discovery;
    const auto devices = scan_hosts(discovery, { "a", "b" }, { 3702, 3703 }, ScanParams {}, 4, &dial_mock);
    EXPECT_THAT(names(devices), UnorderedElementsAre("a:3702", "a:3703", "b:3702", "b:3703"));
}

TEST(testScanRunner, failuresAreSkipped)
{
    CountingDiscovery discovery;
    std::vector<uint32_t> levels;
    std::mutex levels_mutex;
    ScanParams params;
    params.logger = [&](const std::string&, uint32_t level) {
        std::lock_guard<std::mutex> lock(levels_mutex);
        levels.push_back(level);
    };

    const auto devices = scan_hosts(discovery, { "ok", "broken", "unreachable", "empty", "skip" }, { 3702 },
                                    params, 2, &dial_mock);
    EXPECT_THAT(names(devices), UnorderedElementsAre("ok:3702"));
    EXPECT_EQ(std::count(levels.begin(), levels.end(), LOG_LVL_ERROR), 0);
}

TEST(testScanRunner, concurrencyIsBounded)
{
    CountingDiscovery discovery;
    std::vector<std::string> hosts;
    for (int i = 0; i < 12; ++i)
    {
        hosts.push_back("host" + std::to_string(i));
    }
    const auto devices = scan_hosts(discovery, hosts, { 3702 }, ScanParams {}, 3, &dial_mock);
    EXPECT_EQ(devices.size(), hosts.size());
    EXPECT_LE(discovery.peak(), 3);
    EXPECT_GE(discovery.peak(), 1);
}

TEST(testScanRunner, noHosts)
{
    CountingDiscovery discovery;
    EXPECT_TRUE(scan_hosts(discovery, {}, { 3702 }, ScanParams {}, 4, &dial_mock).empty());
    EXPECT_TRUE(scan_hosts(discovery, { "a" }, {}, ScanParams {}, 4, &dial_mock).empty());
}

TEST(testScanRunner, onvifDiscoveryEndToEnd)
{
    auto provider = std::make_shared<NiceMock<MockDeviceInformationProvider>>();
    ON_CALL(*provider, get_device_information(_))
        .WillByDefault(Return(DeviceInformation { "Acme Corp", "Cam 1", "1", "2", "3" }));
    OnvifProtocolDiscovery discovery { provider, DriverConfig {} };

    auto dial = [](const std::string& host, uint16_t) -> std::unique_ptr<PacketConnection_T> {
        auto conn = std::make_unique<NiceMock<MockPacketConnection>>();
        ON_CALL(*conn, remote_address()).WillByDefault(Return(host + ":3702"));
        ON_CALL(*conn, write(_)).WillByDefault(Return(1));
        EXPECT_CALL(*conn, read_from(_, _))
            .WillOnce(Invoke(Datagram(probe_matches(SampleMatch { "http://" + host + "/onvif/device_service",
                                                                  "urn:uuid:" + host }))))
            .WillRepeatedly(Invoke(ReadError(boost::asio::error::timed_out)));
        return conn;
    };

    const auto devices = scan_hosts(discovery, { "10.0.0.5", "10.0.0.6" }, { 3702 }, ScanParams {}, 2, dial);
    EXPECT_THAT(names(devices), UnorderedElementsAre("Acme-Corp-Cam-1-urn:uuid:10.0.0.5",
                                                     "Acme-Corp-Cam-1-urn:uuid:10.0.0.6"));
}
