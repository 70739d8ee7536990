/**
 * @file device_discovery.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * API for ONVIF camera discovery
 * @{
 */
#ifndef _DEVICE_DISCOVERY_H_
#define _DEVICE_DISCOVERY_H_

#include "CommonTypes.hpp"
#include "connection.hpp"
#include "device_information.hpp"
#include "driver_config.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace onvifcore
{
    /// @brief Identity of a device that answered a WS-Discovery probe
    struct OnvifDevice
    {
        std::string xaddr;                  // device service address, ex: http://10.0.0.5/onvif/device_service
        std::string endpoint_ref_address;   // globally unique endpoint reference, ex: urn:uuid:4a1c...
        std::vector<std::string> types;     // advertised types, ex: dn:NetworkVideoTransmitter
        std::vector<std::string> scopes;    // advertised scopes, ex: onvif://www.onvif.org/name/Cam
    };

    /// @brief Protocol specific payload of a probe result.
    ///  std::monostate marks a result that carries no decoded device.
    typedef std::variant<std::monostate, OnvifDevice> probe_data_t;

    /// @brief A device found behind a dialed host:port
    struct ProbeResult
    {
        std::string host;
        uint16_t port { 0 };
        probe_data_t data;
    };

    /// @brief Parameters handed down by the scanning orchestrator
    struct ScanParams
    {
        std::chrono::steady_clock::duration timeout { std::chrono::milliseconds(DEFAULT_PROBE_TIMEOUT_MS) };
        log_callback_t logger { nullptr };
    };

    /// @brief Device record produced for every valid probe result
    struct DiscoveredDevice
    {
        std::string name;
        protocol_map_t protocols;
        std::string description;
        std::vector<std::string> labels;
    };

    /// @brief Capability set a discovery protocol provides to the scanning orchestrator.
    class ProtocolDiscovery_T
    {
    public:
        virtual ~ProtocolDiscovery_T() = default;

        /// @brief Choose which of the candidate ports of host to actually probe.
        /// @return the ports to probe, an empty vector skips the host entirely.
        virtual std::vector<uint16_t> probe_filter(const std::string& host, const std::vector<uint16_t>& ports) = 0;

        /// @brief Verify whether there are devices at the other end of an open connection.
        /// @throw on transport or decoding failures of this attempt
        virtual std::vector<ProbeResult> on_connection_dialed(const std::string& host, uint16_t port,
                                                              PacketConnection_T& connection,
                                                              const ScanParams& params) = 0;

        /// @brief Turn a probe result into a device record.
        /// @throw std::invalid_argument if the result cannot be attributed to a single device
        virtual DiscoveredDevice convert_probe_result(const ProbeResult& result, const ScanParams& params) = 0;
    };

    /// @brief Predicate deciding whether a host:port should be probed.
    typedef std::function<bool (const std::string& host, uint16_t port)> probe_filter_callback_t;

    /// @brief WS-Discovery/ONVIF implementation of ProtocolDiscovery_T
    class OnvifProtocolDiscovery : public ProtocolDiscovery_T
    {
    public:
        /// @param provider Used to query the device information of every discovered camera
        /// @param config Supplies the default authentication mode and secret path
        OnvifProtocolDiscovery(std::shared_ptr<DeviceInformationProvider_T> provider, const DriverConfig& config);

        virtual std::vector<uint16_t> probe_filter(const std::string& host, const std::vector<uint16_t>& ports) override;

        virtual std::vector<ProbeResult> on_connection_dialed(const std::string& host, uint16_t port,
                                                              PacketConnection_T& connection,
                                                              const ScanParams& params) override;

        virtual DiscoveredDevice convert_probe_result(const ProbeResult& result, const ScanParams& params) override;

        /// @brief Install a predicate used by probe_filter(), ports it rejects are not probed.
        ///  Without one every candidate port is probed.
        void set_probe_filter(probe_filter_callback_t filter);

        /// @brief Build the record for one decoded device.
        /// @param fallback_host Address used when the device XAddr carries no host
        DiscoveredDevice create_discovered_device(const OnvifDevice& device, const std::string& fallback_host,
                                                  const log_callback_t& log);

    private:
        std::shared_ptr<DeviceInformationProvider_T> m_provider;
        DriverConfig m_config;
        probe_filter_callback_t m_filter;
    };

    /// @brief Function used by scan_hosts() to open a connection to host:port
    typedef std::function<std::unique_ptr<PacketConnection_T> (const std::string& host, uint16_t port)> dial_callback_t;

    /// @brief Probe every host:port pair accepted by discovery.probe_filter() and collect the device records.
    ///  Failing endpoints and records that fail conversion are logged and skipped.
    /// @param max_concurrency Upper bound of hosts probed at the same time
    /// @param dial Opens the connections, defaults to PacketConnection_T::create()
    /// @return std::vector<DiscoveredDevice>, in no particular order
    std::vector<DiscoveredDevice> scan_hosts(ProtocolDiscovery_T& discovery,
                                             const std::vector<std::string>& hosts,
                                             const std::vector<uint16_t>& ports,
                                             const ScanParams& params,
                                             std::size_t max_concurrency = DEFAULT_MAX_CONCURRENCY,
                                             dial_callback_t dial = nullptr);

    /// @brief Serialize a device record as a JSON object
    /// @param indent pretty print with this many spaces per level, -1 for a single line
    std::string to_json(const DiscoveredDevice& device, int indent = -1);

} //end namespace

#endif // _DEVICE_DISCOVERY_H_

/** @} */
