/**
 * @file onvif_discovery.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Discovers ONVIF cameras with a unicast WS-Discovery probe
 * @{
 */
#include "device_discovery.hpp"
#include "logging.hpp"
#include "xaddr.hpp"
#include "ws_discovery/probe_match_parser.hpp"
#include "ws_discovery/probe_message.hpp"
#include "ws_discovery/probe_transport.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace onvifcore
{
    constexpr auto NVT_TYPE { "dn:NetworkVideoTransmitter" };
    constexpr auto AUTO_DISCOVERY_LABEL { "auto-discovery" };


    /**
     * Perform a unicast WS-Discovery probe by sending the probe message directly over the
     * connection and listening for responses until the timeout expires. The responses are
     * then decoded into OnvifDevice entries.
     */
    static std::vector<OnvifDevice> execute_raw_probe(PacketConnection_T& connection, const ScanParams& params)
    {
        const auto message_id = boost::uuids::to_string(boost::uuids::random_generator()());
        const auto probe = wsdiscovery::build_probe_message(message_id, {}, { NVT_TYPE },
                                                            { { "dn", wsdiscovery::NS_ONVIF_NETWORK } });
        const auto addr = connection.remote_address();

        const auto responses = wsdiscovery::send_probe(connection, probe, params.timeout, params.logger);
        if (responses.empty())
        {
            // trace level, with UDP this is logged for every probed endpoint that does not answer
            ONVIFCORE_LOG(params.logger, LOG_LVL_TRACE, addr << ": No Response");
            return {};
        }
        for (std::size_t i = 0; i < responses.size(); ++i)
        {
            ONVIFCORE_LOG(params.logger, LOG_LVL_DEBUG,
                addr << ": Response " << (i + 1) << " of " << responses.size() << ": " << responses[i]);
        }

        auto devices = wsdiscovery::devices_from_probe_responses(responses);
        if (devices.empty())
        {
            ONVIFCORE_LOG(params.logger, LOG_LVL_DEBUG, addr << ": no devices matched from probe response");
        }
        return devices;
    }


    OnvifProtocolDiscovery::OnvifProtocolDiscovery(std::shared_ptr<DeviceInformationProvider_T> provider,
                                                   const DriverConfig& config) :
        m_provider(std::move(provider)),
        m_config(config)
    {
        if (!m_provider)
        {
            throw std::invalid_argument("a device information provider is required");
        }
    }


    std::vector<uint16_t> OnvifProtocolDiscovery::probe_filter(const std::string& host, const std::vector<uint16_t>& ports)
    {
        if (!m_filter)
        {
            return ports;
        }
        std::vector<uint16_t> selected;
        std::copy_if(ports.begin(), ports.end(), std::back_inserter(selected),
                     [&](uint16_t port) { return m_filter(host, port); });
        return selected;
    }


    void OnvifProtocolDiscovery::set_probe_filter(probe_filter_callback_t filter)
    {
        m_filter = std::move(filter);
    }


    std::vector<ProbeResult> OnvifProtocolDiscovery::on_connection_dialed(const std::string& host, uint16_t port,
                                                                          PacketConnection_T& connection,
                                                                          const ScanParams& params)
    {
        std::vector<OnvifDevice> devices;
        try
        {
            devices = execute_raw_probe(connection, params);
        }
        catch (const std::exception& e)
        {
            ONVIFCORE_LOG(params.logger, LOG_LVL_DEBUG, e.what());
            throw;
        }

        std::vector<ProbeResult> results;
        for (auto& device : devices)
        {
            results.push_back(ProbeResult { host, port, std::move(device) });
        }
        return results;
    }


    DiscoveredDevice OnvifProtocolDiscovery::convert_probe_result(const ProbeResult& result, const ScanParams& params)
    {
        const auto* device = std::get_if<OnvifDevice>(&result.data);
        if (nullptr == device)
        {
            throw std::invalid_argument("unable to cast probe result from " + result.host + ":"
                                        + std::to_string(result.port) + " into an ONVIF device, payload index="
                                        + std::to_string(result.data.index()));
        }
        return create_discovered_device(*device, result.host, params.logger);
    }


    DiscoveredDevice OnvifProtocolDiscovery::create_discovered_device(const OnvifDevice& device,
                                                                      const std::string& fallback_host,
                                                                      const log_callback_t& log)
    {
        const auto& xaddr = device.xaddr;
        const auto& endpoint_ref = device.endpoint_ref_address;
        if (endpoint_ref.empty())
        {
            ONVIFCORE_LOG(log, LOG_LVL_WARN,
                "The EndpointRefAddress is empty from the Onvif camera, unable to add the camera " << xaddr);
            throw std::invalid_argument("empty EndpointRefAddress for XAddr " + xaddr);
        }

        auto address = address_and_port(xaddr);
        if (address.host.empty())
        {
            address.host = fallback_host;
        }

        protocol_map_t protocols {
            { ONVIF_PROTOCOL, {
                { ADDRESS, address.host },
                { PORT, address.port },
                { AUTH_MODE, m_config.default_auth_mode },
                { SECRET_PATH, m_config.default_secret_path },
                { ENDPOINT_REF_ADDRESS, endpoint_ref },
            } }
        };

        std::string error;
        const auto info = resolve_device_information(*m_provider, protocols, endpoint_ref, &error, log);

        DiscoveredDevice discovered;
        if (!info)
        {
            ONVIFCORE_LOG(log, LOG_LVL_WARN,
                "failed to get the device information for the camera " << endpoint_ref << ", " << error);
            discovered.name = endpoint_ref;
            discovered.protocols = std::move(protocols);
            discovered.description = "Auto discovered Onvif camera";
            discovered.labels = { AUTO_DISCOVERY_LABEL };
            ONVIFCORE_LOG(log, LOG_LVL_DEBUG,
                "Discovered unknown camera '" << discovered.name << "' from the address '" << xaddr << "'");
        }
        else
        {
            // Spaces are not allowed in the device name
            discovered.name = boost::algorithm::replace_all_copy(info->manufacturer, " ", "-") + "-"
                            + boost::algorithm::replace_all_copy(info->model, " ", "-") + "-"
                            + endpoint_ref;
            discovered.protocols = std::move(protocols);
            discovered.description = info->manufacturer + " " + info->model + " Camera";
            discovered.labels = { AUTO_DISCOVERY_LABEL, info->manufacturer, info->model };
            ONVIFCORE_LOG(log, LOG_LVL_DEBUG,
                "Discovered camera '" << discovered.name << "' from the address '" << xaddr << "'");
        }
        return discovered;
    }

} //end namespace

/** @} */
