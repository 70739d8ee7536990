/**
 * @file device_discovery.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Scans a set of hosts for ONVIF cameras
 * @{
 */
#include "device_discovery.hpp"
#include "logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iterator>
#include <mutex>

namespace onvifcore
{

    /// @brief Probe all accepted ports of a single host
    /// @return device records of every successfully converted probe result
    static std::vector<DiscoveredDevice> scan_host(ProtocolDiscovery_T& discovery, const std::string& host,
                                                   const std::vector<uint16_t>& ports, const ScanParams& params,
                                                   const dial_callback_t& dial)
    {
        std::vector<DiscoveredDevice> devices;

        std::vector<uint16_t> selected;
        try
        {
            selected = discovery.probe_filter(host, ports);
        }
        catch (const std::exception& e)
        {
            ONVIFCORE_LOG(params.logger, LOG_LVL_WARN, host << ": probe filter failed, skipping host: " << e.what());
            return devices;
        }

        for (const auto port : selected)
        {
            std::vector<ProbeResult> results;
            try
            {
                auto connection = dial(host, port);
                results = discovery.on_connection_dialed(host, port, *connection, params);
                connection->close();
            }
            catch (const std::exception& e)
            {
                ONVIFCORE_LOG(params.logger, LOG_LVL_TRACE, host << ":" << port << ": probe failed: " << e.what());
                continue;
            }

            for (const auto& result : results)
            {
                try
                {
                    devices.push_back(discovery.convert_probe_result(result, params));
                }
                catch (const std::exception& e)
                {
                    ONVIFCORE_LOG(params.logger, LOG_LVL_DEBUG,
                        host << ":" << port << ": dropping probe result: " << e.what());
                }
            }
        }
        return devices;
    }


    std::vector<DiscoveredDevice> scan_hosts(ProtocolDiscovery_T& discovery,
                                             const std::vector<std::string>& hosts,
                                             const std::vector<uint16_t>& ports,
                                             const ScanParams& params,
                                             std::size_t max_concurrency,
                                             dial_callback_t dial)
    {
        if (!dial)
        {
            dial = &PacketConnection_T::create;
        }

        std::mutex devices_mutex;
        std::vector<DiscoveredDevice> devices;
        if (hosts.empty())
        {
            return devices;
        }

        const auto workers = std::max<std::size_t>(1, std::min(max_concurrency, hosts.size()));
        ONVIFCORE_LOG(params.logger, LOG_LVL_DEBUG,
            "scanning " << hosts.size() << " host(s) on " << ports.size() << " port(s) with " << workers << " worker(s)");

        boost::asio::thread_pool pool(workers);
        for (const auto& host : hosts)
        {
            boost::asio::post(pool, [&, host]() {
                auto found = scan_host(discovery, host, ports, params, dial);
                std::lock_guard<std::mutex> lock(devices_mutex);
                std::move(found.begin(), found.end(), std::back_inserter(devices));
            });
        }
        pool.join();

        ONVIFCORE_LOG(params.logger, LOG_LVL_INFO, "discovered " << devices.size() << " device(s)");
        return devices;
    }


    std::string to_json(const DiscoveredDevice& device, int indent)
    {
        const nlohmann::json j = {
            { "name", device.name },
            { "description", device.description },
            { "labels", device.labels },
            { "protocols", device.protocols },
        };
        return j.dump(indent);
    }

} //end namespace

/** @} */
