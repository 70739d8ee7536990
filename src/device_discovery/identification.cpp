/**
 * @file identification.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Retrieves descriptive metadata of a discovered camera
 */
#include "device_information.hpp"
#include "logging.hpp"

#include <exception>

namespace onvifcore
{

static std::optional<DeviceInformation> try_get_device_information(DeviceInformationProvider_T& provider,
                                                                   const protocol_map_t& protocols,
                                                                   std::string& error)
{
    try
    {
        return provider.get_device_information(protocols);
    }
    catch (const std::exception& e)
    {
        error = e.what();
        return std::nullopt;
    }
}


std::optional<DeviceInformation> resolve_device_information(DeviceInformationProvider_T& provider,
                                                            protocol_map_t& protocols,
                                                            const std::string& endpoint_ref,
                                                            std::string* error,
                                                            const log_callback_t& log)
{
    std::string last_error;
    auto info = try_get_device_information(provider, protocols, last_error);
    if (!info)
    {
        // Operators may have provisioned per-device credentials stored under the endpoint reference
        // instead of the shared default secret path.
        ONVIFCORE_LOG(log, LOG_LVL_DEBUG, "failed to get the device information for " << endpoint_ref
                      << " using the default secret path, retrying with the endpoint reference: " << last_error);
        protocols[ONVIF_PROTOCOL][SECRET_PATH] = endpoint_ref;
        info = try_get_device_information(provider, protocols, last_error);
    }

    if (!info)
    {
        if (error)
        {
            *error = last_error;
        }
        return std::nullopt;
    }

    auto& properties = protocols[ONVIF_PROTOCOL];
    properties[MANUFACTURER] = info->manufacturer;
    properties[MODEL] = info->model;
    properties[FIRMWARE_VERSION] = info->firmware_version;
    properties[SERIAL_NUMBER] = info->serial_number;
    properties[HARDWARE_ID] = info->hardware_id;
    return info;
}

} //end namespace onvifcore
