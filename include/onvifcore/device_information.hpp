#ifndef __ONVIFCORE_DEVICE_INFORMATION_H__
#define __ONVIFCORE_DEVICE_INFORMATION_H__
/**
 * @file device_information.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * API used to identify a discovered camera
 */
#include "CommonTypes.hpp"
#include "driver_config.hpp"
#include "secret_store.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace onvifcore
{

/// Property name -> value, ex: "Address" -> "10.0.0.5"
typedef std::map<std::string, std::string> protocol_properties_t;

/// Protocol name -> properties, ex: "Onvif" -> { "Address": ..., "Port": ... }
typedef std::map<std::string, protocol_properties_t> protocol_map_t;

/// @brief Descriptive metadata reported by a camera
struct DeviceInformation
{
    std::string manufacturer;
    std::string model;
    std::string firmware_version;
    std::string serial_number;
    std::string hardware_id;
};

/// @brief Authenticated "identify yourself" call against a device
class DeviceInformationProvider_T
{
public:
    virtual ~DeviceInformationProvider_T() = default;

    /// @brief Query the device described by protocols for its information.
    /// @throw std::exception (any kind) if the device cannot be queried
    virtual DeviceInformation get_device_information(const protocol_map_t& protocols) = 0;
};

/// @brief Try to identify a device, retrying once with the endpoint reference as secret path.
///
/// The first attempt uses the properties as they are. If it throws, the SecretPath property of
/// the ONVIF protocol entry is replaced by endpoint_ref and a single retry is made. On success the
/// Manufacturer, Model, FirmwareVersion, SerialNumber and HardwareId properties are written into
/// protocols.
/// @param error receives the message of the last failure, if any
/// @return std::nullopt when both attempts failed
std::optional<DeviceInformation> resolve_device_information(DeviceInformationProvider_T& provider,
                                                            protocol_map_t& protocols,
                                                            const std::string& endpoint_ref,
                                                            std::string* error = nullptr,
                                                            const log_callback_t& log = nullptr);

/// @brief Queries the ONVIF device service (tds:GetDeviceInformation) over HTTP.
///
/// Connection details are taken from the "Onvif" protocol properties (Address, Port, AuthMode,
/// SecretPath). Credentials are looked up in the secret store for every mode other than "none".
class OnvifDeviceClient : public DeviceInformationProvider_T
{
public:
    OnvifDeviceClient(std::shared_ptr<const SecretStore_T> secrets,
                      std::chrono::steady_clock::duration request_timeout = std::chrono::milliseconds(DEFAULT_REQUEST_TIMEOUT_MS),
                      log_callback_t log_callback = nullptr);

    virtual DeviceInformation get_device_information(const protocol_map_t& protocols) override;

    std::chrono::steady_clock::duration request_timeout() const { return m_request_timeout; }

private:
    std::shared_ptr<const SecretStore_T> m_secrets;
    std::chrono::steady_clock::duration m_request_timeout;
    log_callback_t m_log_callback;
};

} // end namespace onvifcore

#endif // __ONVIFCORE_DEVICE_INFORMATION_H__
