#ifndef __ONVIFCORE_DRIVER_CONFIG_H__
#define __ONVIFCORE_DRIVER_CONFIG_H__
/**
 * @file driver_config.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Settings of the discovery driver
 */
#include "CommonTypes.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace onvifcore
{

constexpr uint32_t      DEFAULT_PROBE_TIMEOUT_MS    { 2000 };
constexpr uint32_t      DEFAULT_REQUEST_TIMEOUT_MS  { 5000 };
constexpr std::size_t   DEFAULT_MAX_CONCURRENCY     { 16 };
constexpr const char*   DEFAULT_SECRET_PATH         { "credentials" };

struct DriverConfig
{
    std::string default_auth_mode { AUTH_MODE_USERNAME_TOKEN };
    std::string default_secret_path { DEFAULT_SECRET_PATH };
    std::chrono::milliseconds probe_timeout { DEFAULT_PROBE_TIMEOUT_MS };
    std::chrono::milliseconds request_timeout { DEFAULT_REQUEST_TIMEOUT_MS };
    std::vector<uint16_t> scan_ports { WS_DISCOVERY_PORT };
    std::size_t max_concurrency { DEFAULT_MAX_CONCURRENCY };

    /// @brief Load settings from a JSON file. Keys that are not present keep their default value.
    ///   Recognized keys: DefaultAuthMode, DefaultSecretPath, ProbeTimeoutMillis,
    ///   RequestTimeoutMillis, ScanPorts, MaxConcurrency
    /// @throw std::runtime_error if the file cannot be read
    /// @throw std::invalid_argument if the content or one of the values is invalid
    static DriverConfig from_file(const std::string& path);

    /// @throw std::invalid_argument if the content or one of the values is invalid
    static DriverConfig from_string(const std::string& content);

    /// @brief Set the default auth mode, normalized to lower case. Checked by validate().
    void set_auth_mode(const std::string& mode);

    /// @throw std::invalid_argument naming the first invalid setting
    void validate() const;
};

/// @return true if mode is one of none, usernametoken, digest or both (case insensitive)
bool is_valid_auth_mode(const std::string& mode);

} // end namespace onvifcore

#endif // __ONVIFCORE_DRIVER_CONFIG_H__
