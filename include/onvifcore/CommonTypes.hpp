#ifndef COMMONTYPES_HPP
#define COMMONTYPES_HPP
/**
 * @file CommonTypes.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Declares constants and types shared by the discovery engine and its transports.
 */
#include <cstdint>
#include <functional>
#include <string>

namespace onvifcore
{

typedef std::function<void (const std::string& msg, uint32_t level)> log_callback_t;

inline constexpr uint32_t LOG_LVL_ERROR     { 0 };
inline constexpr uint32_t LOG_LVL_WARN      { 1 };
inline constexpr uint32_t LOG_LVL_INFO      { 2 };
inline constexpr uint32_t LOG_LVL_DEBUG     { 3 };
inline constexpr uint32_t LOG_LVL_TRACE     { 4 };

/// @brief Create a log callback that writes errors to std::cerr and every other message
///  with a level up to (and including) debug_level to std::cout.
///  Each line is prefixed with the seconds elapsed since the callback was created.
log_callback_t console_logger(uint32_t debug_level = LOG_LVL_WARN);

/// Name of the protocol entry discovered devices are stored under.
inline constexpr auto ONVIF_PROTOCOL { "Onvif" };

/// WS-Discovery port used when the caller does not supply any.
inline constexpr uint16_t WS_DISCOVERY_PORT { 3702 };

/// @name Protocol property keys
/// @{
inline constexpr auto ADDRESS              { "Address" };
inline constexpr auto PORT                 { "Port" };
inline constexpr auto AUTH_MODE            { "AuthMode" };
inline constexpr auto SECRET_PATH          { "SecretPath" };
inline constexpr auto ENDPOINT_REF_ADDRESS { "EndpointRefAddress" };
inline constexpr auto MANUFACTURER         { "Manufacturer" };
inline constexpr auto MODEL                { "Model" };
inline constexpr auto FIRMWARE_VERSION     { "FirmwareVersion" };
inline constexpr auto SERIAL_NUMBER        { "SerialNumber" };
inline constexpr auto HARDWARE_ID          { "HardwareId" };
/// @}

/// @name Authentication modes understood by the ONVIF device client
/// @{
inline constexpr auto AUTH_MODE_NONE           { "none" };
inline constexpr auto AUTH_MODE_USERNAME_TOKEN { "usernametoken" };
inline constexpr auto AUTH_MODE_DIGEST         { "digest" };
inline constexpr auto AUTH_MODE_BOTH           { "both" };
/// @}

} // namespace onvifcore

#endif // COMMONTYPES_HPP
