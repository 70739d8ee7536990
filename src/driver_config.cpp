/**
 * @file driver_config.cpp
 *
 * Copyright 2023 PreAct Technologies
 */
#include "driver_config.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace onvifcore
{

bool is_valid_auth_mode(const std::string& mode)
{
    const auto lower = boost::algorithm::to_lower_copy(mode);
    return (lower == AUTH_MODE_NONE) || (lower == AUTH_MODE_USERNAME_TOKEN)
        || (lower == AUTH_MODE_DIGEST) || (lower == AUTH_MODE_BOTH);
}


DriverConfig DriverConfig::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error("unable to open configuration file " + path);
    }
    std::stringstream content;
    content << in.rdbuf();
    return from_string(content.str());
}


static std::chrono::milliseconds read_millis(const nlohmann::json& value, const char* key)
{
    if (!value.is_number_integer())
    {
        throw std::invalid_argument(std::string(key) + " must be an integer number of milliseconds");
    }
    return std::chrono::milliseconds(value.get<int64_t>());
}


DriverConfig DriverConfig::from_string(const std::string& content)
{
    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse(content);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument(std::string("invalid configuration document: ") + e.what());
    }
    if (!doc.is_object())
    {
        throw std::invalid_argument("invalid configuration document: expected an object");
    }

    DriverConfig config;
    try
    {
        if (doc.contains("DefaultAuthMode"))
        {
            config.set_auth_mode(doc["DefaultAuthMode"].get<std::string>());
        }
        if (doc.contains("DefaultSecretPath"))
        {
            config.default_secret_path = doc["DefaultSecretPath"].get<std::string>();
        }
        if (doc.contains("ProbeTimeoutMillis"))
        {
            config.probe_timeout = read_millis(doc["ProbeTimeoutMillis"], "ProbeTimeoutMillis");
        }
        if (doc.contains("RequestTimeoutMillis"))
        {
            config.request_timeout = read_millis(doc["RequestTimeoutMillis"], "RequestTimeoutMillis");
        }
        if (doc.contains("ScanPorts"))
        {
            config.scan_ports.clear();
            for (const auto& port : doc["ScanPorts"])
            {
                const auto value = port.get<int64_t>();
                if ((value < 1) || (value > std::numeric_limits<uint16_t>::max()))
                {
                    throw std::invalid_argument("ScanPorts entry " + std::to_string(value) + " is out of range");
                }
                config.scan_ports.push_back(static_cast<uint16_t>(value));
            }
        }
        if (doc.contains("MaxConcurrency"))
        {
            const auto value = doc["MaxConcurrency"].get<int64_t>();
            if (value < 1)
            {
                throw std::invalid_argument("MaxConcurrency must be at least 1");
            }
            config.max_concurrency = static_cast<std::size_t>(value);
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument(std::string("invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
}


void DriverConfig::set_auth_mode(const std::string& mode)
{
    default_auth_mode = boost::algorithm::to_lower_copy(mode);
}


void DriverConfig::validate() const
{
    if (!is_valid_auth_mode(default_auth_mode))
    {
        throw std::invalid_argument("invalid DefaultAuthMode '" + default_auth_mode
                                    + "', expected one of none, usernametoken, digest, both");
    }
    if (probe_timeout.count() <= 0)
    {
        throw std::invalid_argument("ProbeTimeoutMillis must be positive");
    }
    if (request_timeout.count() <= 0)
    {
        throw std::invalid_argument("RequestTimeoutMillis must be positive");
    }
    if (max_concurrency == 0)
    {
        throw std::invalid_argument("MaxConcurrency must be at least 1");
    }
    for (const auto port : scan_ports)
    {
        if (port == 0)
        {
            throw std::invalid_argument("ScanPorts must not contain port 0");
        }
    }
}

} // end namespace onvifcore
