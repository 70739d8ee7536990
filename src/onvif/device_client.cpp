/**
 * @file device_client.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Queries ONVIF cameras for their device information
 */
#include "device_information.hpp"
#include "driver_config.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "ws_security.hpp"

#include <boost/algorithm/string.hpp>
#include <pugixml.hpp>
#include <sstream>
#include <stdexcept>

namespace onvifcore
{
using namespace std::string_literals;

constexpr auto DEVICE_SERVICE_PATH      { "/onvif/device_service" };
constexpr auto SOAP_CONTENT_TYPE        { "application/soap+xml; charset=utf-8; action=\"http://www.onvif.org/ver10/device/wsdl/GetDeviceInformation\"" };
constexpr auto NS_SOAP12                { "http://www.w3.org/2003/05/soap-envelope" };
constexpr auto NS_DEVICE                { "http://www.onvif.org/ver10/device/wsdl" };
constexpr std::size_t WSSE_NONCE_SIZE   { 16 };


static const std::string& required_property(const protocol_properties_t& properties, const char* key)
{
    const auto it = properties.find(key);
    if ((it == properties.end()) || it->second.empty())
    {
        throw std::invalid_argument("missing required protocol property "s + key);
    }
    return it->second;
}


static std::string optional_property(const protocol_properties_t& properties, const char* key,
                                     const std::string& default_value)
{
    const auto it = properties.find(key);
    return ((it == properties.end()) || it->second.empty()) ? default_value : it->second;
}


static void add_username_token(pugi::xml_node envelope, const onvif::UsernameToken& token)
{
    envelope.append_attribute("xmlns:wsse") = onvif::NS_WSSE;
    envelope.append_attribute("xmlns:wsu") = onvif::NS_WSU;

    auto header = envelope.prepend_child("s:Header");
    auto security = header.append_child("wsse:Security");
    security.append_attribute("s:mustUnderstand") = "1";

    auto username_token = security.append_child("wsse:UsernameToken");
    username_token.append_child("wsse:Username").text().set(token.username.c_str());

    auto password = username_token.append_child("wsse:Password");
    password.append_attribute("Type") = onvif::PASSWORD_DIGEST_TYPE;
    password.text().set(token.password_digest.c_str());

    auto nonce = username_token.append_child("wsse:Nonce");
    nonce.append_attribute("EncodingType") = onvif::BASE64_ENCODING_TYPE;
    nonce.text().set(token.nonce.c_str());

    username_token.append_child("wsu:Created").text().set(token.created.c_str());
}


static std::string build_get_device_information(const std::optional<onvif::UsernameToken>& token)
{
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto envelope = doc.append_child("s:Envelope");
    envelope.append_attribute("xmlns:s") = NS_SOAP12;
    envelope.append_attribute("xmlns:tds") = NS_DEVICE;
    envelope.append_child("s:Body").append_child("tds:GetDeviceInformation");
    if (token)
    {
        add_username_token(envelope, *token);
    }

    std::ostringstream os;
    doc.save(os, "", pugi::format_raw);
    return os.str();
}


static std::string fault_reason(const std::string& body)
{
    pugi::xml_document doc;
    if (!doc.load_buffer(body.data(), body.size()))
    {
        return {};
    }
    // SOAP 1.2 Reason/Text, then SOAP 1.1 faultstring
    auto reason = doc.select_node("//*[local-name()='Fault']/*[local-name()='Reason']/*[local-name()='Text']").node();
    if (!reason)
    {
        reason = doc.select_node("//*[local-name()='Fault']/*[local-name()='faultstring']").node();
    }
    return boost::algorithm::trim_copy(std::string(reason.text().get()));
}


static DeviceInformation parse_device_information(const std::string& body)
{
    pugi::xml_document doc;
    const auto result = doc.load_buffer(body.data(), body.size());
    if (!result)
    {
        throw std::runtime_error("malformed GetDeviceInformation response: "s + result.description());
    }
    const auto response = doc.select_node("//*[local-name()='GetDeviceInformationResponse']").node();
    if (!response)
    {
        throw std::runtime_error("GetDeviceInformationResponse not found in the device service reply");
    }

    auto field = [&](const char* name) {
        const auto xpath = "./*[local-name()='"s + name + "']";
        return boost::algorithm::trim_copy(std::string(response.select_node(xpath.c_str()).node().text().get()));
    };

    DeviceInformation info;
    info.manufacturer = field("Manufacturer");
    info.model = field("Model");
    info.firmware_version = field("FirmwareVersion");
    info.serial_number = field("SerialNumber");
    info.hardware_id = field("HardwareId");
    return info;
}


OnvifDeviceClient::OnvifDeviceClient(std::shared_ptr<const SecretStore_T> secrets,
                                     std::chrono::steady_clock::duration request_timeout,
                                     log_callback_t log_callback) :
    m_secrets(std::move(secrets)),
    m_request_timeout(request_timeout),
    m_log_callback(std::move(log_callback))
{
}


DeviceInformation OnvifDeviceClient::get_device_information(const protocol_map_t& protocols)
{
    const auto entry = protocols.find(ONVIF_PROTOCOL);
    if (entry == protocols.end())
    {
        throw std::invalid_argument("no "s + ONVIF_PROTOCOL + " protocol properties");
    }
    const auto& properties = entry->second;

    const auto& address = required_property(properties, ADDRESS);
    const auto port = optional_property(properties, PORT, "80");
    const auto auth_mode = boost::algorithm::to_lower_copy(
        optional_property(properties, AUTH_MODE, AUTH_MODE_USERNAME_TOKEN));
    if (!is_valid_auth_mode(auth_mode))
    {
        throw std::invalid_argument("unsupported authentication mode '" + auth_mode + "'");
    }

    std::optional<Credentials> credentials;
    if (auth_mode != AUTH_MODE_NONE)
    {
        const auto secret_path = optional_property(properties, SECRET_PATH, DEFAULT_SECRET_PATH);
        if (m_secrets)
        {
            credentials = m_secrets->get_credentials(secret_path);
        }
        if (!credentials)
        {
            throw std::runtime_error("no credentials found under the secret path '" + secret_path + "'");
        }
    }

    const bool use_token = (auth_mode == AUTH_MODE_USERNAME_TOKEN) || (auth_mode == AUTH_MODE_BOTH);
    const bool use_digest = (auth_mode == AUTH_MODE_DIGEST) || (auth_mode == AUTH_MODE_BOTH);

    std::optional<onvif::UsernameToken> token;
    if (use_token)
    {
        token = onvif::make_username_token(*credentials, onvif::random_bytes(WSSE_NONCE_SIZE),
                                           onvif::utc_timestamp(std::chrono::system_clock::now()));
    }

    onvif::HttpRequest request;
    request.host = address;
    request.port = port;
    request.target = DEVICE_SERVICE_PATH;
    request.content_type = SOAP_CONTENT_TYPE;
    request.body = build_get_device_information(token);

    ONVIFCORE_LOG(m_log_callback, LOG_LVL_TRACE,
        address << ":" << port << ": GetDeviceInformation request: " << request.body);
    auto response = onvif::http_post(request, m_request_timeout);

    if ((response.status == 401) && use_digest)
    {
        // devices may offer several schemes, answer the first digest challenge
        std::optional<onvif::DigestChallenge> challenge;
        for (const auto& header : response.www_authenticate)
        {
            challenge = onvif::parse_digest_challenge(header);
            if (challenge)
            {
                break;
            }
        }
        if (!challenge)
        {
            throw std::runtime_error(address + ":" + port + ": device requested authentication without a digest challenge");
        }
        ONVIFCORE_LOG(m_log_callback, LOG_LVL_DEBUG,
            address << ":" << port << ": answering digest challenge of realm '" << challenge->realm << "'");
        const auto cnonce = onvif::md5_hex(onvif::random_bytes(WSSE_NONCE_SIZE));
        request.authorization = onvif::digest_authorization(*challenge, *credentials, "POST", request.target, cnonce);
        if (use_token)
        {
            // the token nonce may be used only once
            token = onvif::make_username_token(*credentials, onvif::random_bytes(WSSE_NONCE_SIZE),
                                               onvif::utc_timestamp(std::chrono::system_clock::now()));
            request.body = build_get_device_information(token);
        }
        response = onvif::http_post(request, m_request_timeout);
    }

    if (response.status != 200)
    {
        auto message = address + ":" + port + ": GetDeviceInformation failed with HTTP status "
                     + std::to_string(response.status);
        const auto reason = fault_reason(response.body);
        if (!reason.empty())
        {
            message += ": " + reason;
        }
        throw std::runtime_error(message);
    }

    ONVIFCORE_LOG(m_log_callback, LOG_LVL_TRACE,
        address << ":" << port << ": GetDeviceInformation response: " << response.body);
    return parse_device_information(response.body);
}

} //end namespace onvifcore
