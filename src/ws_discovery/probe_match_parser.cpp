/**
 * @file probe_match_parser.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Decodes WS-Discovery ProbeMatches responses
 */
#include "probe_match_parser.hpp"

#include <boost/algorithm/string.hpp>
#include <pugixml.hpp>
#include <set>
#include <stdexcept>

namespace onvifcore
{
namespace wsdiscovery
{
using namespace std::string_literals;

static std::string local_name(const pugi::xml_node& node)
{
    const std::string name = node.name();
    const auto colon = name.find(':');
    return (colon == std::string::npos) ? name : name.substr(colon + 1);
}

static std::string child_text(const pugi::xml_node& parent, const char* xpath)
{
    const auto node = parent.select_node(xpath).node();
    return boost::algorithm::trim_copy(std::string(node.text().get()));
}

static std::vector<std::string> split_list(const std::string& text)
{
    std::vector<std::string> items;
    if (!text.empty())
    {
        boost::algorithm::split(items, text, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    }
    return items;
}


std::string select_service_address(const std::vector<std::string>& xaddrs)
{
    for (const auto& xaddr : xaddrs)
    {
        if (boost::algorithm::istarts_with(xaddr, "http://") || boost::algorithm::istarts_with(xaddr, "https://"))
        {
            return xaddr;
        }
    }
    return xaddrs.empty() ? ""s : xaddrs.front();
}


std::vector<OnvifDevice> devices_from_probe_responses(const std::vector<std::string>& responses)
{
    std::vector<OnvifDevice> devices;
    std::set<std::string> seen;

    for (const auto& response : responses)
    {
        pugi::xml_document doc;
        const auto result = doc.load_buffer(response.data(), response.size());
        if (!result)
        {
            throw std::runtime_error("malformed ws-discovery response: "s + result.description()
                                     + " at offset " + std::to_string(result.offset));
        }
        const auto envelope = doc.document_element();
        if (local_name(envelope) != "Envelope")
        {
            throw std::runtime_error("ws-discovery response is not a SOAP envelope, root element is '"s
                                     + envelope.name() + "'");
        }

        const auto matches = envelope.select_nodes(
            "./*[local-name()='Body']/*[local-name()='ProbeMatches']/*[local-name()='ProbeMatch']");
        for (const auto& match : matches)
        {
            const auto node = match.node();
            OnvifDevice device;
            device.xaddr = select_service_address(split_list(child_text(node, "./*[local-name()='XAddrs']")));
            if (!seen.insert(device.xaddr).second)
            {
                continue;
            }
            device.endpoint_ref_address = child_text(node,
                "./*[local-name()='EndpointReference']/*[local-name()='Address']");
            device.types = split_list(child_text(node, "./*[local-name()='Types']"));
            device.scopes = split_list(child_text(node, "./*[local-name()='Scopes']"));
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

} //end namespace wsdiscovery
} //end namespace onvifcore
