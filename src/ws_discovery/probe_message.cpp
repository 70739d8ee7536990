/**
 * @file probe_message.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Builds WS-Discovery Probe messages
 */
#include "probe_message.hpp"

#include <boost/algorithm/string/join.hpp>
#include <pugixml.hpp>
#include <set>
#include <sstream>

namespace onvifcore
{
namespace wsdiscovery
{

std::string build_probe_message(const std::string& message_id,
                                const std::vector<std::string>& scopes,
                                const std::vector<std::string>& types,
                                const std::map<std::string, std::string>& namespaces)
{
    static const std::set<std::string> reserved_prefixes { "soap-env", "a", "d" };

    pugi::xml_document doc;
    auto declaration = doc.append_child(pugi::node_declaration);
    declaration.append_attribute("version") = "1.0";
    declaration.append_attribute("encoding") = "UTF-8";

    auto envelope = doc.append_child("soap-env:Envelope");
    envelope.append_attribute("xmlns:soap-env") = NS_SOAP_ENVELOPE;
    envelope.append_attribute("xmlns:a") = NS_ADDRESSING;
    envelope.append_attribute("xmlns:d") = NS_DISCOVERY;
    for (const auto& [prefix, uri] : namespaces)
    {
        if (reserved_prefixes.count(prefix) == 0)
        {
            envelope.append_attribute(("xmlns:" + prefix).c_str()) = uri.c_str();
        }
    }

    auto header = envelope.append_child("soap-env:Header");

    auto action = header.append_child("a:Action");
    action.append_attribute("soap-env:mustUnderstand") = "1";
    action.text().set(ACTION_PROBE);

    header.append_child("a:MessageID").text().set(("uuid:" + message_id).c_str());
    header.append_child("a:ReplyTo").append_child("a:Address").text().set(ADDRESS_ANONYMOUS);

    auto to = header.append_child("a:To");
    to.append_attribute("soap-env:mustUnderstand") = "1";
    to.text().set(TO_DISCOVERY);

    auto probe = envelope.append_child("soap-env:Body").append_child("d:Probe");
    if (!types.empty())
    {
        probe.append_child("d:Types").text().set(boost::algorithm::join(types, " ").c_str());
    }
    if (!scopes.empty())
    {
        probe.append_child("d:Scopes").text().set(boost::algorithm::join(scopes, " ").c_str());
    }

    std::ostringstream out;
    doc.save(out, "", pugi::format_raw);
    return out.str();
}

} //end namespace wsdiscovery
} //end namespace onvifcore
