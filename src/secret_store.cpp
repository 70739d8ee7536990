/**
 * @file secret_store.cpp
 *
 * Copyright 2023 PreAct Technologies
 */
#include "secret_store.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace onvifcore
{

JsonSecretStore JsonSecretStore::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw std::runtime_error("unable to open secrets file " + path);
    }
    std::stringstream content;
    content << in.rdbuf();
    return from_string(content.str());
}


JsonSecretStore JsonSecretStore::from_string(const std::string& content)
{
    nlohmann::json doc;
    try
    {
        doc = nlohmann::json::parse(content);
    }
    catch (const nlohmann::json::exception& e)
    {
        throw std::invalid_argument(std::string("invalid secrets document: ") + e.what());
    }
    if (!doc.is_object())
    {
        throw std::invalid_argument("invalid secrets document: expected an object of secret paths");
    }

    JsonSecretStore store;
    for (const auto& [path, entry] : doc.items())
    {
        if (!entry.is_object())
        {
            throw std::invalid_argument("invalid secret '" + path + "': expected an object");
        }
        Credentials credentials;
        try
        {
            credentials.username = entry.value("username", "");
            credentials.password = entry.value("password", "");
        }
        catch (const nlohmann::json::exception& e)
        {
            throw std::invalid_argument("invalid secret '" + path + "': " + e.what());
        }
        store.m_secrets[path] = credentials;
    }
    return store;
}


JsonSecretStore::JsonSecretStore(const JsonSecretStore& other)
{
    std::shared_lock<std::shared_mutex> lock(other.m_mutex);
    m_secrets = other.m_secrets;
}


JsonSecretStore& JsonSecretStore::operator=(const JsonSecretStore& other)
{
    if (this != &other)
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex, std::defer_lock);
        std::shared_lock<std::shared_mutex> other_lock(other.m_mutex, std::defer_lock);
        std::lock(lock, other_lock);
        m_secrets = other.m_secrets;
    }
    return *this;
}


std::optional<Credentials> JsonSecretStore::get_credentials(const std::string& secret_path) const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const auto it = m_secrets.find(secret_path);
    if (it == m_secrets.end())
    {
        return std::nullopt;
    }
    return it->second;
}


void JsonSecretStore::set_credentials(const std::string& secret_path, const Credentials& credentials)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_secrets[secret_path] = credentials;
}


std::size_t JsonSecretStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_secrets.size();
}

} // end namespace onvifcore
