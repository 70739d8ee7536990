#ifndef __ONVIFCORE_SECRET_STORE_H__
#define __ONVIFCORE_SECRET_STORE_H__
/**
 * @file secret_store.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Credential lookup used when authenticating against discovered cameras
 */
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace onvifcore
{

struct Credentials
{
    std::string username;
    std::string password;
};

/// @brief Read access to credentials stored under a secret path.
///  Implementations must allow concurrent calls from several identification attempts.
class SecretStore_T
{
public:
    virtual ~SecretStore_T() = default;

    /// @return std::nullopt if nothing is stored under secret_path
    virtual std::optional<Credentials> get_credentials(const std::string& secret_path) const = 0;
};

/// @brief In memory secret store, optionally populated from a JSON document of the form
///   { "<secret path>": { "username": "<user>", "password": "<password>" }, ... }
class JsonSecretStore : public SecretStore_T
{
public:
    JsonSecretStore() = default;

    /// @throw std::runtime_error if the file cannot be read
    /// @throw std::invalid_argument if the content is not a valid secrets document
    static JsonSecretStore from_file(const std::string& path);

    /// @throw std::invalid_argument if the content is not a valid secrets document
    static JsonSecretStore from_string(const std::string& content);

    JsonSecretStore(const JsonSecretStore& other);
    JsonSecretStore& operator=(const JsonSecretStore& other);

    virtual std::optional<Credentials> get_credentials(const std::string& secret_path) const override;

    void set_credentials(const std::string& secret_path, const Credentials& credentials);

    std::size_t size() const;

private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, Credentials> m_secrets;
};

} // end namespace onvifcore

#endif // __ONVIFCORE_SECRET_STORE_H__
