#ifndef __ONVIFCORE_WS_SECURITY_H__
#define __ONVIFCORE_WS_SECURITY_H__
/**
 * @file ws_security.hpp
 *
 * Copyright 2023 PreAct Technologies
 *
 * Credential encodings used to authenticate ONVIF requests
 */
#include "secret_store.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace onvifcore
{
namespace onvif
{

inline constexpr auto NS_WSSE { "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd" };
inline constexpr auto NS_WSU  { "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd" };
inline constexpr auto PASSWORD_DIGEST_TYPE {
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest" };
inline constexpr auto BASE64_ENCODING_TYPE {
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary" };

std::string base64_encode(const std::string& data);

/// @return the raw 20 byte SHA-1 digest of data
std::string sha1(const std::string& data);

/// @return lower case hex MD5 digest of data
std::string md5_hex(const std::string& data);

/// @return count cryptographically random bytes
/// @throw std::runtime_error if the random generator fails
std::string random_bytes(std::size_t count);

/// @return time formatted as xsd:dateTime in UTC, ex: 2023-05-01T10:20:30Z
std::string utc_timestamp(std::chrono::system_clock::time_point time);

/// Values of a wsse:UsernameToken using the PasswordDigest password type
struct UsernameToken
{
    std::string username;
    std::string password_digest;    // Base64(SHA1(nonce + created + password))
    std::string nonce;              // Base64 of the raw nonce
    std::string created;
};

UsernameToken make_username_token(const Credentials& credentials, const std::string& raw_nonce,
                                  const std::string& created);

/// Parameters of a "WWW-Authenticate: Digest ..." challenge (RFC 2617)
struct DigestChallenge
{
    std::string realm;
    std::string nonce;
    std::string opaque;
    std::string qop;
    std::string algorithm;
};

/// @return std::nullopt if header is not a Digest challenge or carries no nonce
std::optional<DigestChallenge> parse_digest_challenge(const std::string& header);

/// @brief Compute the value of the Authorization header answering challenge.
///  qop "auth" is used when the server offers it, otherwise the RFC 2069 form.
std::string digest_authorization(const DigestChallenge& challenge, const Credentials& credentials,
                                 const std::string& method, const std::string& uri,
                                 const std::string& cnonce, const std::string& nonce_count = "00000001");

} //end namespace onvif
} //end namespace onvifcore

#endif // __ONVIFCORE_WS_SECURITY_H__
