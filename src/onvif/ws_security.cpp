/**
 * @file ws_security.cpp
 *
 * Copyright 2023 PreAct Technologies
 */
#include "ws_security.hpp"

#include <boost/algorithm/string.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <ctime>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace onvifcore
{
namespace onvif
{

static std::string digest(const EVP_MD* md, const std::string& data)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (!ctx
        || (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1)
        || (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
        || (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1))
    {
        throw std::runtime_error("message digest computation failed");
    }
    return std::string(reinterpret_cast<const char*>(out), out_len);
}


std::string base64_encode(const std::string& data)
{
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const auto len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                     static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
}


std::string sha1(const std::string& data)
{
    return digest(EVP_sha1(), data);
}


std::string md5_hex(const std::string& data)
{
    static const char* hex = "0123456789abcdef";
    const auto raw = digest(EVP_md5(), data);
    std::string result;
    for (const auto c : raw)
    {
        const auto b = static_cast<unsigned char>(c);
        result.push_back(hex[b >> 4]);
        result.push_back(hex[b & 0xF]);
    }
    return result;
}


std::string random_bytes(std::size_t count)
{
    std::string bytes(count, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&bytes[0]), static_cast<int>(count)) != 1)
    {
        throw std::runtime_error("unable to generate random bytes");
    }
    return bytes;
}


std::string utc_timestamp(std::chrono::system_clock::time_point time)
{
    const auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm {};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}


UsernameToken make_username_token(const Credentials& credentials, const std::string& raw_nonce,
                                  const std::string& created)
{
    UsernameToken token;
    token.username = credentials.username;
    token.password_digest = base64_encode(sha1(raw_nonce + created + credentials.password));
    token.nonce = base64_encode(raw_nonce);
    token.created = created;
    return token;
}


std::optional<DigestChallenge> parse_digest_challenge(const std::string& header)
{
    const auto value = boost::algorithm::trim_copy(header);
    if (!boost::algorithm::istarts_with(value, "Digest "))
    {
        return std::nullopt;
    }

    std::map<std::string, std::string> params;
    std::size_t pos = 7;
    while (pos < value.size())
    {
        while ((pos < value.size()) && ((value[pos] == ' ') || (value[pos] == ',')))
        {
            ++pos;
        }
        const auto eq = value.find('=', pos);
        if (eq == std::string::npos)
        {
            break;
        }
        auto key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value.substr(pos, eq - pos)));
        pos = eq + 1;

        std::string param;
        if ((pos < value.size()) && (value[pos] == '"'))
        {
            ++pos;
            while ((pos < value.size()) && (value[pos] != '"'))
            {
                if ((value[pos] == '\\') && (pos + 1 < value.size()))
                {
                    ++pos;
                }
                param.push_back(value[pos++]);
            }
            ++pos; // closing quote
        }
        else
        {
            const auto end = value.find(',', pos);
            param = boost::algorithm::trim_copy(value.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
            pos = (end == std::string::npos) ? value.size() : end;
        }
        params[key] = param;
    }

    if (params["nonce"].empty())
    {
        return std::nullopt;
    }
    DigestChallenge challenge;
    challenge.realm = params["realm"];
    challenge.nonce = params["nonce"];
    challenge.opaque = params["opaque"];
    challenge.qop = params["qop"];
    challenge.algorithm = params["algorithm"];
    return challenge;
}


static bool offers_qop_auth(const std::string& qop)
{
    std::vector<std::string> options;
    boost::algorithm::split(options, qop, boost::algorithm::is_any_of(","));
    for (auto& option : options)
    {
        if (boost::algorithm::iequals(boost::algorithm::trim_copy(option), "auth"))
        {
            return true;
        }
    }
    return false;
}


std::string digest_authorization(const DigestChallenge& challenge, const Credentials& credentials,
                                 const std::string& method, const std::string& uri,
                                 const std::string& cnonce, const std::string& nonce_count)
{
    const auto ha1 = md5_hex(credentials.username + ":" + challenge.realm + ":" + credentials.password);
    const auto ha2 = md5_hex(method + ":" + uri);
    const bool use_qop = offers_qop_auth(challenge.qop);

    std::string response;
    if (use_qop)
    {
        response = md5_hex(ha1 + ":" + challenge.nonce + ":" + nonce_count + ":" + cnonce + ":auth:" + ha2);
    }
    else
    {
        response = md5_hex(ha1 + ":" + challenge.nonce + ":" + ha2);
    }

    std::ostringstream os;
    os << "Digest username=\"" << credentials.username << "\""
       << ", realm=\"" << challenge.realm << "\""
       << ", nonce=\"" << challenge.nonce << "\""
       << ", uri=\"" << uri << "\""
       << ", response=\"" << response << "\"";
    if (!challenge.algorithm.empty())
    {
        os << ", algorithm=" << challenge.algorithm;
    }
    if (!challenge.opaque.empty())
    {
        os << ", opaque=\"" << challenge.opaque << "\"";
    }
    if (use_qop)
    {
        os << ", qop=auth, nc=" << nonce_count << ", cnonce=\"" << cnonce << "\"";
    }
    return os.str();
}

} //end namespace onvif
} //end namespace onvifcore
