/**
 * @file testWsSecurity.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "onvif/ws_security.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>

using ::testing::HasSubstr;
using ::testing::Not;

using namespace onvifcore;
using namespace onvifcore::onvif;

TEST(testWsSecurity, encodings)
{
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");
    EXPECT_EQ(md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(base64_encode(sha1("abc")), "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
    EXPECT_EQ(random_bytes(16).size(), 16u);
    EXPECT_NE(random_bytes(16), random_bytes(16));
}

TEST(testWsSecurity, timestamp)
{
    const auto epoch_plus = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    EXPECT_EQ(utc_timestamp(epoch_plus), "2023-11-14T22:13:20Z");
}

TEST(testWsSecurity, usernameToken)
{
    const auto nonce = std::string("\x4a\x1c\x0f\xe1\x53\x7b\x1f\x09\x5a\x86\x4d\x70\x3a\x0a\xa8\xfc", 16);
    const auto token = make_username_token(Credentials { "admin", "secret" }, nonce, "2023-05-01T10:20:30Z");

    EXPECT_EQ(token.username, "admin");
    EXPECT_EQ(token.created, "2023-05-01T10:20:30Z");
    EXPECT_EQ(token.nonce, base64_encode(nonce));
    EXPECT_EQ(token.password_digest, base64_encode(sha1(nonce + "2023-05-01T10:20:30Z" + "secret")));
    EXPECT_EQ(token.password_digest.size(), 28u) << "a base64 encoded SHA-1 digest is 28 characters";
}

TEST(testWsSecurity, parseDigestChallenge)
{
    const auto challenge = parse_digest_challenge(
        "Digest realm=\"IP Camera(C1234)\", qop=\"auth,auth-int\", nonce=\"4e5a6c\", opaque=\"\", algorithm=MD5, stale=FALSE");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->realm, "IP Camera(C1234)");
    EXPECT_EQ(challenge->qop, "auth,auth-int");
    EXPECT_EQ(challenge->nonce, "4e5a6c");
    EXPECT_EQ(challenge->opaque, "");
    EXPECT_EQ(challenge->algorithm, "MD5");

    EXPECT_FALSE(parse_digest_challenge("Basic realm=\"camera\"").has_value());
    EXPECT_FALSE(parse_digest_challenge("Digest realm=\"camera\"").has_value()) << "a challenge needs a nonce";
    EXPECT_FALSE(parse_digest_challenge("").has_value());
}

TEST(testWsSecurity, digestAuthorization)
{
    // RFC 2617 section 3.5 example
    DigestChallenge challenge;
    challenge.realm = "testrealm@host.com";
    challenge.qop = "auth,auth-int";
    challenge.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    challenge.opaque = "5ccc069c403ebaf9f0171e9517f40e41";

    const auto header = digest_authorization(challenge, Credentials { "Mufasa", "Circle Of Life" },
                                             "GET", "/dir/index.html", "0a4f113b");
    EXPECT_THAT(header, HasSubstr("response=\"6629fae49393a05397450978507c4ef1\""));
    EXPECT_THAT(header, HasSubstr("qop=auth, nc=00000001, cnonce=\"0a4f113b\""));
    EXPECT_THAT(header, HasSubstr("opaque=\"5ccc069c403ebaf9f0171e9517f40e41\""));

    challenge.qop.clear();
    const auto legacy = digest_authorization(challenge, Credentials { "Mufasa", "Circle Of Life" },
                                             "GET", "/dir/index.html", "0a4f113b");
    EXPECT_THAT(legacy, Not(HasSubstr("qop=")));
    EXPECT_THAT(legacy, Not(HasSubstr("cnonce=")));
}
