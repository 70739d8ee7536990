/**
 * @file testSecretStore.cpp
 *
 * Copyright 2023 PreAct Technologies
 *
 */
#include "secret_store.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace onvifcore;

TEST(testSecretStore, fromString)
{
    const auto store = JsonSecretStore::from_string(R"({
        "credentials": { "username": "admin", "password": "secret" },
        "urn:uuid:123": { "username": "operator", "password": "p@ss" }
    })");

    EXPECT_EQ(store.size(), 2u);
    const auto defaults = store.get_credentials("credentials");
    ASSERT_TRUE(defaults.has_value());
    EXPECT_EQ(defaults->username, "admin");
    EXPECT_EQ(defaults->password, "secret");

    const auto per_device = store.get_credentials("urn:uuid:123");
    ASSERT_TRUE(per_device.has_value());
    EXPECT_EQ(per_device->username, "operator");

    EXPECT_FALSE(store.get_credentials("urn:uuid:999").has_value());
}

TEST(testSecretStore, invalidDocuments)
{
    EXPECT_THROW(JsonSecretStore::from_string("not json"), std::invalid_argument);
    EXPECT_THROW(JsonSecretStore::from_string("[1, 2]"), std::invalid_argument);
    EXPECT_THROW(JsonSecretStore::from_string(R"({"credentials": "admin:secret"})"), std::invalid_argument);
    EXPECT_THROW(JsonSecretStore::from_string(R"({"credentials": {"username": 7}})"), std::invalid_argument);
    EXPECT_THROW(JsonSecretStore::from_file("/nonexistent/secrets.json"), std::runtime_error);
}

TEST(testSecretStore, fromFile)
{
    const std::string path = ::testing::TempDir() + "onvifcore_secrets.json";
    {
        std::ofstream out(path);
        out << R"({"credentials": {"username": "admin", "password": "secret"}})";
    }
    const auto store = JsonSecretStore::from_file(path);
    std::remove(path.c_str());
    EXPECT_EQ(store.get_credentials("credentials")->password, "secret");
}

TEST(testSecretStore, concurrentAccess)
{
    JsonSecretStore store;
    store.set_credentials("credentials", Credentials { "admin", "secret" });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 200; ++i)
            {
                store.set_credentials("device-" + std::to_string(t) + "-" + std::to_string(i), Credentials { "u", "p" });
                EXPECT_TRUE(store.get_credentials("credentials").has_value());
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }
    EXPECT_EQ(store.size(), 801u);

    JsonSecretStore copy { store };
    EXPECT_EQ(copy.size(), 801u);
}
