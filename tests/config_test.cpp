/**
 * @file config_test.cpp
 * @brief Tests for JSON configuration loading
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config.hpp"
#include "errors.hpp"

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto c = config::parse_config("{}");
    EXPECT_EQ(c.bind_address, "0.0.0.0");
    EXPECT_EQ(c.port, 0);
    EXPECT_EQ(c.protocol_version, "1");
    EXPECT_EQ(c.chunk_size, 512u * 1024u);
    EXPECT_EQ(c.global_timeout_ms, 600000u);
    EXPECT_EQ(c.max_malformed_messages, 3u);
    EXPECT_EQ(c.write_queue_chunks, 8u);
    EXPECT_EQ(c.progress_interval_ms, 250u);
    EXPECT_TRUE(c.allow_binary_chunks);
    EXPECT_FALSE(c.fail_on_transfer_error);
}

TEST(ConfigTest, OverridesAreApplied) {
    auto c = config::parse_config(R"({"port":53317,"storageDir":"/tmp/in","globalTimeoutMs":1000,)"
                                  R"("failOnTransferError":true})");
    EXPECT_EQ(c.port, 53317);
    EXPECT_EQ(c.storage_dir, "/tmp/in");
    EXPECT_EQ(c.global_timeout_ms, 1000u);
    EXPECT_TRUE(c.fail_on_transfer_error);
}

TEST(ConfigTest, TempDirDefaultsUnderStorageDir) {
    config::ServerConfig c;
    c.storage_dir = "/data/in";
    EXPECT_EQ(std::filesystem::path(c.effective_temp_dir()), std::filesystem::path("/data/in/.partial"));
    c.temp_dir = "/scratch";
    EXPECT_EQ(c.effective_temp_dir(), "/scratch");
}

TEST(ConfigTest, InvalidValuesAreRejected) {
    const char* bad[] = {
        "not json",
        "[]",
        R"({"chunkSize":0})",
        R"({"writeQueueChunks":0})",
        R"({"port":"eighty"})",
        R"({"unknownKey":1})",
        R"({"chunkSize":4096,"maxMessageBytes":1024})"
    };
    for (const char* text : bad) {
        try {
            config::parse_config(text);
            ADD_FAILURE() << "accepted " << text;
        } catch (const errors::Error& e) {
            EXPECT_EQ(e.code(), errors::Code::MALFORMED_MESSAGE) << text;
        }
    }
}

TEST(ConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "lanbridge_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"bindAddress":"127.0.0.1","writeQueueChunks":2})";
    }
    auto c = config::load_config(path.string());
    EXPECT_EQ(c.bind_address, "127.0.0.1");
    EXPECT_EQ(c.write_queue_chunks, 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(config::load_config("/nonexistent/lanbridge.json"), errors::Error);
}
