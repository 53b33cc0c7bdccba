/**
 * @file cli_test.cpp
 * @brief Tests for command-line argument handling
 */

#include <gtest/gtest.h>

#include "cli.hpp"

//============================================================================
// send arguments
//============================================================================

/**
 * @test --binary is recognised before, between and after the positionals
 */
TEST(SendArgsTest, BinaryFlagInAnyPosition) {
    const std::vector<std::vector<std::string>> forms = {
        {"--binary", "192.168.1.20", "53317", "backup.zip"},
        {"192.168.1.20", "--binary", "53317", "backup.zip"},
        {"192.168.1.20", "53317", "backup.zip", "--binary"}
    };
    for (const auto& form : forms) {
        auto args = cli::parse_send_args(form);
        ASSERT_TRUE(args.has_value());
        EXPECT_EQ(args->host, "192.168.1.20");
        EXPECT_EQ(args->port, 53317);
        EXPECT_EQ(args->filepath, "backup.zip");
        EXPECT_TRUE(args->binary);
    }
}

TEST(SendArgsTest, JsonChunksByDefault) {
    auto args = cli::parse_send_args({"host", "8080", "a.zip"});
    ASSERT_TRUE(args.has_value());
    EXPECT_FALSE(args->binary);
}

TEST(SendArgsTest, RejectsBadInput) {
    EXPECT_FALSE(cli::parse_send_args({"host", "8080"}).has_value());
    EXPECT_FALSE(cli::parse_send_args({"host", "8080", "a.zip", "extra"}).has_value());
    EXPECT_FALSE(cli::parse_send_args({"host", "eighty", "a.zip"}).has_value());
    EXPECT_FALSE(cli::parse_send_args({"host", "0", "a.zip"}).has_value());
    EXPECT_FALSE(cli::parse_send_args({"host", "70000", "a.zip"}).has_value());
    EXPECT_FALSE(cli::parse_send_args({"--fast", "host", "8080", "a.zip"}).has_value());
}

//============================================================================
// serve banner
//============================================================================

TEST(ServiceBannerTest, NamesDiscoveryService) {
    EXPECT_EQ(cli::service_banner(53317), "_cherrystudio._tcp.local. (cherrystudio) port 53317");
}
