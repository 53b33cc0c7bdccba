/**
 * @file pairing_test.cpp
 * @brief Tests for the compact QR pairing payload
 */

#include <gtest/gtest.h>

#include <functional>

#include "errors.hpp"
#include "pairing.hpp"

namespace {

pairing::ConnectionInfo sample_info() {
    pairing::ConnectionInfo info;
    info.candidates = {
        {"192.168.1.101", "wlan0", 100},
        {"10.0.0.5", "eth0", 50}
    };
    info.selected_host = "192.168.1.101";
    info.port = 53317;
    info.timestamp = 1700000000000;
    return info;
}

errors::Code code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::Error& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected errors::Error";
    return errors::Code::MALFORMED_MESSAGE;
}

} // namespace

//============================================================================
// Address packing
//============================================================================

TEST(PairingTest, PacksDottedQuadBigEndian) {
    EXPECT_EQ(pairing::ipv4_to_uint("192.168.1.101"), 3232235877u);
    EXPECT_EQ(pairing::ipv4_to_uint("0.0.0.1"), 1u);
    EXPECT_EQ(pairing::uint_to_ipv4(3232235877u), "192.168.1.101");
    EXPECT_EQ(pairing::uint_to_ipv4(0xFFFFFFFFu), "255.255.255.255");
}

TEST(PairingTest, RejectsNonIpv4Hosts) {
    EXPECT_EQ(code_of([] { pairing::ipv4_to_uint("fe80::1"); }), errors::Code::INVALID_ADDRESS);
    EXPECT_EQ(code_of([] { pairing::ipv4_to_uint("10.1"); }), errors::Code::INVALID_ADDRESS);
    EXPECT_EQ(code_of([] { pairing::ipv4_to_uint("256.1.1.1"); }), errors::Code::INVALID_ADDRESS);
    EXPECT_EQ(code_of([] { pairing::ipv4_to_uint("host.local"); }), errors::Code::INVALID_ADDRESS);
}

//============================================================================
// Encode / decode
//============================================================================

/**
 * @test Hosts, port and timestamp survive a full payload round trip
 */
TEST(PairingTest, PayloadRoundTripKeepsHostsPortAndTimestamp) {
    const auto info = sample_info();
    const auto decoded = pairing::decode_payload(pairing::encode_payload(info));

    ASSERT_EQ(decoded.candidates.size(), 2u);
    EXPECT_EQ(decoded.candidates[0].host, "192.168.1.101");
    EXPECT_EQ(decoded.candidates[1].host, "10.0.0.5");
    ASSERT_TRUE(decoded.selected_host.has_value());
    EXPECT_EQ(*decoded.selected_host, "192.168.1.101");
    EXPECT_EQ(decoded.port, 53317);
    EXPECT_EQ(decoded.timestamp, 1700000000000);
    EXPECT_EQ(decoded.type, "socket");
}

TEST(PairingTest, DecodedCandidatesHaveUnknownInterfaceAndZeroPriority) {
    const auto decoded = pairing::decode(pairing::encode(sample_info()));
    for (const auto& c : decoded.candidates) {
        EXPECT_EQ(c.interface_name, "unknown");
        EXPECT_EQ(c.priority, 0);
    }
}

TEST(PairingTest, PayloadIsCompactTuple) {
    auto info = sample_info();
    info.candidates.pop_back();
    EXPECT_EQ(pairing::encode_payload(info), "[\"CSA\",3232235877,[3232235877],53317,1700000000000]");
}

TEST(PairingTest, MissingSelectedHostEncodesAsZero) {
    auto info = sample_info();
    info.selected_host.reset();
    const auto compressed = pairing::encode(info);
    EXPECT_EQ(compressed.selected_ip, 0u);
    EXPECT_FALSE(pairing::decode(compressed).selected_host.has_value());
}

TEST(PairingTest, SelectedHostMustBeACandidate) {
    auto info = sample_info();
    info.selected_host = "192.168.1.200";
    EXPECT_EQ(code_of([&] { pairing::encode(info); }), errors::Code::INVALID_ADDRESS);
}

//============================================================================
// Payload validation
//============================================================================

TEST(PairingTest, RejectsWrongMagic) {
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"XYZ\",1,[1],80,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
}

TEST(PairingTest, RejectsWrongArityAndTypes) {
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",1,[1],80]"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("{\"magic\":\"CSA\"}"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",1,1,80,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",\"1\",[1],80,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("not json"); }),
              errors::Code::INVALID_PAIRING_CODE);
}

TEST(PairingTest, RejectsOutOfRangeValues) {
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",1,[1],70000,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",1,[4294967296],80,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
    EXPECT_EQ(code_of([] { pairing::decode_payload("[\"CSA\",-1,[1],80,0]"); }),
              errors::Code::INVALID_PAIRING_CODE);
}

TEST(PairingTest, StalenessUsesTimestamp) {
    const auto info = sample_info();
    EXPECT_FALSE(pairing::is_stale(info, info.timestamp + 1000, 5000));
    EXPECT_FALSE(pairing::is_stale(info, info.timestamp + 5000, 5000));
    EXPECT_TRUE(pairing::is_stale(info, info.timestamp + 5001, 5000));
}
