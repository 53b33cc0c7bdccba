#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace pairing {

// Magic identifier leading every compressed payload
constexpr const char* PAYLOAD_MAGIC = "CSA";
constexpr const char* CONNECTION_TYPE = "socket";
constexpr const char* UNKNOWN_INTERFACE = "unknown";

struct Candidate {
    std::string host;
    std::string interface_name;
    int priority = 0;
};

struct ConnectionInfo {
    std::string type = CONNECTION_TYPE;
    std::vector<Candidate> candidates; // caller orders by descending priority
    std::optional<std::string> selected_host;
    uint16_t port = 0;
    int64_t timestamp = 0;             // epoch milliseconds
};

// ['CSA', selectedIp, [candidateIps...], port, timestamp]
struct CompressedConnectionInfo {
    uint32_t selected_ip = 0;          // 0 when no host was selected
    std::vector<uint32_t> candidate_ips;
    uint16_t port = 0;
    int64_t timestamp = 0;
};

// Throws errors::Error(INVALID_ADDRESS) for anything but a dotted IPv4 quad
uint32_t ipv4_to_uint(const std::string& host);
std::string uint_to_ipv4(uint32_t value);

CompressedConnectionInfo encode(const ConnectionInfo& info);

// Interface and priority are not carried; candidates come back with
// UNKNOWN_INTERFACE and priority 0, in payload order
ConnectionInfo decode(const CompressedConnectionInfo& compressed);

nlohmann::json to_payload(const CompressedConnectionInfo& compressed);
// Throws errors::Error(INVALID_PAIRING_CODE) on wrong magic, arity or field types
CompressedConnectionInfo from_payload(const nlohmann::json& payload);

// JSON text suitable for rendering into a QR code
std::string encode_payload(const ConnectionInfo& info);
ConnectionInfo decode_payload(const std::string& text);

bool is_stale(const ConnectionInfo& info, int64_t now_ms, int64_t max_age_ms);

} // namespace pairing
