#include "pairing.hpp"
#include "errors.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <algorithm>
#include <limits>

namespace pairing {

namespace {

errors::Error invalid_code(const std::string& why) {
    return errors::Error(errors::Code::INVALID_PAIRING_CODE, "Invalid pairing code: " + why);
}

uint32_t read_ip(const nlohmann::json& value) {
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<int64_t>() >= 0)) {
        throw invalid_code("address is not an unsigned integer");
    }
    const uint64_t raw = value.get<uint64_t>();
    if (raw > std::numeric_limits<uint32_t>::max()) {
        throw invalid_code("address out of IPv4 range");
    }
    return static_cast<uint32_t>(raw);
}

} // namespace

uint32_t ipv4_to_uint(const std::string& host) {
    // make_address_v4 accepts shorthand like "10.1"; only full dotted quads are valid hosts
    if (std::count(host.begin(), host.end(), '.') != 3) {
        throw errors::Error(errors::Code::INVALID_ADDRESS, "Not an IPv4 address: " + host);
    }
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(host, ec);
    if (ec) {
        throw errors::Error(errors::Code::INVALID_ADDRESS, "Not an IPv4 address: " + host);
    }
    return addr.to_uint();
}

std::string uint_to_ipv4(uint32_t value) {
    return boost::asio::ip::address_v4(value).to_string();
}

CompressedConnectionInfo encode(const ConnectionInfo& info) {
    CompressedConnectionInfo out;
    out.candidate_ips.reserve(info.candidates.size());
    for (const auto& candidate : info.candidates) {
        out.candidate_ips.push_back(ipv4_to_uint(candidate.host));
    }

    if (info.selected_host) {
        auto it = std::find_if(info.candidates.begin(), info.candidates.end(),
                               [&](const Candidate& c) { return c.host == *info.selected_host; });
        if (it == info.candidates.end()) {
            throw errors::Error(errors::Code::INVALID_ADDRESS,
                                "Selected host " + *info.selected_host + " is not a candidate");
        }
        out.selected_ip = ipv4_to_uint(*info.selected_host);
    }

    out.port = info.port;
    out.timestamp = info.timestamp;
    return out;
}

ConnectionInfo decode(const CompressedConnectionInfo& compressed) {
    ConnectionInfo info;
    for (uint32_t ip : compressed.candidate_ips) {
        info.candidates.push_back({uint_to_ipv4(ip), UNKNOWN_INTERFACE, 0});
    }
    if (compressed.selected_ip != 0) {
        info.selected_host = uint_to_ipv4(compressed.selected_ip);
    }
    info.port = compressed.port;
    info.timestamp = compressed.timestamp;
    return info;
}

nlohmann::json to_payload(const CompressedConnectionInfo& compressed) {
    return nlohmann::json::array({
        PAYLOAD_MAGIC,
        compressed.selected_ip,
        compressed.candidate_ips,
        compressed.port,
        compressed.timestamp
    });
}

CompressedConnectionInfo from_payload(const nlohmann::json& payload) {
    if (!payload.is_array() || payload.size() != 5) {
        throw invalid_code("expected a 5-element array");
    }
    if (!payload[0].is_string() || payload[0].get<std::string>() != PAYLOAD_MAGIC) {
        throw invalid_code("bad magic");
    }
    if (!payload[2].is_array()) {
        throw invalid_code("candidates must be an array");
    }
    if (!payload[3].is_number_integer() || payload[3].get<int64_t>() < 0 ||
        payload[3].get<int64_t>() > std::numeric_limits<uint16_t>::max()) {
        throw invalid_code("port out of range");
    }
    if (!payload[4].is_number_integer()) {
        throw invalid_code("timestamp must be an integer");
    }

    CompressedConnectionInfo out;
    out.selected_ip = read_ip(payload[1]);
    for (const auto& ip : payload[2]) {
        out.candidate_ips.push_back(read_ip(ip));
    }
    out.port = static_cast<uint16_t>(payload[3].get<int64_t>());
    out.timestamp = payload[4].get<int64_t>();
    return out;
}

std::string encode_payload(const ConnectionInfo& info) {
    return to_payload(encode(info)).dump();
}

ConnectionInfo decode_payload(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw invalid_code("not JSON");
    }
    return decode(from_payload(j));
}

bool is_stale(const ConnectionInfo& info, int64_t now_ms, int64_t max_age_ms) {
    return now_ms - info.timestamp > max_age_ms;
}

} // namespace pairing
