#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace protocol {

// ─── Desktop -> mobile ─────────────────────────────────────────────────────

struct Handshake {
    std::string device_name;
    std::string version;
    std::optional<std::string> platform;
    std::optional<std::string> app_version;
    std::vector<std::string> capabilities;
};

struct Ping {
    std::optional<std::string> payload;
};

struct FileStart {
    std::string transfer_id;
    std::string file_name;
    uint64_t file_size = 0;
    std::string mime_type;
    std::string checksum;      // SHA-256, 64 hex characters
    uint64_t total_chunks = 0;
    uint64_t chunk_size = 0;
};

// Carried base64-encoded in JSON; `data` holds the decoded bytes
struct FileChunk {
    std::string transfer_id;
    int64_t chunk_index = 0;
    std::vector<uint8_t> data;
};

struct FileEnd {
    std::string transfer_id;
};

// ─── Mobile -> desktop ─────────────────────────────────────────────────────

struct HandshakeAck {
    bool accepted = false;
    std::optional<std::string> message;
    std::vector<std::string> capabilities;
};

struct Pong {
    bool received = true;
    std::optional<std::string> payload;
};

struct FileStartAck {
    std::string transfer_id;
    bool accepted = false;
    std::optional<std::string> message;
};

struct FileComplete {
    std::string transfer_id;
    bool success = false;
    std::optional<std::string> file_path;
    std::optional<std::string> error;
    std::optional<std::string> error_code;
    std::optional<uint64_t> received_chunks;
    std::optional<uint64_t> received_bytes;
};

struct ErrorMessage {
    std::string error;
    std::optional<std::string> error_code;
};

// A peer may also echo acks and pongs back; they are parsed and ignored
using Request = std::variant<Handshake, Ping, FileStart, FileChunk, FileEnd, HandshakeAck, Pong>;
using Reply = std::variant<HandshakeAck, Pong, FileStartAck, FileComplete, ErrorMessage>;

// Each to_json writes the `type` discriminant; from_json expects the
// remaining fields and throws nlohmann::json::exception when they are absent
// or mistyped.
void to_json(nlohmann::json& j, const Handshake& m);
void from_json(const nlohmann::json& j, Handshake& m);
void to_json(nlohmann::json& j, const Ping& m);
void from_json(const nlohmann::json& j, Ping& m);
void to_json(nlohmann::json& j, const FileStart& m);
void from_json(const nlohmann::json& j, FileStart& m);
void to_json(nlohmann::json& j, const FileChunk& m);
void from_json(const nlohmann::json& j, FileChunk& m);
void to_json(nlohmann::json& j, const FileEnd& m);
void from_json(const nlohmann::json& j, FileEnd& m);
void to_json(nlohmann::json& j, const HandshakeAck& m);
void from_json(const nlohmann::json& j, HandshakeAck& m);
void to_json(nlohmann::json& j, const Pong& m);
void from_json(const nlohmann::json& j, Pong& m);
void to_json(nlohmann::json& j, const FileStartAck& m);
void from_json(const nlohmann::json& j, FileStartAck& m);
void to_json(nlohmann::json& j, const FileComplete& m);
void from_json(const nlohmann::json& j, FileComplete& m);
void to_json(nlohmann::json& j, const ErrorMessage& m);
void from_json(const nlohmann::json& j, ErrorMessage& m);

} // namespace protocol
