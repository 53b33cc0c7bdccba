#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "protocol/constants.hpp"
#include "protocol/message_codec.hpp"

namespace config {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 0;                 // 0 picks an ephemeral port
    std::string storage_dir = "received";
    std::string temp_dir;              // empty means <storage_dir>/.partial
    std::string protocol_version = protocol::PROTOCOL_VERSION;
    uint64_t chunk_size = protocol::CHUNK_SIZE;
    uint64_t global_timeout_ms = protocol::GLOBAL_TIMEOUT_MS;
    uint64_t peer_idle_timeout_ms = 0; // 0 disables the idle check
    size_t max_malformed_messages = 3;
    size_t write_queue_chunks = 8;
    uint64_t progress_interval_ms = 250;
    size_t max_message_bytes = protocol::DEFAULT_MAX_MESSAGE_BYTES;
    bool allow_binary_chunks = true;
    bool fail_on_transfer_error = false;

    std::string effective_temp_dir() const;
};

void to_json(nlohmann::json& j, const ServerConfig& c);
void from_json(const nlohmann::json& j, ServerConfig& c);

// Missing keys keep their defaults. Throws errors::Error(MALFORMED_MESSAGE)
// for unreadable files, bad JSON or out-of-range values.
ServerConfig load_config(const std::string& path);
ServerConfig parse_config(const std::string& text);
void validate(const ServerConfig& c);

} // namespace config
