#pragma once

#include <cstdint>
#include <array>

namespace protocol {

constexpr const char* SERVICE_TYPE = "cherrystudio";
constexpr const char* SERVICE_FULL_NAME = "_cherrystudio._tcp";
constexpr const char* SERVICE_DOMAIN = "local.";

constexpr const char* PROTOCOL_VERSION = "1";
constexpr char MESSAGE_TERMINATOR = '\n';

constexpr uint64_t CHUNK_SIZE = 512 * 1024;            // 512KB per chunk
constexpr uint64_t GLOBAL_TIMEOUT_MS = 10 * 60 * 1000; // 10 minutes for an entire transfer

constexpr std::array<const char*, 1> ALLOWED_EXTENSIONS = {".zip"};
constexpr std::array<const char*, 2> ALLOWED_MIME_TYPES = {"application/zip", "application/x-zip-compressed"};

// Capability a peer lists in its handshake to send chunks as binary frames
constexpr const char* CAPABILITY_BINARY_CHUNKS = "binary_chunks";

constexpr const char* DEFAULT_DEVICE_NAME = "Unknown Device";

} // namespace protocol
