#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <optional>
#include "protocol/messages.hpp"

namespace protocol {

// Binary chunk frame, used only when both ends agreed on it during handshake:
// Magic 'C''S'(2) | TotalLen(4) | Type(1) | TidLen(2) | Tid | ChunkIdx(4) | Data
// Integers are big-endian; TotalLen counts every byte after itself.
constexpr uint8_t FRAME_MAGIC_1 = 0x43; // 'C'
constexpr uint8_t FRAME_MAGIC_2 = 0x53; // 'S'
constexpr uint8_t FRAME_TYPE_FILE_CHUNK = 0x01;

constexpr size_t FRAME_PREFIX_SIZE = 6;  // magic + total length
constexpr size_t MIN_FRAME_SIZE = 13;    // prefix + type + tid length + chunk index

enum class FrameStatus {
    COMPLETE,
    INCOMPLETE, // need more bytes
    SKIP        // drop `consumed` bytes and continue
};

struct FrameParseResult {
    FrameStatus status;
    size_t consumed;
    std::optional<FileChunk> chunk;
};

bool starts_with_frame_magic(const uint8_t* data, size_t size);

// Full frame size announced by the length prefix; empty until the prefix has arrived
std::optional<size_t> declared_frame_size(const uint8_t* data, size_t size);

std::vector<uint8_t> serialize_chunk_frame(const FileChunk& chunk);
FrameParseResult parse_chunk_frame(const uint8_t* data, size_t size);

} // namespace protocol
