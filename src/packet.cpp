#include "protocol/packet.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <iostream>

namespace protocol {

namespace {

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return ntohl(v);
}

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return ntohs(v);
}

} // namespace

bool starts_with_frame_magic(const uint8_t* data, size_t size) {
    return size >= 2 && data[0] == FRAME_MAGIC_1 && data[1] == FRAME_MAGIC_2;
}

std::vector<uint8_t> serialize_chunk_frame(const FileChunk& chunk) {
    const uint16_t tid_len = static_cast<uint16_t>(chunk.transfer_id.size());
    const uint32_t total_len = static_cast<uint32_t>(1 + 2 + tid_len + 4 + chunk.data.size());

    std::vector<uint8_t> buffer(FRAME_PREFIX_SIZE + total_len);
    uint8_t* p = buffer.data();

    p[0] = FRAME_MAGIC_1;
    p[1] = FRAME_MAGIC_2;
    uint32_t len_be = htonl(total_len);
    std::memcpy(p + 2, &len_be, 4);
    p[6] = FRAME_TYPE_FILE_CHUNK;
    uint16_t tid_be = htons(tid_len);
    std::memcpy(p + 7, &tid_be, 2);
    std::memcpy(p + 9, chunk.transfer_id.data(), tid_len);
    uint32_t idx_be = htonl(static_cast<uint32_t>(chunk.chunk_index));
    std::memcpy(p + 9 + tid_len, &idx_be, 4);
    if (!chunk.data.empty()) {
        std::memcpy(p + 13 + tid_len, chunk.data.data(), chunk.data.size());
    }

    return buffer;
}

std::optional<size_t> declared_frame_size(const uint8_t* data, size_t size) {
    if (size < FRAME_PREFIX_SIZE) return std::nullopt;
    return FRAME_PREFIX_SIZE + static_cast<size_t>(read_u32(data + 2));
}

FrameParseResult parse_chunk_frame(const uint8_t* data, size_t size) {
    if (size < MIN_FRAME_SIZE) {
        return {FrameStatus::INCOMPLETE, 0, std::nullopt};
    }
    if (!starts_with_frame_magic(data, size)) {
        std::cerr << "Invalid magic bytes in binary frame, realigning\n";
        return {FrameStatus::SKIP, 1, std::nullopt};
    }

    const size_t frame_len = FRAME_PREFIX_SIZE + static_cast<size_t>(read_u32(data + 2));
    if (size < frame_len) {
        return {FrameStatus::INCOMPLETE, 0, std::nullopt};
    }

    const uint8_t type = data[6];
    const uint16_t tid_len = read_u16(data + 7);
    const size_t header_len = MIN_FRAME_SIZE + tid_len;

    if (frame_len < header_len) {
        std::cerr << "Malformed binary frame: " << frame_len << " bytes cannot hold a "
                  << header_len << "-byte header\n";
        return {FrameStatus::SKIP, frame_len, std::nullopt};
    }
    if (type != FRAME_TYPE_FILE_CHUNK) {
        std::cerr << "Unknown binary frame type " << static_cast<int>(type) << ", skipping\n";
        return {FrameStatus::SKIP, frame_len, std::nullopt};
    }

    FileChunk chunk;
    chunk.transfer_id.assign(reinterpret_cast<const char*>(data + 9), tid_len);
    chunk.chunk_index = read_u32(data + 9 + tid_len);
    chunk.data.assign(data + header_len, data + frame_len);
    return {FrameStatus::COMPLETE, frame_len, std::move(chunk)};
}

} // namespace protocol
