#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "protocol/messages.hpp"

namespace protocol {

constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 2 * 1024 * 1024;

// Serializes to UTF-8 JSON followed by MESSAGE_TERMINATOR
std::string encode_line(const nlohmann::json& j);

template <typename Message>
std::string encode(const Message& message) {
    nlohmann::json j = message;
    return encode_line(j);
}

std::string encode(const Request& request);
std::string encode(const Reply& reply);

// Both throw errors::Error(MALFORMED_MESSAGE) for invalid JSON, a missing or
// unknown `type`, or fields of the wrong shape
Request decode_request(const std::string& line);
Reply decode_reply(const std::string& line);

const char* type_name(const Request& request);

// Splits a byte stream into terminator-delimited JSON lines and, once
// enabled, binary chunk frames.
class FrameReader {
public:
    struct Frame {
        enum class Kind { JSON, BINARY_CHUNK };
        Kind kind;
        std::string json;
        FileChunk chunk;
    };

    explicit FrameReader(size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES);

    void feed(const uint8_t* data, size_t size);
    void feed(const std::string& data);

    // Throws errors::Error(MALFORMED_MESSAGE) when an unterminated message
    // outgrows the limit or a binary frame announces more than the limit;
    // the buffered bytes are discarded first.
    std::optional<Frame> next();

    void set_binary_frames(bool enabled) { binary_frames_ = enabled; }
    bool binary_frames() const { return binary_frames_; }

    void reset();
    size_t buffered() const { return buffer_.size() - start_; }

private:
    void consume(size_t n);

    std::string buffer_;
    size_t start_ = 0;     // first unconsumed byte
    size_t scanned_ = 0;   // bytes after start_ known to hold no terminator
    size_t max_message_bytes_;
    bool binary_frames_ = false;
};

} // namespace protocol
