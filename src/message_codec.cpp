#include "protocol/message_codec.hpp"
#include "protocol/constants.hpp"
#include "protocol/packet.hpp"
#include "errors.hpp"

using nlohmann::json;

namespace protocol {

namespace {

errors::Error malformed(const std::string& why) {
    return errors::Error(errors::Code::MALFORMED_MESSAGE, why);
}

json parse_object(const std::string& line) {
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        throw malformed("Invalid JSON message format");
    }
    if (!j.is_object()) {
        throw malformed("Invalid message format: expected object");
    }
    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) {
        throw malformed("Invalid message format: missing type");
    }
    return j;
}

template <typename Message, typename Variant>
Variant read_as(const json& j, const std::string& type) {
    try {
        return j.get<Message>();
    } catch (const json::exception& e) {
        throw malformed("Invalid " + type + " message: " + e.what());
    }
}

} // namespace

std::string encode_line(const json& j) {
    std::string line = j.dump();
    line.push_back(MESSAGE_TERMINATOR);
    return line;
}

std::string encode(const Request& request) {
    return std::visit([](const auto& m) { return encode(m); }, request);
}

std::string encode(const Reply& reply) {
    return std::visit([](const auto& m) { return encode(m); }, reply);
}

Request decode_request(const std::string& line) {
    json j = parse_object(line);
    const std::string type = j["type"].get<std::string>();

    if (type == "handshake")     return read_as<Handshake, Request>(j, type);
    if (type == "ping")          return read_as<Ping, Request>(j, type);
    if (type == "file_start")    return read_as<FileStart, Request>(j, type);
    if (type == "file_chunk")    return read_as<FileChunk, Request>(j, type);
    if (type == "file_end")      return read_as<FileEnd, Request>(j, type);
    if (type == "handshake_ack") return read_as<HandshakeAck, Request>(j, type);
    if (type == "pong")          return read_as<Pong, Request>(j, type);

    throw malformed("Unknown message type: " + type);
}

Reply decode_reply(const std::string& line) {
    json j = parse_object(line);
    const std::string type = j["type"].get<std::string>();

    if (type == "handshake_ack")  return read_as<HandshakeAck, Reply>(j, type);
    if (type == "pong")           return read_as<Pong, Reply>(j, type);
    if (type == "file_start_ack") return read_as<FileStartAck, Reply>(j, type);
    if (type == "file_complete")  return read_as<FileComplete, Reply>(j, type);
    if (type == "error")          return read_as<ErrorMessage, Reply>(j, type);

    throw malformed("Unknown message type: " + type);
}

const char* type_name(const Request& request) {
    static const char* names[] = {
        "handshake", "ping", "file_start", "file_chunk", "file_end", "handshake_ack", "pong"
    };
    return names[request.index()];
}

// ─── FrameReader ────────────────────────────────────────────────────────────

FrameReader::FrameReader(size_t max_message_bytes)
    : max_message_bytes_(max_message_bytes) {}

void FrameReader::feed(const uint8_t* data, size_t size) {
    buffer_.append(reinterpret_cast<const char*>(data), size);
}

void FrameReader::feed(const std::string& data) {
    buffer_.append(data);
}

void FrameReader::reset() {
    buffer_.clear();
    start_ = 0;
    scanned_ = 0;
    binary_frames_ = false;
}

void FrameReader::consume(size_t n) {
    start_ += n;
    scanned_ = 0;
    if (start_ == buffer_.size()) {
        buffer_.clear();
        start_ = 0;
    } else if (start_ > buffer_.size() / 2) {
        buffer_.erase(0, start_);
        start_ = 0;
    }
}

std::optional<FrameReader::Frame> FrameReader::next() {
    while (start_ < buffer_.size()) {
        const uint8_t* head = reinterpret_cast<const uint8_t*>(buffer_.data()) + start_;
        const size_t available = buffer_.size() - start_;

        if (binary_frames_ && starts_with_frame_magic(head, available)) {
            FrameParseResult result = parse_chunk_frame(head, available);
            if (result.status == FrameStatus::INCOMPLETE) {
                auto declared = declared_frame_size(head, available);
                if (declared && *declared > max_message_bytes_) {
                    buffer_.clear();
                    start_ = 0;
                    scanned_ = 0;
                    throw errors::Error(errors::Code::MALFORMED_MESSAGE,
                                        "Binary frame of " + std::to_string(*declared) + " bytes exceeds " +
                                        std::to_string(max_message_bytes_) + " bytes");
                }
                return std::nullopt;
            }
            consume(result.consumed);
            if (result.status == FrameStatus::COMPLETE) {
                return Frame{Frame::Kind::BINARY_CHUNK, {}, std::move(*result.chunk)};
            }
            continue;
        }

        const size_t terminator = buffer_.find(MESSAGE_TERMINATOR, start_ + scanned_);
        if (terminator == std::string::npos) {
            scanned_ = available;
            if (available > max_message_bytes_) {
                buffer_.clear();
                start_ = 0;
                scanned_ = 0;
                throw errors::Error(errors::Code::MALFORMED_MESSAGE,
                                    "Message exceeds " + std::to_string(max_message_bytes_) + " bytes");
            }
            return std::nullopt;
        }

        std::string line = buffer_.substr(start_, terminator - start_);
        consume(terminator - start_ + 1);

        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue; // blank line
        }
        return Frame{Frame::Kind::JSON, std::move(line), {}};
    }
    return std::nullopt;
}

} // namespace protocol
