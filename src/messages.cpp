#include "protocol/messages.hpp"
#include "security.hpp"

using nlohmann::json;

namespace protocol {

namespace {

template <typename T>
void read_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    } else {
        out.reset();
    }
}

template <typename T>
void write_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

std::vector<std::string> read_capabilities(const json& j) {
    auto it = j.find("capabilities");
    if (it == j.end() || it->is_null()) return {};
    return it->get<std::vector<std::string>>();
}

} // namespace

void to_json(json& j, const Handshake& m) {
    j = json{{"type", "handshake"}, {"deviceName", m.device_name}, {"version", m.version}};
    write_optional(j, "platform", m.platform);
    write_optional(j, "appVersion", m.app_version);
    if (!m.capabilities.empty()) j["capabilities"] = m.capabilities;
}

void from_json(const json& j, Handshake& m) {
    j.at("version").get_to(m.version);
    auto it = j.find("deviceName");
    m.device_name = (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
    read_optional(j, "platform", m.platform);
    read_optional(j, "appVersion", m.app_version);
    m.capabilities = read_capabilities(j);
}

void to_json(json& j, const Ping& m) {
    j = json{{"type", "ping"}};
    write_optional(j, "payload", m.payload);
}

void from_json(const json& j, Ping& m) {
    read_optional(j, "payload", m.payload);
}

void to_json(json& j, const FileStart& m) {
    j = json{
        {"type", "file_start"},
        {"transferId", m.transfer_id},
        {"fileName", m.file_name},
        {"fileSize", m.file_size},
        {"mimeType", m.mime_type},
        {"checksum", m.checksum},
        {"totalChunks", m.total_chunks},
        {"chunkSize", m.chunk_size}
    };
}

void from_json(const json& j, FileStart& m) {
    j.at("transferId").get_to(m.transfer_id);
    j.at("fileName").get_to(m.file_name);
    j.at("fileSize").get_to(m.file_size);
    j.at("mimeType").get_to(m.mime_type);
    j.at("checksum").get_to(m.checksum);
    j.at("totalChunks").get_to(m.total_chunks);
    j.at("chunkSize").get_to(m.chunk_size);
}

void to_json(json& j, const FileChunk& m) {
    j = json{
        {"type", "file_chunk"},
        {"transferId", m.transfer_id},
        {"chunkIndex", m.chunk_index},
        {"data", security::base64_encode(m.data)}
    };
}

void from_json(const json& j, FileChunk& m) {
    j.at("transferId").get_to(m.transfer_id);
    j.at("chunkIndex").get_to(m.chunk_index);
    m.data = security::base64_decode(j.at("data").get<std::string>());
}

void to_json(json& j, const FileEnd& m) {
    j = json{{"type", "file_end"}, {"transferId", m.transfer_id}};
}

void from_json(const json& j, FileEnd& m) {
    j.at("transferId").get_to(m.transfer_id);
}

void to_json(json& j, const HandshakeAck& m) {
    j = json{{"type", "handshake_ack"}, {"accepted", m.accepted}};
    write_optional(j, "message", m.message);
    if (!m.capabilities.empty()) j["capabilities"] = m.capabilities;
}

void from_json(const json& j, HandshakeAck& m) {
    j.at("accepted").get_to(m.accepted);
    read_optional(j, "message", m.message);
    m.capabilities = read_capabilities(j);
}

void to_json(json& j, const Pong& m) {
    j = json{{"type", "pong"}, {"received", m.received}};
    write_optional(j, "payload", m.payload);
}

void from_json(const json& j, Pong& m) {
    auto it = j.find("received");
    m.received = it == j.end() || it->get<bool>();
    read_optional(j, "payload", m.payload);
}

void to_json(json& j, const FileStartAck& m) {
    j = json{{"type", "file_start_ack"}, {"transferId", m.transfer_id}, {"accepted", m.accepted}};
    write_optional(j, "message", m.message);
}

void from_json(const json& j, FileStartAck& m) {
    j.at("transferId").get_to(m.transfer_id);
    j.at("accepted").get_to(m.accepted);
    read_optional(j, "message", m.message);
}

void to_json(json& j, const FileComplete& m) {
    j = json{{"type", "file_complete"}, {"transferId", m.transfer_id}, {"success", m.success}};
    write_optional(j, "filePath", m.file_path);
    write_optional(j, "error", m.error);
    write_optional(j, "errorCode", m.error_code);
    write_optional(j, "receivedChunks", m.received_chunks);
    write_optional(j, "receivedBytes", m.received_bytes);
}

void from_json(const json& j, FileComplete& m) {
    j.at("transferId").get_to(m.transfer_id);
    j.at("success").get_to(m.success);
    read_optional(j, "filePath", m.file_path);
    read_optional(j, "error", m.error);
    read_optional(j, "errorCode", m.error_code);
    read_optional(j, "receivedChunks", m.received_chunks);
    read_optional(j, "receivedBytes", m.received_bytes);
}

void to_json(json& j, const ErrorMessage& m) {
    j = json{{"type", "error"}, {"error", m.error}};
    write_optional(j, "errorCode", m.error_code);
}

void from_json(const json& j, ErrorMessage& m) {
    j.at("error").get_to(m.error);
    read_optional(j, "errorCode", m.error_code);
}

} // namespace protocol
