#include "config.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>

namespace config {

namespace {

const char* const KNOWN_KEYS[] = {
    "bindAddress", "port", "storageDir", "tempDir", "protocolVersion", "chunkSize",
    "globalTimeoutMs", "peerIdleTimeoutMs", "maxMalformedMessages", "writeQueueChunks",
    "progressIntervalMs", "maxMessageBytes", "allowBinaryChunks", "failOnTransferError"
};

errors::Error bad_config(const std::string& why) {
    return errors::Error(errors::Code::MALFORMED_MESSAGE, "Invalid configuration: " + why);
}

} // namespace

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = nlohmann::json{
        {"bindAddress", c.bind_address},
        {"port", c.port},
        {"storageDir", c.storage_dir},
        {"tempDir", c.temp_dir},
        {"protocolVersion", c.protocol_version},
        {"chunkSize", c.chunk_size},
        {"globalTimeoutMs", c.global_timeout_ms},
        {"peerIdleTimeoutMs", c.peer_idle_timeout_ms},
        {"maxMalformedMessages", c.max_malformed_messages},
        {"writeQueueChunks", c.write_queue_chunks},
        {"progressIntervalMs", c.progress_interval_ms},
        {"maxMessageBytes", c.max_message_bytes},
        {"allowBinaryChunks", c.allow_binary_chunks},
        {"failOnTransferError", c.fail_on_transfer_error}
    };
}

void from_json(const nlohmann::json& j, ServerConfig& c) {
    c.bind_address = j.value("bindAddress", c.bind_address);
    c.port = j.value("port", c.port);
    c.storage_dir = j.value("storageDir", c.storage_dir);
    c.temp_dir = j.value("tempDir", c.temp_dir);
    c.protocol_version = j.value("protocolVersion", c.protocol_version);
    c.chunk_size = j.value("chunkSize", c.chunk_size);
    c.global_timeout_ms = j.value("globalTimeoutMs", c.global_timeout_ms);
    c.peer_idle_timeout_ms = j.value("peerIdleTimeoutMs", c.peer_idle_timeout_ms);
    c.max_malformed_messages = j.value("maxMalformedMessages", c.max_malformed_messages);
    c.write_queue_chunks = j.value("writeQueueChunks", c.write_queue_chunks);
    c.progress_interval_ms = j.value("progressIntervalMs", c.progress_interval_ms);
    c.max_message_bytes = j.value("maxMessageBytes", c.max_message_bytes);
    c.allow_binary_chunks = j.value("allowBinaryChunks", c.allow_binary_chunks);
    c.fail_on_transfer_error = j.value("failOnTransferError", c.fail_on_transfer_error);
}

std::string ServerConfig::effective_temp_dir() const {
    if (!temp_dir.empty()) return temp_dir;
    return (std::filesystem::path(storage_dir) / ".partial").string();
}

void validate(const ServerConfig& c) {
    if (c.chunk_size == 0) throw bad_config("chunkSize must be positive");
    if (c.write_queue_chunks == 0) throw bad_config("writeQueueChunks must be positive");
    if (c.global_timeout_ms == 0) throw bad_config("globalTimeoutMs must be positive");
    if (c.max_message_bytes < c.chunk_size) throw bad_config("maxMessageBytes is smaller than a chunk");
    if (c.protocol_version.empty()) throw bad_config("protocolVersion is empty");
    if (c.storage_dir.empty()) throw bad_config("storageDir is empty");
}

ServerConfig parse_config(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw bad_config("expected a JSON object");
    }

    for (const auto& item : j.items()) {
        bool known = false;
        for (const char* key : KNOWN_KEYS) known = known || item.key() == key;
        if (!known) throw bad_config("unknown key " + item.key());
    }

    ServerConfig c;
    try {
        from_json(j, c);
    } catch (const nlohmann::json::exception& e) {
        throw bad_config(e.what());
    }
    validate(c);
    return c;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw bad_config("cannot open " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_config(ss.str());
}

} // namespace config
