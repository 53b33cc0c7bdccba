#include "networking.hpp"
#include "errors.hpp"
#include "security.hpp"
#include "protocol/constants.hpp"
#include "protocol/packet.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <random>
#include <algorithm>

using boost::asio::ip::tcp;

namespace networking {

namespace {

std::string make_transfer_id() {
    const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);
    std::string id = "tx-";
    for (int i = 0; i < 16; ++i) {
        id += charset[dis(gen)];
    }
    return id;
}

std::string file_checksum(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw errors::Error(errors::Code::DISK_ERROR, "Cannot open " + filepath);
    }
    security::Sha256 hasher;
    std::vector<char> buffer(64 * 1024);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(file.gcount()));
    }
    return hasher.final_hex();
}

class LineChannel {
public:
    explicit LineChannel(tcp::socket& socket) : socket_(socket) {}

    void send(const std::string& line) {
        boost::asio::write(socket_, boost::asio::buffer(line));
    }

    protocol::Reply receive() {
        boost::asio::read_until(socket_, buffer_, protocol::MESSAGE_TERMINATOR);
        std::istream is(&buffer_);
        std::string line;
        std::getline(is, line, protocol::MESSAGE_TERMINATOR);
        return protocol::decode_reply(line);
    }

private:
    tcp::socket& socket_;
    boost::asio::streambuf buffer_;
};

[[noreturn]] void throw_peer_error(const protocol::ErrorMessage& error) {
    const auto code = error.error_code
        ? errors::code_from_wire(*error.error_code, errors::Code::TRANSFER_REJECTED)
        : errors::Code::TRANSFER_REJECTED;
    throw errors::Error(code, "Receiver reported: " + error.error);
}

} // namespace

Client::Client(std::string device_name, bool binary_chunks)
    : device_name_(std::move(device_name)), binary_chunks_(binary_chunks) {}

std::string Client::send_file(const std::string& host, uint16_t port, const std::string& filepath,
                              ClientCallbacks callbacks) {
    auto status = [&callbacks](const std::string& text) {
        if (callbacks.on_status) callbacks.on_status(text);
    };

    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(filepath, ec);
    if (ec) {
        throw errors::Error(errors::Code::DISK_ERROR, "File not found: " + filepath);
    }
    const std::string file_name = std::filesystem::path(filepath).filename().string();

    status("Computing checksum...");
    const std::string checksum = file_checksum(filepath);

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::asio::connect(socket, resolver.resolve(host, std::to_string(port)));
    socket.set_option(tcp::no_delay(true));
    LineChannel channel(socket);
    status("Connected! Handshaking...");

    // --- Handshake ---
    protocol::Handshake hello;
    hello.device_name = device_name_;
    hello.version = protocol::PROTOCOL_VERSION;
    hello.platform = "linux";
    if (binary_chunks_) hello.capabilities.push_back(protocol::CAPABILITY_BINARY_CHUNKS);
    channel.send(protocol::encode(hello));

    protocol::Reply reply = channel.receive();
    if (auto* error = std::get_if<protocol::ErrorMessage>(&reply)) throw_peer_error(*error);
    auto* ack = std::get_if<protocol::HandshakeAck>(&reply);
    if (!ack) {
        throw errors::Error(errors::Code::MALFORMED_MESSAGE, "Expected handshake_ack");
    }
    if (!ack->accepted) {
        throw errors::Error(errors::Code::PROTOCOL_VERSION_MISMATCH, ack->message.value_or("Handshake rejected"));
    }
    const bool use_frames = binary_chunks_ &&
        std::find(ack->capabilities.begin(), ack->capabilities.end(),
                  protocol::CAPABILITY_BINARY_CHUNKS) != ack->capabilities.end();

    // --- file_start ---
    protocol::FileStart start;
    start.transfer_id = make_transfer_id();
    start.file_name = file_name;
    start.file_size = file_size;
    start.mime_type = protocol::ALLOWED_MIME_TYPES[0];
    start.checksum = checksum;
    start.chunk_size = protocol::CHUNK_SIZE;
    start.total_chunks = transfer::chunk_count(file_size, protocol::CHUNK_SIZE);
    channel.send(protocol::encode(start));

    reply = channel.receive();
    if (auto* error = std::get_if<protocol::ErrorMessage>(&reply)) throw_peer_error(*error);
    auto* start_ack = std::get_if<protocol::FileStartAck>(&reply);
    if (!start_ack) {
        throw errors::Error(errors::Code::MALFORMED_MESSAGE, "Expected file_start_ack");
    }
    if (!start_ack->accepted) {
        throw errors::Error(errors::Code::TRANSFER_REJECTED, start_ack->message.value_or("Transfer rejected"));
    }
    status("Sending " + file_name + "...");

    // --- Chunks ---
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw errors::Error(errors::Code::DISK_ERROR, "Cannot open " + filepath);
    }
    std::vector<char> buffer(protocol::CHUNK_SIZE);
    uint64_t sent = 0;
    int64_t index = 0;
    auto start_time = std::chrono::steady_clock::now();
    auto last_update = start_time;

    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        protocol::FileChunk chunk;
        chunk.transfer_id = start.transfer_id;
        chunk.chunk_index = index++;
        chunk.data.assign(buffer.begin(), buffer.begin() + file.gcount());
        sent += chunk.data.size();

        if (use_frames) {
            auto frame = protocol::serialize_chunk_frame(chunk);
            boost::asio::write(socket, boost::asio::buffer(frame));
        } else {
            channel.send(protocol::encode(chunk));
        }

        auto now = std::chrono::steady_clock::now();
        auto since_update = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_update).count();
        if (callbacks.on_progress && (since_update >= 300 || sent == file_size)) {
            double elapsed = std::chrono::duration<double>(now - start_time).count();
            double speed = elapsed > 0 ? (sent / (1024.0 * 1024.0)) / elapsed : 0.0;
            callbacks.on_progress(file_name, sent, file_size, speed);
            last_update = now;
        }
    }

    channel.send(protocol::encode(protocol::FileEnd{start.transfer_id}));
    status("Waiting for receiver to verify...");

    for (;;) {
        reply = channel.receive();
        if (auto* error = std::get_if<protocol::ErrorMessage>(&reply)) throw_peer_error(*error);
        auto* complete = std::get_if<protocol::FileComplete>(&reply);
        if (!complete || complete->transfer_id != start.transfer_id) continue;

        if (complete->success) {
            status("Transfer complete");
            return complete->file_path.value_or(std::string());
        }
        const auto code = complete->error_code
            ? errors::code_from_wire(*complete->error_code, errors::Code::INCOMPLETE_TRANSFER)
            : errors::Code::INCOMPLETE_TRANSFER;
        throw errors::Error(code, complete->error.value_or("Transfer failed"));
    }
}

} // namespace networking
