#include "networking.hpp"
#include "errors.hpp"
#include "protocol/constants.hpp"
#include <iostream>
#include <future>
#include <algorithm>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

using boost::asio::ip::tcp;

namespace networking {

namespace {

std::string truncate_for_log(const std::string& text) {
    return text.size() > 200 ? text.substr(0, 200) + "..." : text;
}

std::string get_local_ip(boost::asio::io_context& io_context) {
    try {
        boost::asio::ip::udp::socket socket(io_context);
        socket.connect(boost::asio::ip::udp::endpoint(boost::asio::ip::make_address("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (const std::exception&) {
        return std::string();
    }
}

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

protocol::ErrorMessage error_message(const std::string& text, errors::Code code) {
    return protocol::ErrorMessage{text, std::string(errors::wire_code(code))};
}

} // namespace

const char* to_string(ServerStatus status) {
    switch (status) {
        case ServerStatus::IDLE:           return "idle";
        case ServerStatus::STARTING:       return "starting";
        case ServerStatus::LISTENING:      return "listening";
        case ServerStatus::HANDSHAKING:    return "handshaking";
        case ServerStatus::CONNECTED:      return "connected";
        case ServerStatus::RECEIVING_FILE: return "receiving_file";
        case ServerStatus::ERROR:          return "error";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const LanTransferState& state) {
    j = nlohmann::json{{"status", to_string(state.status)}};
    if (state.port) j["port"] = *state.port;
    if (state.connected_client) j["connectedClient"] = *state.connected_client;
    if (state.last_error) j["lastError"] = *state.last_error;
    if (state.file_transfer) j["fileTransfer"] = *state.file_transfer;
    if (state.completed_file_path) j["completedFilePath"] = *state.completed_file_path;
}

// ─── TransferServer ─────────────────────────────────────────────────────────

TransferServer::TransferServer(config::ServerConfig config,
                               std::shared_ptr<storage::Storage> storage,
                               ServerCallbacks callbacks)
    : config_(std::move(config)),
      storage_(std::move(storage)),
      callbacks_(std::move(callbacks)),
      work_(boost::asio::make_work_guard(io_)),
      acceptor_(io_),
      socket_(io_),
      watchdog_(io_),
      idle_timer_(io_),
      read_buf_(64 * 1024),
      reader_(config_.max_message_bytes),
      io_thread_([this]() {
          for (;;) {
              try {
                  io_.run();
                  break;
              } catch (const std::exception& e) {
                  std::cerr << "TransferServer Exception: " << e.what() << "\n";
              }
          }
      }) {}

TransferServer::~TransferServer() {
    stop();
    work_.reset();
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

template <typename Fn>
void TransferServer::run_on_io(Fn fn) {
    if (std::this_thread::get_id() == io_thread_.get_id()) {
        fn();
        return;
    }
    std::promise<void> done;
    auto finished = done.get_future();
    boost::asio::post(io_, [&fn, &done]() {
        fn();
        done.set_value();
    });
    finished.wait();
}

void TransferServer::start() {
    run_on_io([this]() { do_start(); });
}

void TransferServer::stop() {
    run_on_io([this]() { shutdown(ServerStatus::IDLE, std::nullopt, true); });
}

LanTransferState TransferServer::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void TransferServer::clear_completed_file() {
    run_on_io([this]() {
        update_state([](LanTransferState& s) { s.completed_file_path.reset(); });
    });
}

void TransferServer::do_start() {
    if (acceptor_.is_open()) {
        if (state().status != ServerStatus::ERROR) return;
        std::cout << "TransferServer: restarting after error\n";
        shutdown(ServerStatus::IDLE, std::nullopt, true);
    }

    update_state([](LanTransferState& s) {
        s.status = ServerStatus::STARTING;
        s.last_error.reset();
    });

    uint16_t port = 0;
    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(config_.bind_address), config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port = acceptor_.local_endpoint().port();
    } catch (const std::exception& e) {
        std::cerr << "TransferServer: failed to listen on " << config_.bind_address << ":"
                  << config_.port << ": " << e.what() << "\n";
        shutdown(ServerStatus::ERROR, std::string("Failed to start server: ") + e.what(), false);
        return;
    }

    std::cout << "TransferServer listening on port " << port << "\n";
    update_state([port](LanTransferState& s) {
        s.status = ServerStatus::LISTENING;
        s.port = port;
    });
    do_accept();
}

void TransferServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket peer) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) return;
        if (ec == boost::asio::error::connection_aborted) {
            do_accept();
            return;
        }
        if (ec) {
            std::cerr << "TransferServer: accept failed: " << ec.message() << "\n";
            shutdown(ServerStatus::ERROR, "Socket failure: " + ec.message(), false);
            return;
        }

        if (peer_active() || state().status == ServerStatus::ERROR) {
            reject_peer(std::move(peer));
        } else {
            adopt_peer(std::move(peer));
        }
        do_accept();
    });
}

bool TransferServer::peer_active() const {
    return socket_.is_open();
}

void TransferServer::reject_peer(tcp::socket peer) {
    boost::system::error_code ignored;
    auto remote = peer.remote_endpoint(ignored);
    std::cout << "TransferServer: rejecting connection from " << remote.address().to_string() << "\n";

    const std::string reason = peer_active() ? "Another peer is already connected"
                                             : "Server is in error state";
    boost::asio::write(peer, boost::asio::buffer(protocol::encode(error_message(reason, errors::Code::PEER_BUSY))), ignored);
    peer.shutdown(tcp::socket::shutdown_both, ignored);
    peer.close(ignored);
}

void TransferServer::adopt_peer(tcp::socket peer) {
    socket_ = std::move(peer);
    boost::system::error_code ec;
    socket_.set_option(tcp::no_delay(true), ec);
    auto remote = socket_.remote_endpoint(ec);
    std::cout << "TransferServer: peer connected from " << remote.address().to_string()
              << ":" << remote.port() << "\n";

    ++peer_generation_;
    reader_.reset();
    handshake_ = std::make_unique<protocol::HandshakeProtocol>(config_.protocol_version,
                                                               config_.allow_binary_chunks);
    malformed_count_ = 0;
    read_paused_ = false;

    update_state([](LanTransferState& s) {
        s.status = ServerStatus::HANDSHAKING;
        s.connected_client.reset();
        s.file_transfer.reset();
    });
    arm_idle_timer();
    do_read();
}

void TransferServer::do_read() {
    const uint64_t generation = peer_generation_;
    socket_.async_read_some(boost::asio::buffer(read_buf_),
        [this, generation](const boost::system::error_code& ec, size_t bytes) {
            if (generation != peer_generation_) return;
            if (ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                peer_lost(ec == boost::asio::error::eof ? std::string("peer closed the connection")
                                                        : "socket error: " + ec.message());
                return;
            }

            reader_.feed(read_buf_.data(), bytes);
            arm_idle_timer();
            process_frames();

            if (generation != peer_generation_ || !socket_.is_open()) return;
            if (session_ && session_->backlogged()) {
                // Resumed by the session's on_drained
                read_paused_ = true;
                return;
            }
            do_read();
        });
}

void TransferServer::process_frames() {
    const uint64_t generation = peer_generation_;
    while (generation == peer_generation_ && socket_.is_open()) {
        std::optional<protocol::FrameReader::Frame> frame;
        try {
            frame = reader_.next();
        } catch (const errors::Error& e) {
            std::cerr << "TransferServer: " << e.what() << "\n";
            note_malformed(e.what());
            continue;
        }
        if (!frame) break;

        if (frame->kind == protocol::FrameReader::Frame::Kind::BINARY_CHUNK) {
            malformed_count_ = 0;
            on_file_chunk(std::move(frame->chunk));
            continue;
        }

        protocol::Request request;
        try {
            request = protocol::decode_request(frame->json);
        } catch (const errors::Error& e) {
            std::cerr << "TransferServer: malformed message (" << e.what() << "): "
                      << truncate_for_log(frame->json) << "\n";
            note_malformed(e.what());
            continue;
        }
        malformed_count_ = 0;
        dispatch(std::move(request));
    }
}

void TransferServer::dispatch(protocol::Request request) {
    if (auto* handshake = std::get_if<protocol::Handshake>(&request)) {
        on_handshake(*handshake);
    } else if (auto* ping = std::get_if<protocol::Ping>(&request)) {
        on_ping(*ping);
    } else if (auto* start = std::get_if<protocol::FileStart>(&request)) {
        on_file_start(*start);
    } else if (auto* chunk = std::get_if<protocol::FileChunk>(&request)) {
        on_file_chunk(std::move(*chunk));
    } else if (auto* end = std::get_if<protocol::FileEnd>(&request)) {
        on_file_end(*end);
    }
    // handshake_ack and pong from the peer only count as liveness
}

void TransferServer::note_malformed(const std::string& reason) {
    ++malformed_count_;
    update_state([&reason](LanTransferState& s) { s.last_error = "Malformed message: " + reason; });
    send(protocol::encode(error_message(reason, errors::Code::MALFORMED_MESSAGE)));
    if (malformed_count_ > config_.max_malformed_messages && socket_.is_open()) {
        std::cerr << "TransferServer: too many malformed messages, closing peer\n";
        drop_peer(ServerStatus::ERROR, "Transport closed: too many malformed messages");
    }
}

// ─── Message handlers ───────────────────────────────────────────────────────

void TransferServer::on_handshake(const protocol::Handshake& message) {
    if (!handshake_) return;

    protocol::HandshakeProtocol::Outcome outcome;
    try {
        outcome = handshake_->handle(message);
    } catch (const errors::Error& e) {
        std::cerr << "TransferServer: " << e.what() << "\n";
        send(protocol::encode(error_message(e.what(), e.code())));
        return;
    }

    if (outcome.ack.accepted) {
        reader_.set_binary_frames(handshake_->binary_chunks());
        std::cout << "TransferServer: handshake accepted from " << outcome.client->device_name
                  << (handshake_->binary_chunks() ? " (binary chunks)" : "") << "\n";
        update_state([&outcome](LanTransferState& s) {
            s.status = ServerStatus::CONNECTED;
            s.connected_client = outcome.client;
        });
        send(protocol::encode(outcome.ack));
        return;
    }

    const std::string reason = outcome.ack.message.value_or("Handshake rejected");
    std::cerr << "TransferServer: handshake rejected: " << reason << "\n";
    update_state([&reason](LanTransferState& s) {
        s.status = ServerStatus::ERROR;
        s.connected_client.reset();
        s.last_error = reason;
    });
    send(protocol::encode(outcome.ack));
    close_peer();
}

void TransferServer::on_ping(const protocol::Ping& message) {
    const ServerStatus status = state().status;
    if (status != ServerStatus::CONNECTED && status != ServerStatus::RECEIVING_FILE) return;
    send(protocol::encode(protocol::Pong{true, message.payload}));
}

void TransferServer::on_file_start(const protocol::FileStart& message) {
    auto reject = [this, &message](const std::string& reason) {
        std::cerr << "TransferServer: rejecting transfer " << message.transfer_id << ": " << reason << "\n";
        update_state([&reason](LanTransferState& s) { s.last_error = reason; });
        send(protocol::encode(protocol::FileStartAck{message.transfer_id, false, reason}));
    };

    const ServerStatus status = state().status;
    if (session_ || status == ServerStatus::RECEIVING_FILE) {
        reject("Another transfer is in progress");
        return;
    }
    if (status != ServerStatus::CONNECTED) {
        reject("Not connected");
        return;
    }

    const uint64_t generation = ++transfer_generation_;
    try {
        transfer::FileTransferSession::validate(message, config_.chunk_size, storage_->free_space());
        auto sink = storage_->open(message.transfer_id, message.file_name);

        transfer::FileTransferSession::Listener listener;
        listener.on_drained = [this, generation]() {
            boost::asio::post(io_, [this, generation]() {
                if (generation != transfer_generation_ || !read_paused_ || !socket_.is_open()) return;
                read_paused_ = false;
                do_read();
            });
        };
        listener.on_write_error = [this, generation](const std::string& error) {
            boost::asio::post(io_, [this, generation, error]() {
                if (generation != transfer_generation_ || !session_) return;
                fail_transfer(errors::Code::DISK_ERROR, "Disk write error: " + error);
            });
        };
        session_ = std::make_unique<transfer::FileTransferSession>(
            message, std::move(sink), config_.write_queue_chunks, std::move(listener));
    } catch (const std::exception& e) {
        reject(e.what());
        return;
    }

    std::cout << "TransferServer: receiving " << message.file_name << " (" << message.file_size
              << " bytes, " << message.total_chunks << " chunks)\n";
    auto progress = session_->progress();
    update_state([&progress](LanTransferState& s) {
        s.status = ServerStatus::RECEIVING_FILE;
        s.file_transfer = progress;
        s.completed_file_path.reset();
    });
    last_progress_ = std::chrono::steady_clock::now();
    send(protocol::encode(protocol::FileStartAck{message.transfer_id, true, std::nullopt}));

    watchdog_.expires_after(std::chrono::milliseconds(config_.global_timeout_ms));
    watchdog_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != transfer_generation_ || !session_) return;
        on_watchdog();
    });
}

void TransferServer::on_file_chunk(protocol::FileChunk chunk) {
    if (!session_ || session_->status() != transfer::FileTransferStatus::RECEIVING ||
        chunk.transfer_id != session_->transfer_id()) {
        std::cerr << "TransferServer: ignoring chunk " << chunk.chunk_index << " for unknown transfer "
                  << chunk.transfer_id << "\n";
        return;
    }
    if (session_->add_chunk(chunk.chunk_index, std::move(chunk.data))) {
        auto progress = session_->progress();
        publish_progress(progress.bytes_received >= progress.file_size);
    }
}

void TransferServer::on_file_end(const protocol::FileEnd& message) {
    if (!session_ || message.transfer_id != session_->transfer_id() ||
        session_->status() != transfer::FileTransferStatus::RECEIVING) {
        std::cerr << "TransferServer: ignoring file_end for " << message.transfer_id << "\n";
        return;
    }

    watchdog_.cancel();
    const uint64_t generation = transfer_generation_;
    session_->finish([this, generation](const transfer::Completion& completion) {
        boost::asio::post(io_, [this, generation, completion]() {
            if (generation != transfer_generation_ || !session_) return;
            complete_transfer(completion);
        });
    });
    publish_progress(true);
}

// ─── Transfer lifecycle ─────────────────────────────────────────────────────

void TransferServer::complete_transfer(const transfer::Completion& completion) {
    auto progress = session_->progress();
    const std::string transfer_id = session_->transfer_id();
    session_.reset();
    ++transfer_generation_;
    watchdog_.cancel();

    protocol::FileComplete reply;
    reply.transfer_id = transfer_id;
    reply.success = completion.success;
    reply.received_chunks = completion.received_chunks;
    reply.received_bytes = completion.received_bytes;
    if (completion.success) {
        reply.file_path = completion.file_path;
        std::cout << "TransferServer: transfer " << transfer_id << " complete: " << completion.file_path << "\n";
    } else {
        const errors::Code code = completion.code.value_or(errors::Code::INCOMPLETE_TRANSFER);
        reply.error = completion.error;
        reply.error_code = std::string(errors::wire_code(code));
        std::cerr << "TransferServer: transfer " << transfer_id << " failed (" << errors::wire_code(code)
                  << "): " << completion.error << "\n";
    }

    const bool drop = !completion.success && config_.fail_on_transfer_error;
    update_state([&](LanTransferState& s) {
        if (completion.success) {
            s.status = ServerStatus::CONNECTED;
            s.file_transfer.reset();
            s.completed_file_path = completion.file_path;
        } else {
            s.status = drop ? ServerStatus::ERROR : ServerStatus::CONNECTED;
            s.file_transfer = progress;
            s.last_error = completion.error;
            if (drop) s.connected_client.reset();
        }
    });
    send(protocol::encode(reply));

    if (drop) {
        close_peer();
    } else if (read_paused_ && socket_.is_open()) {
        read_paused_ = false;
        do_read();
    }
}

void TransferServer::fail_transfer(errors::Code code, const std::string& reason) {
    if (!session_) return;
    session_->abort(reason);
    auto progress = session_->progress();

    transfer::Completion completion;
    completion.success = false;
    completion.error = reason;
    completion.code = code;
    completion.received_chunks = progress.chunks_received;
    completion.received_bytes = progress.bytes_received;
    complete_transfer(completion);
}

void TransferServer::on_watchdog() {
    // Already queued when file_end cancelled the timer; finalization owns the outcome
    if (session_->status() != transfer::FileTransferStatus::RECEIVING) return;
    std::cerr << "TransferServer: global transfer timeout exceeded for " << session_->transfer_id() << "\n";
    fail_transfer(errors::Code::TIMEOUT, "Global transfer timeout exceeded");
}

void TransferServer::arm_idle_timer() {
    if (config_.peer_idle_timeout_ms == 0) return;
    const uint64_t generation = peer_generation_;
    idle_timer_.expires_after(std::chrono::milliseconds(config_.peer_idle_timeout_ms));
    idle_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec || generation != peer_generation_) return;
        if (session_) {
            // A transfer in flight is bounded by the watchdog instead
            arm_idle_timer();
            return;
        }
        peer_lost("peer stopped responding");
    });
}

// ─── Connection plumbing ────────────────────────────────────────────────────

bool TransferServer::send(const std::string& line) {
    if (!socket_.is_open()) return false;
    try {
        boost::asio::write(socket_, boost::asio::buffer(line));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "TransferServer: failed to send message: " << e.what() << "\n";
        // Deferred so the caller never sees its peer vanish mid-handler
        const uint64_t generation = peer_generation_;
        boost::asio::post(io_, [this, generation]() {
            if (generation == peer_generation_ && socket_.is_open()) peer_lost("write failed");
        });
        return false;
    }
}

void TransferServer::peer_lost(const std::string& reason) {
    std::cout << "TransferServer: peer disconnected: " << reason << "\n";
    drop_peer(acceptor_.is_open() ? ServerStatus::LISTENING : ServerStatus::IDLE,
              "Transport closed: " + reason);
}

void TransferServer::drop_peer(ServerStatus next, const std::string& reason) {
    std::optional<transfer::FileTransferProgress> failed;
    if (session_) {
        session_->abort(reason);
        failed = session_->progress();
        session_.reset();
        ++transfer_generation_;
    }
    watchdog_.cancel();
    close_peer();
    update_state([&](LanTransferState& s) {
        s.status = next;
        s.connected_client.reset();
        if (failed) s.file_transfer = failed;
        s.last_error = reason;
    });
}

void TransferServer::close_peer() {
    ++peer_generation_;
    idle_timer_.cancel();
    read_paused_ = false;
    handshake_.reset();
    reader_.reset();
    if (socket_.is_open()) {
        boost::system::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
}

void TransferServer::shutdown(ServerStatus next, const std::optional<std::string>& error, bool clear_error) {
    if (session_) {
        session_->abort("Server stopped");
        session_.reset();
        ++transfer_generation_;
    }
    watchdog_.cancel();
    close_peer();
    if (acceptor_.is_open()) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }
    update_state([&](LanTransferState& s) {
        s.status = next;
        s.port.reset();
        s.connected_client.reset();
        s.file_transfer.reset();
        if (clear_error) {
            s.last_error.reset();
        } else if (error) {
            s.last_error = error;
        }
    });
}

void TransferServer::update_state(const std::function<void(LanTransferState&)>& mutate) {
    LanTransferState snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mutate(state_);
        snapshot = state_;
    }
    if (!callbacks_.on_state) return;
    try {
        callbacks_.on_state(snapshot);
    } catch (const std::exception& e) {
        std::cerr << "TransferServer: state callback threw: " << e.what() << "\n";
    }
}

void TransferServer::publish_progress(bool force) {
    if (!session_) return;
    auto now = std::chrono::steady_clock::now();
    if (!force && now - last_progress_ < std::chrono::milliseconds(config_.progress_interval_ms)) return;
    last_progress_ = now;

    auto progress = session_->progress();
    update_state([&progress](LanTransferState& s) { s.file_transfer = progress; });
}

// ─── Local addresses ────────────────────────────────────────────────────────

std::vector<pairing::Candidate> local_candidates() {
    std::string default_route_ip;
    {
        boost::asio::io_context io_context;
        default_route_ip = get_local_ip(io_context);
    }

    std::vector<pairing::Candidate> candidates;
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        std::cerr << "local_candidates: getifaddrs failed\n";
        if (!default_route_ip.empty()) {
            candidates.push_back(pairing::Candidate{default_route_ip, pairing::UNKNOWN_INTERFACE, 100});
        }
        return candidates;
    }

    for (struct ifaddrs* it = interfaces; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) continue;
        if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) continue;

        char buf[INET_ADDRSTRLEN] = {0};
        auto* addr = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
        if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) == nullptr) continue;

        std::string host(buf);
        std::string name(it->ifa_name ? it->ifa_name : pairing::UNKNOWN_INTERFACE);
        if (std::any_of(candidates.begin(), candidates.end(),
                        [&host](const pairing::Candidate& c) { return c.host == host; })) {
            continue;
        }

        int priority = 10;
        if (host == default_route_ip) {
            priority = 100;
        } else if (name.rfind("wl", 0) == 0 || name.rfind("en", 0) == 0 || name.rfind("eth", 0) == 0) {
            priority = 50;
        }
        candidates.push_back(pairing::Candidate{host, name, priority});
    }
    freeifaddrs(interfaces);

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const pairing::Candidate& a, const pairing::Candidate& b) { return a.priority > b.priority; });
    return candidates;
}

pairing::ConnectionInfo make_connection_info(uint16_t port) {
    pairing::ConnectionInfo info;
    info.candidates = local_candidates();
    if (!info.candidates.empty()) {
        info.selected_host = info.candidates.front().host;
    }
    info.port = port;
    info.timestamp = now_epoch_ms();
    return info;
}

} // namespace networking
