#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <thread>
#include <atomic>
#include <mutex>
#include <memory>
#include <optional>
#include <vector>
#include <chrono>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "pairing.hpp"
#include "storage.hpp"
#include "transfer.hpp"
#include "protocol/handshake.hpp"
#include "protocol/message_codec.hpp"

namespace networking {

enum class ServerStatus {
    IDLE,
    STARTING,
    LISTENING,
    HANDSHAKING,
    CONNECTED,
    RECEIVING_FILE,
    ERROR
};

const char* to_string(ServerStatus status);

struct LanTransferState {
    ServerStatus status = ServerStatus::IDLE;
    std::optional<uint16_t> port;
    std::optional<protocol::ClientInfo> connected_client;
    std::optional<std::string> last_error;
    std::optional<transfer::FileTransferProgress> file_transfer;
    std::optional<std::string> completed_file_path;
};

void to_json(nlohmann::json& j, const LanTransferState& state);

// Progress callback: filename, bytes_transferred, bytes_total, speed_mbps
using ProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t, double)>;
using StatusCallback = std::function<void(const std::string&)>;

struct ServerCallbacks {
    // Invoked on the server's I/O thread with a copy of the new state
    std::function<void(const LanTransferState&)> on_state;
};

struct ClientCallbacks {
    StatusCallback on_status;
    ProgressCallback on_progress;
};

// Accepts one peer at a time and drives it through handshake and file
// transfers. All protocol work happens on a private I/O thread; the public
// methods may be called from any thread, including from on_state.
class TransferServer {
public:
    TransferServer(config::ServerConfig config,
                   std::shared_ptr<storage::Storage> storage,
                   ServerCallbacks callbacks = {});
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Opens the listening socket; from ERROR this restarts the server
    void start();
    // Closes everything and discards in-flight data; state becomes IDLE
    void stop();

    LanTransferState state() const;
    void clear_completed_file();

private:
    using tcp = boost::asio::ip::tcp;

    template <typename Fn>
    void run_on_io(Fn fn);

    void do_start();
    void do_accept();
    void adopt_peer(tcp::socket peer);
    void reject_peer(tcp::socket peer);
    void do_read();
    void process_frames();
    void dispatch(protocol::Request request);

    void on_handshake(const protocol::Handshake& message);
    void on_ping(const protocol::Ping& message);
    void on_file_start(const protocol::FileStart& message);
    void on_file_chunk(protocol::FileChunk chunk);
    void on_file_end(const protocol::FileEnd& message);

    void note_malformed(const std::string& reason);
    void complete_transfer(const transfer::Completion& completion);
    void fail_transfer(errors::Code code, const std::string& reason);
    void on_watchdog();
    void arm_idle_timer();

    bool send(const std::string& line);
    void peer_lost(const std::string& reason);
    void drop_peer(ServerStatus next, const std::string& reason);
    void close_peer();
    void shutdown(ServerStatus next, const std::optional<std::string>& error, bool clear_error);

    void update_state(const std::function<void(LanTransferState&)>& mutate);
    void publish_progress(bool force);
    bool peer_active() const;

    config::ServerConfig config_;
    std::shared_ptr<storage::Storage> storage_;
    ServerCallbacks callbacks_;

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    tcp::acceptor acceptor_;
    tcp::socket socket_;
    boost::asio::steady_timer watchdog_;
    boost::asio::steady_timer idle_timer_;
    std::vector<uint8_t> read_buf_;

    protocol::FrameReader reader_;
    std::unique_ptr<protocol::HandshakeProtocol> handshake_;
    std::unique_ptr<transfer::FileTransferSession> session_;
    size_t malformed_count_ = 0;
    bool read_paused_ = false;
    uint64_t peer_generation_ = 0;
    uint64_t transfer_generation_ = 0;
    std::chrono::steady_clock::time_point last_progress_;

    mutable std::mutex state_mutex_;
    LanTransferState state_;

    std::thread io_thread_;
};

// Desktop side of the protocol: pushes one file and waits for file_complete.
// Throws errors::Error when the receiver rejects or fails the transfer.
class Client {
public:
    explicit Client(std::string device_name = "lanbridge", bool binary_chunks = false);

    // Returns the path the receiver stored the file under
    std::string send_file(const std::string& host, uint16_t port, const std::string& filepath,
                          ClientCallbacks callbacks = {});

private:
    std::string device_name_;
    bool binary_chunks_;
};

// IPv4 addresses of this host, best candidate first; loopback excluded
std::vector<pairing::Candidate> local_candidates();

pairing::ConnectionInfo make_connection_info(uint16_t port);

} // namespace networking
