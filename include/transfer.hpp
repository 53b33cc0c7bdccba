#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <optional>
#include <memory>
#include <map>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>
#include "protocol/messages.hpp"
#include "storage.hpp"
#include "errors.hpp"

namespace transfer {

enum class FileTransferStatus {
    IDLE,
    RECEIVING,
    COMPLETING,
    COMPLETE,
    ERROR
};

const char* to_string(FileTransferStatus status);

struct FileTransferProgress {
    std::string transfer_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t bytes_received = 0;
    int percentage = 0;
    uint64_t chunks_received = 0;
    uint64_t total_chunks = 0;
    FileTransferStatus status = FileTransferStatus::IDLE;
    std::optional<std::string> error;
    int64_t start_time = 0; // epoch milliseconds
    std::optional<int64_t> elapsed_ms;
    std::optional<int64_t> estimated_remaining_ms;
};

void to_json(nlohmann::json& j, const FileTransferProgress& progress);

// Number of chunk_size slices needed for file_size bytes; safe up to UINT64_MAX
uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size);

struct Completion {
    bool success = false;
    std::string file_path;
    std::string error;
    std::optional<errors::Code> code;
    uint64_t received_chunks = 0;
    uint64_t received_bytes = 0;
};

// Runs queued jobs in order on one worker thread. push() never blocks;
// callers poll saturated() and wait for on_drained before reading more.
class ChunkWriter {
public:
    using Job = std::function<void()>;

    ChunkWriter(size_t capacity, std::function<void()> on_drained);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    void push(Job job);
    // Marks the writer stalled when at capacity so on_drained fires later
    bool saturated();
    size_t pending() const;
    // Discards pending jobs and joins the worker
    void cancel();

private:
    void run();

    size_t capacity_;
    std::function<void()> on_drained_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> jobs_;
    size_t in_flight_ = 0;
    bool stopping_ = false;
    bool stalled_ = false;
    std::thread thread_;
};

// Owns one file transfer from an accepted file_start to its completion.
class FileTransferSession {
public:
    struct Listener {
        std::function<void()> on_drained;                        // writer thread
        std::function<void(const std::string&)> on_write_error;  // writer thread
    };

    // Checks, in order: extension, MIME type, chunk geometry, checksum
    // format, free space. Throws errors::Error naming the first failure.
    static void validate(const protocol::FileStart& start,
                         uint64_t chunk_size,
                         std::optional<uint64_t> free_space);

    FileTransferSession(const protocol::FileStart& start,
                        std::unique_ptr<storage::Sink> sink,
                        size_t queue_capacity,
                        Listener listener = {});
    ~FileTransferSession();

    FileTransferSession(const FileTransferSession&) = delete;
    FileTransferSession& operator=(const FileTransferSession&) = delete;

    const std::string& transfer_id() const { return start_.transfer_id; }
    FileTransferStatus status() const { return status_; }

    // Queues a positional write. Returns false if the chunk was ignored.
    bool add_chunk(int64_t index, std::vector<uint8_t> data);

    bool backlogged() { return writer_.saturated(); }

    // Verifies and moves the file into place once every queued write has
    // landed. `done` runs on the writer thread.
    void finish(std::function<void(const Completion&)> done);
    Completion finish();

    // Stops writing and deletes the partial file
    void abort(const std::string& reason);

    FileTransferProgress progress() const;

private:
    Completion finalize(uint64_t bytes_received, uint64_t chunks_received);
    Completion fail(errors::Code code, const std::string& message,
                    uint64_t bytes_received, uint64_t chunks_received);
    uint64_t expected_length(uint64_t index) const;

    protocol::FileStart start_;
    std::unique_ptr<storage::Sink> sink_;
    Listener listener_;

    std::map<uint64_t, uint64_t> received_; // chunk index -> bytes
    uint64_t bytes_received_ = 0;

    std::atomic<FileTransferStatus> status_{FileTransferStatus::RECEIVING};
    std::atomic<bool> write_failed_{false};
    std::atomic<bool> settled_{false};
    mutable std::mutex error_mutex_;
    std::string error_;

    int64_t start_time_ms_;
    std::chrono::steady_clock::time_point started_;

    ChunkWriter writer_; // declared last: joined before the sink goes away
};

} // namespace transfer
