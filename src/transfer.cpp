#include "transfer.hpp"
#include "protocol/constants.hpp"
#include "security.hpp"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <future>
#include <cmath>
#include <cctype>

namespace transfer {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <size_t N>
bool contains(const std::array<const char*, N>& list, const std::string& value) {
    return std::any_of(list.begin(), list.end(), [&](const char* item) { return value == item; });
}

} // namespace

const char* to_string(FileTransferStatus status) {
    switch (status) {
        case FileTransferStatus::IDLE:       return "idle";
        case FileTransferStatus::RECEIVING:  return "receiving";
        case FileTransferStatus::COMPLETING: return "completing";
        case FileTransferStatus::COMPLETE:   return "complete";
        case FileTransferStatus::ERROR:      return "error";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const FileTransferProgress& p) {
    j = nlohmann::json{
        {"transferId", p.transfer_id},
        {"fileName", p.file_name},
        {"fileSize", p.file_size},
        {"bytesReceived", p.bytes_received},
        {"percentage", p.percentage},
        {"chunksReceived", p.chunks_received},
        {"totalChunks", p.total_chunks},
        {"status", to_string(p.status)},
        {"startTime", p.start_time}
    };
    if (p.error) j["error"] = *p.error;
    if (p.elapsed_ms) j["elapsedMs"] = *p.elapsed_ms;
    if (p.estimated_remaining_ms) j["estimatedRemainingMs"] = *p.estimated_remaining_ms;
}

// ─── ChunkWriter ────────────────────────────────────────────────────────────

ChunkWriter::ChunkWriter(size_t capacity, std::function<void()> on_drained)
    : capacity_(std::max<size_t>(1, capacity)),
      on_drained_(std::move(on_drained)),
      thread_(&ChunkWriter::run, this) {}

ChunkWriter::~ChunkWriter() {
    cancel();
}

void ChunkWriter::push(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
}

bool ChunkWriter::saturated() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.size() + in_flight_ >= capacity_) {
        stalled_ = true;
        return true;
    }
    return false;
}

size_t ChunkWriter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size() + in_flight_;
}

void ChunkWriter::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        jobs_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void ChunkWriter::run() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++in_flight_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            std::cerr << "ChunkWriter Exception: " << e.what() << "\n";
        }

        bool drained = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --in_flight_;
            if (stalled_ && jobs_.size() + in_flight_ < capacity_) {
                stalled_ = false;
                drained = true;
            }
        }
        if (drained && on_drained_) on_drained_();
    }
}

uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size) {
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

// ─── FileTransferSession ────────────────────────────────────────────────────

void FileTransferSession::validate(const protocol::FileStart& start,
                                   uint64_t chunk_size,
                                   std::optional<uint64_t> free_space) {
    using errors::Code;

    const std::string ext = lowercase(std::filesystem::path(start.file_name).extension().string());
    if (!contains(protocol::ALLOWED_EXTENSIONS, ext)) {
        throw errors::Error(Code::UNSUPPORTED_FILE_TYPE,
                            "File type " + (ext.empty() ? std::string("(none)") : ext) + " not allowed");
    }
    if (!contains(protocol::ALLOWED_MIME_TYPES, start.mime_type)) {
        throw errors::Error(Code::UNSUPPORTED_FILE_TYPE, "MIME type " + start.mime_type + " not allowed");
    }

    if (start.file_size == 0) {
        throw errors::Error(Code::MALFORMED_MESSAGE, "Empty files are not accepted");
    }
    if (start.chunk_size != chunk_size) {
        throw errors::Error(Code::MALFORMED_MESSAGE,
                            "Chunk size " + std::to_string(start.chunk_size) +
                            " does not match required " + std::to_string(chunk_size));
    }
    const uint64_t expected_chunks = chunk_count(start.file_size, chunk_size);
    if (start.total_chunks != expected_chunks) {
        throw errors::Error(Code::MALFORMED_MESSAGE,
                            "File size " + std::to_string(start.file_size) + " inconsistent with " +
                            std::to_string(start.total_chunks) + " chunks of " +
                            std::to_string(chunk_size) + " bytes");
    }
    if (!security::is_sha256_hex(start.checksum)) {
        throw errors::Error(Code::MALFORMED_MESSAGE, "Invalid checksum format (expected 64 hex characters)");
    }

    if (free_space && *free_space < start.file_size) {
        throw errors::Error(Code::INSUFFICIENT_STORAGE,
                            "Insufficient storage: need " + std::to_string(start.file_size) +
                            " bytes, " + std::to_string(*free_space) + " available");
    }
}

FileTransferSession::FileTransferSession(const protocol::FileStart& start,
                                         std::unique_ptr<storage::Sink> sink,
                                         size_t queue_capacity,
                                         Listener listener)
    : start_(start),
      sink_(std::move(sink)),
      listener_(std::move(listener)),
      start_time_ms_(now_epoch_ms()),
      started_(std::chrono::steady_clock::now()),
      writer_(queue_capacity, listener_.on_drained) {}

FileTransferSession::~FileTransferSession() {
    writer_.cancel();
    if (!settled_) {
        sink_->abort_and_delete();
    }
}

uint64_t FileTransferSession::expected_length(uint64_t index) const {
    const uint64_t offset = index * start_.chunk_size;
    return std::min(start_.chunk_size, start_.file_size - offset);
}

bool FileTransferSession::add_chunk(int64_t index, std::vector<uint8_t> data) {
    if (status_ != FileTransferStatus::RECEIVING) {
        return false;
    }
    if (index < 0 || static_cast<uint64_t>(index) >= start_.total_chunks) {
        std::cerr << "FileTransferSession: ignoring chunk " << index << " outside [0, "
                  << start_.total_chunks << ") for " << start_.transfer_id << "\n";
        return false;
    }

    const uint64_t idx = static_cast<uint64_t>(index);
    if (data.size() > expected_length(idx)) {
        std::cerr << "FileTransferSession: ignoring oversized chunk " << idx << " ("
                  << data.size() << " bytes)\n";
        return false;
    }

    // A resent chunk overwrites the same range; count its bytes once
    auto it = received_.find(idx);
    if (it != received_.end()) {
        bytes_received_ -= it->second;
        it->second = data.size();
    } else {
        received_.emplace(idx, data.size());
    }
    bytes_received_ += data.size();

    const uint64_t offset = idx * start_.chunk_size;
    writer_.push([this, offset, data = std::move(data)] {
        if (write_failed_) return;
        try {
            sink_->write_at(offset, data.data(), data.size());
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(error_mutex_);
                error_ = e.what();
            }
            write_failed_ = true;
            if (listener_.on_write_error) listener_.on_write_error(e.what());
        }
    });
    return true;
}

void FileTransferSession::finish(std::function<void(const Completion&)> done) {
    FileTransferStatus expected = FileTransferStatus::RECEIVING;
    if (!status_.compare_exchange_strong(expected, FileTransferStatus::COMPLETING)) {
        Completion c;
        c.error = "Transfer is no longer receiving";
        c.code = errors::Code::INCOMPLETE_TRANSFER;
        if (done) done(c);
        return;
    }

    // Queued behind every pending write, so the file is whole when it runs
    const uint64_t bytes = bytes_received_;
    const uint64_t chunks = received_.size();
    writer_.push([this, bytes, chunks, done = std::move(done)] {
        Completion c = finalize(bytes, chunks);
        if (done) done(c);
    });
}

Completion FileTransferSession::finish() {
    std::promise<Completion> promise;
    auto future = promise.get_future();
    finish([&promise](const Completion& c) { promise.set_value(c); });
    return future.get();
}

Completion FileTransferSession::finalize(uint64_t bytes_received, uint64_t chunks_received) {
    if (write_failed_) {
        std::string message;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            message = error_;
        }
        return fail(errors::Code::DISK_ERROR, "Disk write error: " + message, bytes_received, chunks_received);
    }

    if (bytes_received != start_.file_size) {
        std::string missing;
        size_t listed = 0;
        for (uint64_t i = 0; i < start_.total_chunks && listed < 10; ++i) {
            if (received_.count(i) == 0) {
                missing += (listed++ ? ", " : "") + std::to_string(i);
            }
        }
        std::string message = "Received " + std::to_string(bytes_received) + " of " +
                              std::to_string(start_.file_size) + " bytes";
        if (!missing.empty()) message += "; missing chunks: " + missing;
        return fail(errors::Code::INCOMPLETE_TRANSFER, message, bytes_received, chunks_received);
    }

    std::string actual;
    try {
        security::Sha256 hasher;
        std::vector<uint8_t> block(static_cast<size_t>(start_.chunk_size));
        uint64_t offset = 0;
        while (offset < start_.file_size) {
            const size_t want = static_cast<size_t>(std::min<uint64_t>(block.size(), start_.file_size - offset));
            const size_t got = sink_->read_at(offset, block.data(), want);
            if (got == 0) {
                throw errors::Error(errors::Code::DISK_ERROR, "Unexpected end of received file");
            }
            hasher.update(block.data(), got);
            offset += got;
        }
        actual = hasher.final_hex();
    } catch (const std::exception& e) {
        return fail(errors::Code::DISK_ERROR, e.what(), bytes_received, chunks_received);
    }

    if (!security::digest_equals(actual, start_.checksum)) {
        return fail(errors::Code::CHECKSUM_MISMATCH,
                    "Checksum mismatch: expected " + start_.checksum + ", got " + actual,
                    bytes_received, chunks_received);
    }

    Completion c;
    try {
        c.file_path = sink_->finalize();
    } catch (const std::exception& e) {
        return fail(errors::Code::DISK_ERROR, e.what(), bytes_received, chunks_received);
    }
    settled_ = true;
    status_ = FileTransferStatus::COMPLETE;

    c.success = true;
    c.received_bytes = bytes_received;
    c.received_chunks = chunks_received;
    return c;
}

Completion FileTransferSession::fail(errors::Code code, const std::string& message,
                                     uint64_t bytes_received, uint64_t chunks_received) {
    sink_->abort_and_delete();
    settled_ = true;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = message;
    }
    status_ = FileTransferStatus::ERROR;

    Completion c;
    c.success = false;
    c.error = message;
    c.code = code;
    c.received_bytes = bytes_received;
    c.received_chunks = chunks_received;
    return c;
}

void FileTransferSession::abort(const std::string& reason) {
    writer_.cancel();
    if (!settled_) {
        sink_->abort_and_delete();
        settled_ = true;
    }
    if (status_ != FileTransferStatus::COMPLETE) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = reason;
        status_ = FileTransferStatus::ERROR;
    }
}

FileTransferProgress FileTransferSession::progress() const {
    FileTransferProgress p;
    p.transfer_id = start_.transfer_id;
    p.file_name = start_.file_name;
    p.file_size = start_.file_size;
    p.bytes_received = std::min(bytes_received_, start_.file_size);
    p.chunks_received = received_.size();
    p.total_chunks = start_.total_chunks;
    p.status = status_;
    p.start_time = start_time_ms_;

    const int64_t elapsed = std::max<int64_t>(1, std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_).count());
    p.elapsed_ms = elapsed;

    if (p.file_size > 0) {
        const double pct = std::round(static_cast<double>(p.bytes_received) * 100.0 / p.file_size);
        p.percentage = static_cast<int>(std::clamp(pct, 0.0, 100.0));
    }

    const double bytes_per_ms = static_cast<double>(p.bytes_received) / elapsed;
    if (bytes_per_ms > 0) {
        p.estimated_remaining_ms = static_cast<int64_t>(std::round((p.file_size - p.bytes_received) / bytes_per_ms));
    }

    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!error_.empty()) p.error = error_;
    return p;
}

} // namespace transfer
