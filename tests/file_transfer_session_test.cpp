/**
 * @file file_transfer_session_test.cpp
 * @brief Tests for file_start validation, chunk placement and verification
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <future>
#include <limits>

#include "test_support.hpp"
#include "transfer.hpp"

using testing_support::MemoryStorage;
using testing_support::make_payload;
using testing_support::make_start;
using testing_support::slice_chunk;
using testing_support::wait_for;

namespace {

constexpr uint64_t CHUNK = 1024;

errors::Code validation_error(const protocol::FileStart& start,
                              uint64_t chunk_size = CHUNK,
                              std::optional<uint64_t> free_space = std::nullopt) {
    try {
        transfer::FileTransferSession::validate(start, chunk_size, free_space);
    } catch (const errors::Error& e) {
        return e.code();
    }
    ADD_FAILURE() << "file_start was accepted";
    return errors::Code::PEER_BUSY;
}

} // namespace

//============================================================================
// validate()
//============================================================================

/**
 * @test 1,200,000 bytes in 512 KiB chunks needs exactly three chunks
 */
TEST(FileStartValidationTest, ChunkCountIsCeiling) {
    const uint64_t chunk = protocol::CHUNK_SIZE;
    auto start = make_start("t1", "backup.zip", make_payload(16), chunk);
    start.file_size = 1200000;
    start.total_chunks = 3;
    EXPECT_NO_THROW(transfer::FileTransferSession::validate(start, chunk, std::nullopt));

    start.total_chunks = 2;
    EXPECT_EQ(validation_error(start, chunk), errors::Code::MALFORMED_MESSAGE);
    start.total_chunks = 4;
    EXPECT_EQ(validation_error(start, chunk), errors::Code::MALFORMED_MESSAGE);
}

TEST(FileStartValidationTest, HugeFileSizeDoesNotWrapChunkCount) {
    auto start = make_start("t1", "backup.zip", make_payload(16), CHUNK);
    start.file_size = std::numeric_limits<uint64_t>::max();
    start.total_chunks = 0;
    EXPECT_EQ(validation_error(start), errors::Code::MALFORMED_MESSAGE);

    EXPECT_EQ(transfer::chunk_count(std::numeric_limits<uint64_t>::max(), CHUNK),
              std::numeric_limits<uint64_t>::max() / CHUNK + 1);
    EXPECT_EQ(transfer::chunk_count(2048, CHUNK), 2u);
    EXPECT_EQ(transfer::chunk_count(2049, CHUNK), 3u);
}

TEST(FileStartValidationTest, ExecutableRejectedRegardlessOfMime) {
    auto start = make_start("t1", "setup.exe", make_payload(100), CHUNK);
    EXPECT_EQ(start.mime_type, "application/zip");
    EXPECT_EQ(validation_error(start), errors::Code::UNSUPPORTED_FILE_TYPE);
}

TEST(FileStartValidationTest, ExtensionCheckIgnoresCase) {
    auto start = make_start("t1", "BACKUP.ZIP", make_payload(100), CHUNK);
    EXPECT_NO_THROW(transfer::FileTransferSession::validate(start, CHUNK, std::nullopt));
}

TEST(FileStartValidationTest, MimeTypeMustBeZip) {
    auto start = make_start("t1", "backup.zip", make_payload(100), CHUNK);
    start.mime_type = "application/x-zip-compressed";
    EXPECT_NO_THROW(transfer::FileTransferSession::validate(start, CHUNK, std::nullopt));
    start.mime_type = "text/plain";
    EXPECT_EQ(validation_error(start), errors::Code::UNSUPPORTED_FILE_TYPE);
}

TEST(FileStartValidationTest, GeometryAndChecksumFormat) {
    auto start = make_start("t1", "backup.zip", make_payload(100), CHUNK);

    auto wrong_chunk = start;
    wrong_chunk.chunk_size = 2048;
    EXPECT_EQ(validation_error(wrong_chunk), errors::Code::MALFORMED_MESSAGE);

    auto empty = start;
    empty.file_size = 0;
    empty.total_chunks = 0;
    EXPECT_EQ(validation_error(empty), errors::Code::MALFORMED_MESSAGE);

    auto bad_sum = start;
    bad_sum.checksum = "abc123";
    EXPECT_EQ(validation_error(bad_sum), errors::Code::MALFORMED_MESSAGE);
}

TEST(FileStartValidationTest, FileTypeCheckedBeforeGeometry) {
    auto start = make_start("t1", "setup.exe", make_payload(100), CHUNK);
    start.chunk_size = 7;
    EXPECT_EQ(validation_error(start), errors::Code::UNSUPPORTED_FILE_TYPE);
}

TEST(FileStartValidationTest, InsufficientStorage) {
    auto start = make_start("t1", "backup.zip", make_payload(100), CHUNK);
    EXPECT_EQ(validation_error(start, CHUNK, 99), errors::Code::INSUFFICIENT_STORAGE);
    EXPECT_NO_THROW(transfer::FileTransferSession::validate(start, CHUNK, 100));
    EXPECT_NO_THROW(transfer::FileTransferSession::validate(start, CHUNK, std::nullopt));
}

//============================================================================
// Receiving
//============================================================================

class FileTransferSessionTest : public ::testing::Test {
protected:
    std::unique_ptr<transfer::FileTransferSession> open(const protocol::FileStart& start,
                                                        size_t queue = 8,
                                                        transfer::FileTransferSession::Listener listener = {}) {
        return std::make_unique<transfer::FileTransferSession>(
            start, storage_.open(start.transfer_id, start.file_name), queue, std::move(listener));
    }

    MemoryStorage storage_;
};

/**
 * @test Chunks arriving as [2,0,1] land at the same offsets as [0,1,2]
 */
TEST_F(FileTransferSessionTest, OutOfOrderChunksMatchInOrder) {
    const auto data = make_payload(2500);

    auto in_order = open(make_start("a", "a.zip", data, CHUNK));
    for (int64_t i : {0, 1, 2}) EXPECT_TRUE(in_order->add_chunk(i, slice_chunk(data, i, CHUNK)));
    auto first = in_order->finish();

    auto shuffled = open(make_start("b", "b.zip", data, CHUNK));
    for (int64_t i : {2, 0, 1}) EXPECT_TRUE(shuffled->add_chunk(i, slice_chunk(data, i, CHUNK)));
    auto second = shuffled->finish();

    ASSERT_TRUE(first.success) << first.error;
    ASSERT_TRUE(second.success) << second.error;
    EXPECT_EQ(storage_.file("a")->snapshot(), data);
    EXPECT_EQ(storage_.file("b")->snapshot(), data);
    EXPECT_TRUE(storage_.file("b")->finalized);
    EXPECT_EQ(second.file_path, "/memory/b.zip");
    EXPECT_EQ(second.received_chunks, 3u);
    EXPECT_EQ(second.received_bytes, 2500u);
    EXPECT_EQ(shuffled->status(), transfer::FileTransferStatus::COMPLETE);
}

TEST_F(FileTransferSessionTest, ResentChunkCountedOnce) {
    const auto data = make_payload(2048);
    auto session = open(make_start("t", "t.zip", data, CHUNK));

    session->add_chunk(0, slice_chunk(data, 0, CHUNK));
    session->add_chunk(0, slice_chunk(data, 0, CHUNK));
    auto progress = session->progress();
    EXPECT_EQ(progress.bytes_received, 1024u);
    EXPECT_EQ(progress.chunks_received, 1u);
    EXPECT_EQ(progress.percentage, 50);

    session->add_chunk(1, slice_chunk(data, 1, CHUNK));
    EXPECT_TRUE(session->finish().success);
}

TEST_F(FileTransferSessionTest, OutOfRangeAndOversizedChunksIgnored) {
    const auto data = make_payload(1500);
    auto session = open(make_start("t", "t.zip", data, CHUNK));

    EXPECT_FALSE(session->add_chunk(-1, slice_chunk(data, 0, CHUNK)));
    EXPECT_FALSE(session->add_chunk(2, slice_chunk(data, 0, CHUNK)));
    // The last chunk holds 476 bytes, a full chunk cannot go there
    EXPECT_FALSE(session->add_chunk(1, slice_chunk(data, 0, CHUNK)));
    EXPECT_EQ(session->progress().bytes_received, 0u);
}

TEST_F(FileTransferSessionTest, MissingChunkIsIncomplete) {
    const auto data = make_payload(3000);
    auto session = open(make_start("t", "t.zip", data, CHUNK));
    session->add_chunk(0, slice_chunk(data, 0, CHUNK));
    session->add_chunk(2, slice_chunk(data, 2, CHUNK));

    auto result = session->finish();
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.code.has_value());
    EXPECT_EQ(*result.code, errors::Code::INCOMPLETE_TRANSFER);
    EXPECT_NE(result.error.find("missing chunks: 1"), std::string::npos) << result.error;
    EXPECT_EQ(result.received_chunks, 2u);
    EXPECT_TRUE(storage_.file("t")->deleted);
    EXPECT_FALSE(storage_.file("t")->finalized);
}

TEST_F(FileTransferSessionTest, ChecksumMismatchDeletesFile) {
    const auto data = make_payload(1500);
    auto start = make_start("t", "t.zip", data, CHUNK);
    start.checksum = std::string(64, '0');
    auto session = open(start);
    session->add_chunk(0, slice_chunk(data, 0, CHUNK));
    session->add_chunk(1, slice_chunk(data, 1, CHUNK));

    auto result = session->finish();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code.value_or(errors::Code::PEER_BUSY), errors::Code::CHECKSUM_MISMATCH);
    EXPECT_TRUE(storage_.file("t")->deleted);
    EXPECT_EQ(session->status(), transfer::FileTransferStatus::ERROR);
    EXPECT_TRUE(session->progress().error.has_value());
}

TEST_F(FileTransferSessionTest, UppercaseChecksumAccepted) {
    const auto data = make_payload(500);
    auto start = make_start("t", "t.zip", data, CHUNK);
    for (auto& c : start.checksum) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto session = open(start);
    session->add_chunk(0, data);
    EXPECT_TRUE(session->finish().success);
}

TEST_F(FileTransferSessionTest, WriteFailureIsDiskError) {
    const auto data = make_payload(1500);
    std::promise<std::string> reported;
    transfer::FileTransferSession::Listener listener;
    listener.on_write_error = [&reported](const std::string& error) { reported.set_value(error); };

    auto start = make_start("t", "t.zip", data, CHUNK);
    auto sink = storage_.open(start.transfer_id, start.file_name);
    storage_.file("t")->fail_writes = true;
    transfer::FileTransferSession session(start, std::move(sink), 8, listener);

    session.add_chunk(0, slice_chunk(data, 0, CHUNK));
    auto error = reported.get_future();
    ASSERT_EQ(error.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NE(error.get().find("simulated write failure"), std::string::npos);

    session.add_chunk(1, slice_chunk(data, 1, CHUNK));
    auto result = session.finish();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code.value_or(errors::Code::PEER_BUSY), errors::Code::DISK_ERROR);
}

TEST_F(FileTransferSessionTest, AbortDeletesAndStopsAcceptingChunks) {
    const auto data = make_payload(3000);
    auto session = open(make_start("t", "t.zip", data, CHUNK));
    session->add_chunk(0, slice_chunk(data, 0, CHUNK));

    session->abort("Global transfer timeout exceeded");
    EXPECT_TRUE(storage_.file("t")->deleted);
    EXPECT_EQ(session->status(), transfer::FileTransferStatus::ERROR);
    EXPECT_EQ(session->progress().error.value_or(""), "Global transfer timeout exceeded");
    EXPECT_FALSE(session->add_chunk(1, slice_chunk(data, 1, CHUNK)));

    auto result = session->finish();
    EXPECT_FALSE(result.success);
}

TEST_F(FileTransferSessionTest, ProgressSnapshot) {
    const auto data = make_payload(3000);
    auto session = open(make_start("t", "backup.zip", data, CHUNK));
    session->add_chunk(0, slice_chunk(data, 0, CHUNK));

    auto p = session->progress();
    EXPECT_EQ(p.transfer_id, "t");
    EXPECT_EQ(p.file_name, "backup.zip");
    EXPECT_EQ(p.file_size, 3000u);
    EXPECT_EQ(p.total_chunks, 3u);
    EXPECT_EQ(p.percentage, 34);  // 1024 / 3000 rounds to 34
    EXPECT_EQ(p.status, transfer::FileTransferStatus::RECEIVING);
    EXPECT_GT(p.start_time, 0);

    nlohmann::json j = p;
    EXPECT_EQ(j["status"], "receiving");
    EXPECT_EQ(j["bytesReceived"], 1024);
}

//============================================================================
// ChunkWriter
//============================================================================

TEST(ChunkWriterTest, SignalsWhenStalledQueueDrains) {
    std::promise<void> gate;
    std::shared_future<void> open_gate = gate.get_future().share();
    std::atomic<int> drained{0};

    transfer::ChunkWriter writer(2, [&drained] { ++drained; });
    writer.push([open_gate] { open_gate.wait(); });
    writer.push([] {});
    EXPECT_TRUE(writer.saturated());
    EXPECT_EQ(drained.load(), 0);

    gate.set_value();
    EXPECT_TRUE(wait_for([&drained] { return drained.load() == 1; }));
    EXPECT_TRUE(wait_for([&writer] { return writer.pending() == 0; }));
    EXPECT_FALSE(writer.saturated());
}

TEST(ChunkWriterTest, RunsJobsInOrder) {
    std::vector<int> order;
    std::mutex mutex;
    transfer::ChunkWriter writer(16, nullptr);
    for (int i = 0; i < 10; ++i) {
        writer.push([i, &order, &mutex] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    ASSERT_TRUE(wait_for([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 10;
    }));
    for (int i = 0; i < 10; ++i) EXPECT_EQ(order[i], i);
}
