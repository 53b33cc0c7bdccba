/**
 * @file storage_test.cpp
 * @brief Tests for the on-disk partial file and its final rename
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>

#include "errors.hpp"
#include "storage.hpp"

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

class DirectoryStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "lanbridge_storage_test";
        std::error_code ec;
        fs::remove_all(root_, ec);
        storage_ = std::make_unique<storage::DirectoryStorage>(root_ / "received", root_ / "received" / ".partial");
    }

    void TearDown() override {
        storage_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::unique_ptr<storage::DirectoryStorage> storage_;
};

TEST_F(DirectoryStorageTest, PositionalWritesThenRename) {
    auto sink = storage_->open("tx-1", "backup.zip");
    const fs::path part = root_ / "received" / ".partial" / "tx-1.part";
    EXPECT_TRUE(fs::exists(part));

    const std::string tail = "world";
    const std::string head = "hello ";
    sink->write_at(6, reinterpret_cast<const uint8_t*>(tail.data()), tail.size());
    sink->write_at(0, reinterpret_cast<const uint8_t*>(head.data()), head.size());

    uint8_t buf[16] = {0};
    EXPECT_EQ(sink->read_at(0, buf, sizeof(buf)), 11u);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buf), 11), "hello world");

    const std::string final_path = sink->finalize();
    EXPECT_EQ(fs::path(final_path), root_ / "received" / "backup.zip");
    EXPECT_FALSE(fs::exists(part));
    EXPECT_EQ(read_file(final_path), "hello world");
}

TEST_F(DirectoryStorageTest, FinalizeReplacesExistingFile) {
    fs::create_directories(root_ / "received");
    {
        std::ofstream out(root_ / "received" / "backup.zip", std::ios::binary);
        out << "old contents that are longer";
    }

    auto sink = storage_->open("tx-2", "backup.zip");
    const std::string data = "new";
    sink->write_at(0, reinterpret_cast<const uint8_t*>(data.data()), data.size());
    sink->finalize();

    EXPECT_EQ(read_file(root_ / "received" / "backup.zip"), "new");
}

TEST_F(DirectoryStorageTest, AbortDeletesPartialFile) {
    auto sink = storage_->open("tx-3", "backup.zip");
    const fs::path part = root_ / "received" / ".partial" / "tx-3.part";
    ASSERT_TRUE(fs::exists(part));

    sink->abort_and_delete();
    EXPECT_FALSE(fs::exists(part));
    EXPECT_FALSE(fs::exists(root_ / "received" / "backup.zip"));
}

TEST_F(DirectoryStorageTest, DroppedSinkCleansUp) {
    const fs::path part = root_ / "received" / ".partial" / "tx-4.part";
    {
        auto sink = storage_->open("tx-4", "backup.zip");
        ASSERT_TRUE(fs::exists(part));
    }
    EXPECT_FALSE(fs::exists(part));
}

TEST_F(DirectoryStorageTest, ReportsFreeSpace) {
    auto free = storage_->free_space();
    ASSERT_TRUE(free.has_value());
    EXPECT_GT(*free, 0u);
}

TEST(SafeFileNameTest, StripsDirectories) {
    EXPECT_EQ(storage::safe_file_name("../../etc/passwd.zip"), "passwd.zip");
    EXPECT_EQ(storage::safe_file_name("dir/sub/backup.zip"), "backup.zip");
    EXPECT_EQ(storage::safe_file_name(".."), "received.bin");
    EXPECT_EQ(storage::safe_file_name(""), "received.bin");
}
