#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <fstream>
#include <filesystem>

namespace storage {

// Destination of one transfer. Owned exclusively by its FileTransferSession.
// Failing operations throw errors::Error(DISK_ERROR).
class Sink {
public:
    virtual ~Sink() = default;

    virtual void write_at(uint64_t offset, const uint8_t* data, size_t size) = 0;
    // Returns the number of bytes read, short only at end of file
    virtual size_t read_at(uint64_t offset, uint8_t* out, size_t size) = 0;
    // Flushes, closes and moves the data into place; returns the final path
    virtual std::string finalize() = 0;
    virtual void abort_and_delete() noexcept = 0;
};

class Storage {
public:
    virtual ~Storage() = default;

    // nullopt when the free space cannot be determined
    virtual std::optional<uint64_t> free_space() const = 0;
    virtual std::unique_ptr<Sink> open(const std::string& transfer_id, const std::string& file_name) = 0;
};

// Partial data goes to <temp_dir>/<transfer_id>.part and is renamed to
// <target_dir>/<file_name> on finalize.
class DirectoryStorage : public Storage {
public:
    DirectoryStorage(std::filesystem::path target_dir, std::filesystem::path temp_dir);

    std::optional<uint64_t> free_space() const override;
    std::unique_ptr<Sink> open(const std::string& transfer_id, const std::string& file_name) override;

    const std::filesystem::path& target_dir() const { return target_dir_; }
    const std::filesystem::path& temp_dir() const { return temp_dir_; }

private:
    std::filesystem::path target_dir_;
    std::filesystem::path temp_dir_;
};

class FileSink : public Sink {
public:
    FileSink(std::filesystem::path part_path, std::filesystem::path final_path);
    ~FileSink() override;

    void write_at(uint64_t offset, const uint8_t* data, size_t size) override;
    size_t read_at(uint64_t offset, uint8_t* out, size_t size) override;
    std::string finalize() override;
    void abort_and_delete() noexcept override;

private:
    std::filesystem::path part_path_;
    std::filesystem::path final_path_;
    std::fstream file_;
    bool settled_ = false;
};

// Strips directories and characters unsafe in a file name
std::string safe_file_name(const std::string& name);

} // namespace storage
