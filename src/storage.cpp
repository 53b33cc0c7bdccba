#include "storage.hpp"
#include "errors.hpp"
#include <iostream>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace storage {

namespace {

errors::Error disk_error(const std::string& what, const fs::path& path) {
    return errors::Error(errors::Code::DISK_ERROR, what + ": " + path.string());
}

} // namespace

std::string safe_file_name(const std::string& name) {
    std::string base = fs::path(name).filename().string();
    std::string out;
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || c == '/' || c == '\\' || c == ':') {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    if (out.empty() || out == "." || out == "..") {
        out = "received.bin";
    }
    return out;
}

// ─── DirectoryStorage ───────────────────────────────────────────────────────

DirectoryStorage::DirectoryStorage(fs::path target_dir, fs::path temp_dir)
    : target_dir_(std::move(target_dir)), temp_dir_(std::move(temp_dir)) {}

std::optional<uint64_t> DirectoryStorage::free_space() const {
    std::error_code ec;
    fs::create_directories(target_dir_, ec);

    struct statvfs disk_stat;
    if (statvfs(target_dir_.c_str(), &disk_stat) == 0) {
        return static_cast<uint64_t>(disk_stat.f_bavail) * disk_stat.f_frsize;
    }
    return std::nullopt;
}

std::unique_ptr<Sink> DirectoryStorage::open(const std::string& transfer_id, const std::string& file_name) {
    std::error_code ec;
    fs::create_directories(target_dir_, ec);
    if (ec) throw disk_error("Storage unavailable", target_dir_);
    fs::create_directories(temp_dir_, ec);
    if (ec) throw disk_error("Storage unavailable", temp_dir_);

    fs::path part = temp_dir_ / (safe_file_name(transfer_id) + ".part");
    fs::path target = target_dir_ / safe_file_name(file_name);
    return std::make_unique<FileSink>(part, target);
}

// ─── FileSink ───────────────────────────────────────────────────────────────

FileSink::FileSink(fs::path part_path, fs::path final_path)
    : part_path_(std::move(part_path)), final_path_(std::move(final_path)) {
    // Truncate any leftover from an earlier attempt with the same id
    file_.open(part_path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        throw disk_error("Could not open file for writing", part_path_);
    }
}

FileSink::~FileSink() {
    if (!settled_) {
        abort_and_delete();
    }
}

void FileSink::write_at(uint64_t offset, const uint8_t* data, size_t size) {
    file_.clear();
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file_) {
        throw disk_error("Write failed", part_path_);
    }
}

size_t FileSink::read_at(uint64_t offset, uint8_t* out, size_t size) {
    file_.flush();
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
    if (file_.bad()) {
        throw disk_error("Read failed", part_path_);
    }
    return static_cast<size_t>(file_.gcount());
}

std::string FileSink::finalize() {
    file_.clear();
    file_.flush();
    if (!file_) {
        throw disk_error("Flush failed", part_path_);
    }
    file_.close();

    std::error_code ec;
    fs::remove(final_path_, ec);
    fs::rename(part_path_, final_path_, ec);
    if (ec) {
        throw disk_error("Failed to move file into place (" + ec.message() + ")", final_path_);
    }
    settled_ = true;
    return final_path_.string();
}

void FileSink::abort_and_delete() noexcept {
    if (file_.is_open()) {
        file_.close();
    }
    std::error_code ec;
    fs::remove(part_path_, ec);
    if (ec) {
        std::cerr << "FileSink: failed to delete " << part_path_ << ": " << ec.message() << "\n";
    }
    settled_ = true;
}

} // namespace storage
