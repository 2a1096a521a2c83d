#include "chunkrelay/storage/local_file_sink.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>
#include <system_error>

namespace chunkrelay::storage {

using transfer::TransferResult;

LocalFileSink::LocalFileSink(std::filesystem::path path)
    : path_(std::move(path))
{
}

LocalFileSink::~LocalFileSink() {
    if (!finalized_ && file_.is_open()) {
        abort();
    }
}

std::filesystem::path LocalFileSink::partial_path() const {
    auto partial = path_;
    partial += ".part";
    return partial;
}

TransferResult LocalFileSink::open() {
    if (file_.is_open()) {
        return TransferResult::ok();
    }

    if (path_.empty()) {
        return TransferResult::permanent("Empty destination path");
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return TransferResult::permanent("Cannot create " + path_.parent_path().string() + ": " +
                                             ec.message());
        }
    }

    file_.open(partial_path(), std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file_) {
        return TransferResult::transient("Cannot open " + partial_path().string() + " for writing");
    }

    LOG_DEBUG("Writing to {}", partial_path().string());
    return TransferResult::ok();
}

TransferResult LocalFileSink::write_at(uint64_t offset, std::span<const uint8_t> bytes, std::stop_token) {
    if (finalized_) {
        return TransferResult::permanent("Write after finalize to " + address());
    }

    if (offset > written_) {
        return TransferResult::permanent("Write at offset " + std::to_string(offset) +
                                         " leaves a gap after " + std::to_string(written_) + " bytes");
    }

    auto opened = open();
    if (!opened) {
        return opened;
    }

    // Rewriting an accepted range is harmless: the same bytes land in the same place.
    file_.clear();
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file_.flush();

    if (!file_) {
        file_.clear();
        return TransferResult::transient("Write of " + std::to_string(bytes.size()) + " bytes at offset " +
                                         std::to_string(offset) + " to " + partial_path().string() +
                                         " failed");
    }

    written_ = std::max<uint64_t>(written_, offset + bytes.size());
    return TransferResult::ok();
}

TransferResult LocalFileSink::finalize(std::stop_token) {
    if (finalized_) {
        return TransferResult::ok();
    }

    // Zero-byte objects still produce a file.
    auto opened = open();
    if (!opened) {
        return opened;
    }

    file_.flush();
    file_.close();
    if (file_.fail()) {
        file_.clear();
        return TransferResult::transient("Closing " + partial_path().string() + " failed");
    }

    std::error_code ec;
    std::filesystem::rename(partial_path(), path_, ec);
    if (ec) {
        return TransferResult::transient("Renaming " + partial_path().string() + " failed: " + ec.message());
    }

    finalized_ = true;
    LOG_DEBUG("Finalized {} ({} bytes)", path_.string(), written_);
    return TransferResult::ok();
}

void LocalFileSink::abort() noexcept {
    if (finalized_) {
        return;
    }

    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    if (std::filesystem::remove(partial_path(), ec)) {
        LOG_DEBUG("Removed partial file {}", partial_path().string());
    } else if (ec) {
        LOG_WARN("Could not remove partial file {}: {}", partial_path().string(), ec.message());
    }
}

} // namespace chunkrelay::storage
