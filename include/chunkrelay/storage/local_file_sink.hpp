#pragma once

#include "destination_sink.hpp"
#include <filesystem>
#include <fstream>

namespace chunkrelay::storage {

// Writes into "<path>.part" and renames it over <path> on finalize, so a
// reader never sees a partial file under the final name.
class LocalFileSink : public DestinationSink {
public:
    explicit LocalFileSink(std::filesystem::path path);
    ~LocalFileSink() override;

    transfer::TransferResult write_at(uint64_t offset,
                                      std::span<const uint8_t> bytes,
                                      std::stop_token stop) override;
    transfer::TransferResult finalize(std::stop_token stop) override;
    void abort() noexcept override;

    std::string address() const override { return path_.string(); }
    uint64_t bytes_accepted() const override { return written_; }

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path partial_path() const;

private:
    std::filesystem::path path_;
    std::ofstream file_;
    uint64_t written_ = 0;
    bool finalized_ = false;

    transfer::TransferResult open();
};

} // namespace chunkrelay::storage
