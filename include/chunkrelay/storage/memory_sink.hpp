#pragma once

#include "destination_sink.hpp"
#include <vector>

namespace chunkrelay::storage {

// Collects the object in memory, for small files that are parsed afterwards.
class MemorySink : public AppendOnlySink {
public:
    explicit MemorySink(std::string name = "memory://");

    transfer::TransferResult finalize(std::stop_token stop) override;
    void abort() noexcept override;

    std::string address() const override { return name_; }

    bool finalized() const { return finalized_; }
    bool aborted() const { return aborted_; }

    const std::vector<uint8_t>& data() const { return data_; }
    std::string str() const { return std::string(data_.begin(), data_.end()); }

protected:
    void buffer(std::span<const uint8_t> bytes) override;
    transfer::TransferResult flush_ready(std::stop_token stop) override;

private:
    std::string name_;
    std::vector<uint8_t> data_;
    bool finalized_ = false;
    bool aborted_ = false;
};

} // namespace chunkrelay::storage
