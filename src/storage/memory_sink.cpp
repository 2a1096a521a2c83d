#include "chunkrelay/storage/memory_sink.hpp"

namespace chunkrelay::storage {

using transfer::TransferResult;

MemorySink::MemorySink(std::string name)
    : name_(std::move(name))
{
}

void MemorySink::buffer(std::span<const uint8_t> bytes) {
    data_.insert(data_.end(), bytes.begin(), bytes.end());
}

TransferResult MemorySink::flush_ready(std::stop_token) {
    return TransferResult::ok();
}

TransferResult MemorySink::finalize(std::stop_token) {
    if (aborted_) {
        return TransferResult::permanent("Finalize after abort of " + name_);
    }
    finalized_ = true;
    return TransferResult::ok();
}

void MemorySink::abort() noexcept {
    aborted_ = true;
    data_.clear();
}

} // namespace chunkrelay::storage
