#include "chunkrelay/storage/destination_sink.hpp"

namespace chunkrelay::storage {

using transfer::TransferResult;

TransferResult AppendOnlySink::write_at(uint64_t offset,
                                        std::span<const uint8_t> bytes,
                                        std::stop_token stop) {
    if (offset > accepted_) {
        return TransferResult::permanent(
            "Write at offset " + std::to_string(offset) + " leaves a gap after " +
            std::to_string(accepted_) + " accepted bytes");
    }

    uint64_t end = offset + bytes.size();
    if (end > accepted_) {
        // Only the part not seen before is new.
        auto fresh = bytes.subspan(static_cast<size_t>(accepted_ - offset));
        buffer(fresh);
        accepted_ = end;
    }

    return flush_ready(stop);
}

} // namespace chunkrelay::storage
