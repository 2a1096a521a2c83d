#pragma once

#include "transfer_types.hpp"
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>

namespace chunkrelay::transfer {

// Read-only, reentrant lookup of object metadata, shared between sessions.
class MetadataSource {
public:
    virtual ~MetadataSource() = default;

    // Leaves size empty when the store does not know it up front.
    virtual TransferResult resolve_size(const std::string& object_id,
                                        std::optional<uint64_t>& size,
                                        std::stop_token stop) = 0;
};

// For callers that already know the size, or know that nobody does.
class FixedSizeMetadataSource : public MetadataSource {
public:
    explicit FixedSizeMetadataSource(std::optional<uint64_t> size) : size_(size) {}

    TransferResult resolve_size(const std::string&,
                                std::optional<uint64_t>& size,
                                std::stop_token) override {
        size = size_;
        return TransferResult::ok();
    }

private:
    std::optional<uint64_t> size_;
};

} // namespace chunkrelay::transfer
