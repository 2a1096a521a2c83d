#pragma once

#include "transfer_types.hpp"
#include <cstdint>
#include <optional>
#include <stop_token>
#include <vector>

namespace chunkrelay::transfer {

struct FetchResponse {
    std::vector<uint8_t> data;

    // Total object size, when the response revealed it.
    std::optional<uint64_t> object_size;

    // The returned range reaches the end of the object.
    bool end_of_object = false;
};

// Reads byte ranges of one remote object. A call at a given offset always
// returns bytes starting exactly at that offset, whatever failed before it.
// Failures are classified and returned; implementations never retry.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual TransferResult fetch(uint64_t offset,
                                 uint64_t length,
                                 FetchResponse& response,
                                 std::stop_token stop) = 0;
};

} // namespace chunkrelay::transfer
