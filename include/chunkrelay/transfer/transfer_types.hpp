#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chunkrelay::transfer {

enum class ErrorKind {
    NONE = 0,
    RATE_LIMITED,
    TRANSIENT,
    PERMANENT,
    SIZE_MISMATCH,
    CANCELLED
};

const char* to_string(ErrorKind kind);

struct TransferResult {
    ErrorKind kind;
    std::string message;

    // Server-directed wait, only meaningful for RATE_LIMITED.
    std::optional<std::chrono::milliseconds> retry_after;

    // Byte offset of the operation that failed, when it concerns a chunk.
    std::optional<uint64_t> offset;

    // Attempts made on the failing operation before it was reported.
    uint32_t attempts = 0;

    TransferResult(ErrorKind k = ErrorKind::NONE, std::string msg = "")
        : kind(k), message(std::move(msg)) {}

    static TransferResult ok() { return TransferResult(); }

    static TransferResult rate_limited(std::string msg,
                                       std::optional<std::chrono::milliseconds> hint) {
        TransferResult result(ErrorKind::RATE_LIMITED, std::move(msg));
        result.retry_after = hint;
        return result;
    }

    static TransferResult transient(std::string msg) {
        return TransferResult(ErrorKind::TRANSIENT, std::move(msg));
    }

    static TransferResult permanent(std::string msg) {
        return TransferResult(ErrorKind::PERMANENT, std::move(msg));
    }

    static TransferResult cancelled(std::string msg = "Transfer cancelled") {
        return TransferResult(ErrorKind::CANCELLED, std::move(msg));
    }

    bool success() const { return kind == ErrorKind::NONE; }
    operator bool() const { return success(); }

    bool is_recoverable() const {
        return kind == ErrorKind::RATE_LIMITED || kind == ErrorKind::TRANSIENT;
    }

    std::string describe() const;
};

enum class TransferState {
    IDLE,
    RUNNING,
    RETRYING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(TransferState state);

inline bool is_terminal(TransferState state) {
    return state == TransferState::COMPLETED ||
           state == TransferState::FAILED ||
           state == TransferState::CANCELLED;
}

struct Chunk {
    uint64_t offset = 0;
    std::vector<uint8_t> data;
    bool is_final = false;

    uint64_t end_offset() const { return offset + data.size(); }
};

struct TransferSpec {
    std::string object_id;
    std::string source_url;

    // Unknown until resolved by the metadata source or the first response.
    std::optional<uint64_t> total_size;

    uint64_t chunk_size = 1024 * 1024;
    uint32_t buffer_capacity = 8; // in chunks

    std::string destination;

    // Lowercase hex BLAKE2b-256 digest the written bytes must match, when known.
    std::optional<std::string> expected_digest;

    TransferResult validate() const;

    uint64_t max_buffered_bytes() const { return chunk_size * buffer_capacity; }
};

} // namespace chunkrelay::transfer
