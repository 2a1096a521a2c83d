#include "chunkrelay/transfer/transfer_types.hpp"

namespace chunkrelay::transfer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::RATE_LIMITED: return "rate_limited";
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::PERMANENT: return "permanent";
        case ErrorKind::SIZE_MISMATCH: return "size_mismatch";
        case ErrorKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "idle";
        case TransferState::RUNNING: return "running";
        case TransferState::RETRYING: return "retrying";
        case TransferState::COMPLETED: return "completed";
        case TransferState::FAILED: return "failed";
        case TransferState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string TransferResult::describe() const {
    if (success()) {
        return "ok";
    }

    std::string text = std::string(to_string(kind)) + ": " + message;
    if (offset) {
        text += " (offset " + std::to_string(*offset) + ")";
    }
    if (attempts > 0) {
        text += " after " + std::to_string(attempts) + " attempt(s)";
    }
    return text;
}

TransferResult TransferSpec::validate() const {
    if (chunk_size == 0) {
        return TransferResult::permanent("Chunk size must be greater than zero");
    }

    if (buffer_capacity == 0) {
        return TransferResult::permanent("Buffer capacity must hold at least one chunk");
    }

    return TransferResult::ok();
}

} // namespace chunkrelay::transfer
