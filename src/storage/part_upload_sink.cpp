#include "chunkrelay/storage/part_upload_sink.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>

namespace chunkrelay::storage {

using transfer::TransferResult;

PartUploadSink::PartUploadSink(uint64_t part_size)
    : part_size_(std::max<uint64_t>(part_size, 1))
{
}

void PartUploadSink::buffer(std::span<const uint8_t> bytes) {
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
}

TransferResult PartUploadSink::flush_ready(std::stop_token stop) {
    if (aborted_) {
        return TransferResult::permanent("Write after abort of " + address());
    }

    while (pending_.size() >= part_size_) {
        auto sent = send(static_cast<size_t>(part_size_), false, stop);
        if (!sent) {
            return sent;
        }
    }
    return TransferResult::ok();
}

TransferResult PartUploadSink::finalize(std::stop_token stop) {
    if (completed_) {
        return TransferResult::ok();
    }
    if (aborted_) {
        return TransferResult::permanent("Finalize after abort of " + address());
    }

    auto flushed = flush_ready(stop);
    if (!flushed) {
        return flushed;
    }

    // Stores need at least one part, so an empty object is one empty part.
    if (!last_part_sent_ && (!pending_.empty() || next_part_ == 1)) {
        auto sent = send(pending_.size(), true, stop);
        if (!sent) {
            return sent;
        }
    }

    auto result = complete_upload(stop);
    if (!result) {
        return result;
    }

    completed_ = true;
    LOG_DEBUG("Completed upload of {} bytes to {} in {} part(s)", bytes_accepted(), address(),
              parts_uploaded());
    return TransferResult::ok();
}

void PartUploadSink::abort() noexcept {
    if (completed_ || aborted_) {
        return;
    }
    aborted_ = true;
    pending_.clear();

    if (started_) {
        abort_upload();
    }
}

TransferResult PartUploadSink::ensure_started(std::stop_token stop) {
    if (started_) {
        return TransferResult::ok();
    }

    auto result = begin_upload(stop);
    if (result) {
        started_ = true;
    }
    return result;
}

TransferResult PartUploadSink::send(size_t length, bool last, std::stop_token stop) {
    auto started = ensure_started(stop);
    if (!started) {
        return started;
    }

    std::span<const uint8_t> part(pending_.data(), length);
    auto result = upload_part(next_part_, pending_offset_, part, last, stop);
    if (!result) {
        return result;
    }

    LOG_TRACE("Uploaded part {} ({} bytes at offset {}) to {}", next_part_, length, pending_offset_, address());

    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(length));
    pending_offset_ += length;
    ++next_part_;
    last_part_sent_ = last;
    return TransferResult::ok();
}

} // namespace chunkrelay::storage
