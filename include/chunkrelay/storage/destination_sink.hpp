#pragma once

#include "../transfer/transfer_types.hpp"
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>

namespace chunkrelay::storage {

// Somewhere to durably write the bytes of one object.
//
// Writes arrive in strictly increasing, contiguous offset order. Repeating a
// write for a range that was already accepted is a no-op apart from retrying
// whatever work is still pending, so a failed write can simply be retried.
// A write that leaves a gap is a permanent error.
class DestinationSink {
public:
    virtual ~DestinationSink() = default;

    virtual transfer::TransferResult write_at(uint64_t offset,
                                              std::span<const uint8_t> bytes,
                                              std::stop_token stop) = 0;

    // Flushes and commits. Safe to call again after a failure.
    virtual transfer::TransferResult finalize(std::stop_token stop) = 0;

    // Best-effort cleanup of partial output after failure or cancellation.
    virtual void abort() noexcept = 0;

    virtual std::string address() const = 0;

    // Bytes accepted so far.
    virtual uint64_t bytes_accepted() const = 0;
};

// Offset bookkeeping shared by the sinks that can only append.
class AppendOnlySink : public DestinationSink {
public:
    transfer::TransferResult write_at(uint64_t offset,
                                      std::span<const uint8_t> bytes,
                                      std::stop_token stop) override;

    uint64_t bytes_accepted() const override { return accepted_; }

protected:
    // Takes ownership of new bytes; they follow everything appended before.
    virtual void buffer(std::span<const uint8_t> bytes) = 0;

    // Pushes out whatever buffered data is ready. Called after every write,
    // including writes whose bytes were already accepted.
    virtual transfer::TransferResult flush_ready(std::stop_token stop) = 0;

private:
    uint64_t accepted_ = 0;
};

} // namespace chunkrelay::storage
