#pragma once

#include "destination_sink.hpp"
#include <vector>

namespace chunkrelay::storage {

// Object stores take uploads in parts. Bytes accumulate until a full part is
// available; the last, possibly short, part goes out on finalize. A part that
// fails stays buffered and is sent again by the next write or finalize.
class PartUploadSink : public AppendOnlySink {
public:
    explicit PartUploadSink(uint64_t part_size);

    transfer::TransferResult finalize(std::stop_token stop) override;
    void abort() noexcept override;

    uint64_t part_size() const { return part_size_; }
    uint32_t parts_uploaded() const { return next_part_ - 1; }

protected:
    void buffer(std::span<const uint8_t> bytes) override;
    transfer::TransferResult flush_ready(std::stop_token stop) override;

    // Called once, before the first part.
    virtual transfer::TransferResult begin_upload(std::stop_token stop) = 0;

    // part_number counts from 1; offset is the object offset of the part's first byte.
    virtual transfer::TransferResult upload_part(uint32_t part_number,
                                                 uint64_t offset,
                                                 std::span<const uint8_t> data,
                                                 bool last,
                                                 std::stop_token stop) = 0;

    // Makes the uploaded parts visible as one object.
    virtual transfer::TransferResult complete_upload(std::stop_token stop) = 0;

    // Releases server-side state of an upload that will never complete.
    virtual void abort_upload() noexcept = 0;

    bool upload_started() const { return started_; }

private:
    uint64_t part_size_;
    std::vector<uint8_t> pending_;
    uint64_t pending_offset_ = 0;
    uint32_t next_part_ = 1;
    bool started_ = false;
    bool last_part_sent_ = false;
    bool completed_ = false;
    bool aborted_ = false;

    transfer::TransferResult ensure_started(std::stop_token stop);
    transfer::TransferResult send(size_t length, bool last, std::stop_token stop);
};

} // namespace chunkrelay::storage
