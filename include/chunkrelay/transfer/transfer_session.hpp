#pragma once

#include "chunk_source.hpp"
#include "metadata_source.hpp"
#include "progress_reporter.hpp"
#include "retry_policy.hpp"
#include "transfer_types.hpp"
#include "../storage/destination_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace chunkrelay::transfer {

struct TransferOptions {
    uint64_t chunk_size = 1024 * 1024;
    uint32_t buffer_chunks = 8;

    // Zero disables the session timeout.
    std::chrono::milliseconds session_timeout{0};

    RetryPolicy::Options chunk_retry = RetryPolicy::Options::for_class(OperationClass::CHUNK);
    RetryPolicy::Options metadata_retry = RetryPolicy::Options::for_class(OperationClass::METADATA);

    // Overrides the random jitter of both policies. Tests only.
    RetryPolicy::JitterSource jitter;

    static TransferOptions from_config();
};

struct TransferOutcome {
    std::string session_id;
    TransferState state = TransferState::IDLE;

    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> total_bytes;
    std::chrono::milliseconds elapsed{0};
    double average_throughput_bps = 0.0;
    std::chrono::milliseconds total_backoff{0};
    std::string digest;

    // Set for every terminal state other than COMPLETED.
    TransferResult error;

    bool success() const { return state == TransferState::COMPLETED; }
};

// One end-to-end transfer of one object. The chunk source, the sink and the
// metadata source are borrowed for the lifetime of the session.
class TransferSession {
public:
    TransferSession(std::string session_id,
                    TransferSpec spec,
                    const TransferOptions& options,
                    MetadataSource& metadata,
                    ChunkSource& source,
                    storage::DestinationSink& sink,
                    ProgressReporter* progress = nullptr);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // Runs the transfer to a terminal state. May be called once.
    TransferOutcome run(std::stop_token stop = {});

    // Safe from any thread, before or during run().
    void cancel();

    TransferState get_state() const { return state_.load(); }
    const std::string& get_session_id() const { return session_id_; }
    const TransferSpec& get_spec() const { return spec_; }

private:
    std::string session_id_;
    TransferSpec spec_;
    TransferOptions options_;

    MetadataSource& metadata_;
    ChunkSource& source_;
    storage::DestinationSink& sink_;
    ProgressReporter* progress_;

    RetryPolicy chunk_policy_;
    RetryPolicy metadata_policy_;

    std::stop_source cancel_source_;
    std::atomic<TransferState> state_{TransferState::IDLE};
    std::atomic<bool> timed_out_{false};
    std::atomic<bool> started_{false};

    TransferResult resolve_size(std::stop_token stop);
    TransferResult check_integrity(uint64_t bytes_written,
                                   const std::optional<uint64_t>& known_size,
                                   const std::string& digest) const;

    void set_state(TransferState state);
    TransferOutcome finish(TransferOutcome outcome,
                           std::chrono::steady_clock::time_point start,
                           const TransferResult& result);
};

} // namespace chunkrelay::transfer
