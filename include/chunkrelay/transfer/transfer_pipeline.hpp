#pragma once

#include "bounded_buffer.hpp"
#include "chunk_source.hpp"
#include "progress_reporter.hpp"
#include "retry_policy.hpp"
#include "transfer_types.hpp"
#include "../storage/destination_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace chunkrelay::transfer {

struct PipelineStats {
    uint64_t bytes_fetched = 0;
    uint64_t bytes_written = 0;
    uint64_t chunks_written = 0;
    uint32_t fetch_retries = 0;
    uint32_t drain_retries = 0;
    std::chrono::milliseconds total_backoff{0};

    // Size as finally known: declared up front or learned from the source.
    std::optional<uint64_t> known_size;

    // Lowercase hex BLAKE2b-256 of the written bytes.
    std::string digest;
};

// Moves one object from a ChunkSource to a DestinationSink through a bounded
// buffer. The fetch stage and the drain stage run on their own threads; run()
// blocks the caller until both have finished and the sink is committed or
// cleaned up.
class TransferPipeline {
public:
    // Runs after both stages succeeded and before the sink is committed.
    using CommitCheck = std::function<TransferResult(const PipelineStats&)>;
    using StateListener = std::function<void(TransferState)>;

    TransferPipeline(const TransferSpec& spec,
                     ChunkSource& source,
                     storage::DestinationSink& sink,
                     const RetryPolicy& policy,
                     ProgressReporter* progress = nullptr,
                     std::string session_id = "");

    TransferPipeline(const TransferPipeline&) = delete;
    TransferPipeline& operator=(const TransferPipeline&) = delete;

    void set_commit_check(CommitCheck check) { commit_check_ = std::move(check); }
    // Called with RUNNING and RETRYING as stages start and stop backing off,
    // one call at a time and in order. Must not call back into the pipeline.
    void set_state_listener(StateListener listener) { state_listener_ = std::move(listener); }

    // One-shot. Returns ok only when every byte was written and committed.
    TransferResult run(std::stop_token stop);

    const PipelineStats& stats() const { return stats_; }

private:
    const TransferSpec spec_;
    ChunkSource& source_;
    storage::DestinationSink& sink_;
    const RetryPolicy& policy_;
    ProgressReporter* progress_;
    std::string session_id_;

    BoundedBuffer<Chunk> buffer_;
    std::stop_source internal_stop_;

    CommitCheck commit_check_;
    StateListener state_listener_;
    bool started_ = false;

    static constexpr uint64_t UNKNOWN_SIZE = UINT64_MAX;

    // Fields written by one stage only; merged into stats_ after both joined.
    PipelineStats stats_;
    std::chrono::milliseconds fetch_backoff_{0};
    std::chrono::milliseconds drain_backoff_{0};
    std::atomic<uint64_t> known_size_{UNKNOWN_SIZE};
    bool drain_completed_ = false;

    std::mutex error_mutex_;
    std::optional<TransferResult> error_;

    std::mutex state_mutex_;
    int retrying_stages_ = 0;

    void fetch_stage();
    void drain_stage();

    TransferResult commit(std::stop_token stop);

    void fail(TransferResult error);
    void enter_retry(bool& flag);
    void leave_retry(bool& flag);

    void report(ProgressStage stage, uint64_t bytes_so_far);
    void notify_state(TransferState state);
};

} // namespace chunkrelay::transfer
