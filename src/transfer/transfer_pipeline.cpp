#include "chunkrelay/transfer/transfer_pipeline.hpp"
#include "chunkrelay/transfer/retry_runner.hpp"
#include "chunkrelay/crypto/hash.hpp"
#include "chunkrelay/core/logger.hpp"
#include <algorithm>
#include <thread>

namespace chunkrelay::transfer {

TransferPipeline::TransferPipeline(const TransferSpec& spec,
                                   ChunkSource& source,
                                   storage::DestinationSink& sink,
                                   const RetryPolicy& policy,
                                   ProgressReporter* progress,
                                   std::string session_id)
    : spec_(spec)
    , source_(source)
    , sink_(sink)
    , policy_(policy)
    , progress_(progress)
    , session_id_(std::move(session_id))
    , buffer_(spec.buffer_capacity)
{
    if (spec_.total_size) {
        known_size_ = *spec_.total_size;
    }
}

TransferResult TransferPipeline::run(std::stop_token stop) {
    if (started_) {
        return TransferResult::permanent("Pipeline already ran");
    }
    started_ = true;

    auto valid = spec_.validate();
    if (!valid) {
        sink_.abort();
        return valid;
    }

    // An outside stop request or a failure in either stage stops both.
    std::stop_callback forward_stop(stop, [this] { internal_stop_.request_stop(); });

    notify_state(TransferState::RUNNING);

    std::thread fetcher([this] { fetch_stage(); });
    std::thread drainer([this] { drain_stage(); });
    fetcher.join();
    drainer.join();

    stats_.total_backoff = fetch_backoff_ + drain_backoff_;
    if (known_size_ != UNKNOWN_SIZE) {
        stats_.known_size = known_size_.load();
    }

    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_) {
            LOG_ERROR("[{}] Transfer to {} failed: {}", session_id_, sink_.address(), error_->describe());
            sink_.abort();
            return *error_;
        }
    }

    if (stop.stop_requested() || !drain_completed_) {
        LOG_WARN("[{}] Transfer to {} cancelled after {} bytes", session_id_, sink_.address(),
                 stats_.bytes_written);
        sink_.abort();
        return TransferResult::cancelled();
    }

    if (commit_check_) {
        auto check = commit_check_(stats_);
        if (!check) {
            LOG_ERROR("[{}] Integrity check failed: {}", session_id_, check.describe());
            sink_.abort();
            return check;
        }
    }

    auto committed = commit(stop);
    if (!committed) {
        sink_.abort();
        return committed;
    }

    LOG_DEBUG("[{}] Committed {} bytes to {}", session_id_, stats_.bytes_written, sink_.address());
    return TransferResult::ok();
}

void TransferPipeline::fetch_stage() {
    auto stop = internal_stop_.get_token();

    try {
        uint64_t offset = 0;
        RetryContext context;
        bool retrying = false;

        while (!stop.stop_requested()) {
            uint64_t total = known_size_.load();
            uint64_t length = spec_.chunk_size;

            if (total != UNKNOWN_SIZE) {
                if (offset >= total) {
                    // Empty object: nothing to fetch, but the sink still gets a final chunk.
                    Chunk last;
                    last.offset = offset;
                    last.is_final = true;
                    buffer_.push(std::move(last), stop);
                    return;
                }
                length = std::min<uint64_t>(length, total - offset);
            }

            FetchResponse response;
            auto result = run_with_retry(policy_, context, stop,
                [&] {
                    response = FetchResponse{};
                    return source_.fetch(offset, length, response, stop);
                },
                [&](const TransferResult& error, const RetryContext& ctx, std::chrono::milliseconds delay) {
                    ++stats_.fetch_retries;
                    enter_retry(retrying);
                    LOG_WARN("[{}] Fetch at offset {} failed ({}), attempt {}/{}; retrying in {} ms",
                             session_id_, offset, error.describe(), ctx.attempts,
                             policy_.options().max_attempts, delay.count());
                });

            fetch_backoff_ += context.total_wait;

            if (!result) {
                if (result.kind != ErrorKind::CANCELLED) {
                    result.offset = offset;
                    fail(std::move(result));
                }
                return;
            }

            context.reset();
            leave_retry(retrying);

            if (response.data.size() > length) {
                auto error = TransferResult::permanent(
                    "Source returned " + std::to_string(response.data.size()) +
                    " bytes for a " + std::to_string(length) + " byte range");
                error.offset = offset;
                fail(std::move(error));
                return;
            }

            if (response.object_size && total == UNKNOWN_SIZE) {
                total = *response.object_size;
                known_size_ = total;
                LOG_DEBUG("[{}] Source reports object size {}", session_id_, total);
            }

            uint64_t size = response.data.size();
            bool is_final = response.end_of_object ||
                            size < length ||
                            (total != UNKNOWN_SIZE && offset + size >= total);

            Chunk chunk;
            chunk.offset = offset;
            chunk.data = std::move(response.data);
            chunk.is_final = is_final;

            LOG_TRACE("[{}] Fetched {} bytes at offset {}{}", session_id_, size, offset,
                      is_final ? " (final)" : "");

            // Blocks while the buffer is full: this is where a slow sink
            // throttles the source.
            if (!buffer_.push(std::move(chunk), stop)) {
                return;
            }

            offset += size;
            stats_.bytes_fetched = offset;
            report(ProgressStage::FETCH, offset);

            if (is_final) {
                return;
            }
        }
    } catch (const std::exception& e) {
        fail(TransferResult::permanent(std::string("Fetch stage error: ") + e.what()));
    }
}

void TransferPipeline::drain_stage() {
    auto stop = internal_stop_.get_token();

    try {
        crypto::ContentHasher hasher;
        uint64_t expected_offset = 0;
        RetryContext context;
        bool retrying = false;

        while (true) {
            Chunk* chunk = buffer_.peek(stop);
            if (!chunk) {
                return;
            }

            if (chunk->offset != expected_offset) {
                auto error = TransferResult::permanent(
                    "Chunk at offset " + std::to_string(chunk->offset) +
                    " arrived while expecting offset " + std::to_string(expected_offset));
                error.offset = chunk->offset;
                fail(std::move(error));
                return;
            }

            if (!chunk->data.empty()) {
                auto result = run_with_retry(policy_, context, stop,
                    [&] { return sink_.write_at(chunk->offset, chunk->data, stop); },
                    [&](const TransferResult& error, const RetryContext& ctx, std::chrono::milliseconds delay) {
                        ++stats_.drain_retries;
                        enter_retry(retrying);
                        LOG_WARN("[{}] Write at offset {} to {} failed ({}), attempt {}/{}; retrying in {} ms",
                                 session_id_, chunk->offset, sink_.address(), error.describe(),
                                 ctx.attempts, policy_.options().max_attempts, delay.count());
                    });

                drain_backoff_ += context.total_wait;

                if (!result) {
                    if (result.kind != ErrorKind::CANCELLED) {
                        result.offset = chunk->offset;
                        fail(std::move(result));
                    }
                    return;
                }

                context.reset();
                leave_retry(retrying);
                hasher.update(chunk->data);
            }

            expected_offset = chunk->end_offset();
            stats_.bytes_written = expected_offset;
            ++stats_.chunks_written;
            bool is_final = chunk->is_final;

            // Only now may the fetch stage reuse the slot.
            buffer_.release();
            report(ProgressStage::DRAIN, expected_offset);

            if (is_final) {
                stats_.digest = crypto::hash_utils::to_hex(hasher.finalize());
                drain_completed_ = true;
                return;
            }
        }
    } catch (const std::exception& e) {
        fail(TransferResult::permanent(std::string("Drain stage error: ") + e.what()));
    }
}

TransferResult TransferPipeline::commit(std::stop_token stop) {
    RetryContext context;
    auto result = run_with_retry(policy_, context, stop,
        [&] { return sink_.finalize(stop); },
        [&](const TransferResult& error, const RetryContext& ctx, std::chrono::milliseconds delay) {
            LOG_WARN("[{}] Finalizing {} failed ({}), attempt {}/{}; retrying in {} ms",
                     session_id_, sink_.address(), error.describe(), ctx.attempts,
                     policy_.options().max_attempts, delay.count());
        });

    stats_.total_backoff += context.total_wait;
    return result;
}

void TransferPipeline::fail(TransferResult error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!error_) {
            error_ = std::move(error);
        }
    }
    internal_stop_.request_stop();
}

void TransferPipeline::enter_retry(bool& flag) {
    if (flag) return;
    flag = true;

    // Notified under the lock so listeners see the transitions in order.
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (retrying_stages_++ == 0) {
        notify_state(TransferState::RETRYING);
    }
}

void TransferPipeline::leave_retry(bool& flag) {
    if (!flag) return;
    flag = false;

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (--retrying_stages_ == 0) {
        notify_state(TransferState::RUNNING);
    }
}

void TransferPipeline::report(ProgressStage stage, uint64_t bytes_so_far) {
    if (!progress_) return;

    ProgressEvent event;
    event.session_id = session_id_;
    event.stage = stage;
    event.bytes_so_far = bytes_so_far;
    uint64_t total = known_size_.load();
    if (total != UNKNOWN_SIZE) {
        event.total_bytes = total;
    }
    event.timestamp = std::chrono::steady_clock::now();

    progress_->on_progress(event);
}

void TransferPipeline::notify_state(TransferState state) {
    if (state_listener_) {
        state_listener_(state);
    }
}

} // namespace chunkrelay::transfer
