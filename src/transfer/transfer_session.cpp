#include "chunkrelay/transfer/transfer_session.hpp"
#include "chunkrelay/transfer/retry_runner.hpp"
#include "chunkrelay/transfer/transfer_pipeline.hpp"
#include "chunkrelay/core/config.hpp"
#include "chunkrelay/core/logger.hpp"
#include "chunkrelay/core/utils.hpp"
#include <algorithm>
#include <thread>

namespace chunkrelay::transfer {

TransferOptions TransferOptions::from_config() {
    auto& config = core::Config::instance();
    TransferOptions options;

    options.chunk_size = std::max<uint64_t>(1, config.get_uint64("transfer.chunk_size", options.chunk_size));
    options.buffer_chunks = static_cast<uint32_t>(
        std::max(1, config.get_int("transfer.buffer_chunks", static_cast<int>(options.buffer_chunks))));
    options.session_timeout = std::chrono::seconds(
        std::max(0, config.get_int("transfer.session_timeout_s", 0)));

    options.chunk_retry = RetryPolicy::Options::from_config(OperationClass::CHUNK);
    options.metadata_retry = RetryPolicy::Options::from_config(OperationClass::METADATA);

    return options;
}

TransferSession::TransferSession(std::string session_id,
                                 TransferSpec spec,
                                 const TransferOptions& options,
                                 MetadataSource& metadata,
                                 ChunkSource& source,
                                 storage::DestinationSink& sink,
                                 ProgressReporter* progress)
    : session_id_(std::move(session_id))
    , spec_(std::move(spec))
    , options_(options)
    , metadata_(metadata)
    , source_(source)
    , sink_(sink)
    , progress_(progress)
    , chunk_policy_(options.chunk_retry, options.jitter)
    , metadata_policy_(options.metadata_retry, options.jitter)
{
}

TransferOutcome TransferSession::run(std::stop_token stop) {
    TransferOutcome outcome;
    outcome.session_id = session_id_;

    auto start = std::chrono::steady_clock::now();

    if (started_.exchange(true)) {
        outcome.state = TransferState::FAILED;
        outcome.error = TransferResult::permanent("Session already ran");
        return outcome;
    }

    // The caller's token, cancel() and the session timeout all end up here.
    std::stop_source run_stop;
    std::stop_callback on_caller_stop(stop, [&run_stop] { run_stop.request_stop(); });
    std::stop_callback on_cancel(cancel_source_.get_token(), [&run_stop] { run_stop.request_stop(); });

    std::jthread watchdog;
    if (options_.session_timeout.count() > 0) {
        watchdog = std::jthread([this, &run_stop](std::stop_token watchdog_stop) {
            if (interruptible_sleep(options_.session_timeout, watchdog_stop)) {
                LOG_WARN("[{}] Session timeout of {} elapsed, cancelling", session_id_,
                         core::utils::StringUtils::format_duration(options_.session_timeout));
                timed_out_ = true;
                run_stop.request_stop();
            }
        });
    }

    LOG_INFO("[{}] Starting transfer of {} to {}", session_id_, spec_.object_id, sink_.address());
    set_state(TransferState::RUNNING);

    auto valid = spec_.validate();
    if (!valid) {
        sink_.abort();
        return finish(std::move(outcome), start, valid);
    }

    auto resolved = resolve_size(run_stop.get_token());
    if (!resolved) {
        sink_.abort();
        return finish(std::move(outcome), start, resolved);
    }
    outcome.total_bytes = spec_.total_size;

    TransferPipeline pipeline(spec_, source_, sink_, chunk_policy_, progress_, session_id_);
    pipeline.set_state_listener([this](TransferState state) { set_state(state); });
    pipeline.set_commit_check([this](const PipelineStats& stats) {
        return check_integrity(stats.bytes_written, stats.known_size, stats.digest);
    });

    auto result = pipeline.run(run_stop.get_token());

    const auto& stats = pipeline.stats();
    outcome.bytes_transferred = stats.bytes_written;
    outcome.total_bytes = stats.known_size;
    outcome.total_backoff = stats.total_backoff;
    outcome.digest = stats.digest;

    if (result.kind == ErrorKind::CANCELLED && timed_out_) {
        result.message = "Session timeout of " +
                         core::utils::StringUtils::format_duration(options_.session_timeout) + " elapsed";
    }

    return finish(std::move(outcome), start, result);
}

void TransferSession::cancel() {
    LOG_DEBUG("[{}] Cancellation requested", session_id_);
    cancel_source_.request_stop();
}

TransferResult TransferSession::resolve_size(std::stop_token stop) {
    if (spec_.total_size) {
        return TransferResult::ok();
    }

    RetryContext context;
    std::optional<uint64_t> size;

    auto result = run_with_retry(metadata_policy_, context, stop,
        [&] {
            size.reset();
            return metadata_.resolve_size(spec_.object_id, size, stop);
        },
        [&](const TransferResult& error, const RetryContext& ctx, std::chrono::milliseconds delay) {
            set_state(TransferState::RETRYING);
            LOG_WARN("[{}] Size lookup for {} failed ({}), attempt {}/{}; retrying in {} ms",
                     session_id_, spec_.object_id, error.describe(), ctx.attempts,
                     metadata_policy_.options().max_attempts, delay.count());
        });

    if (!result) {
        return result;
    }

    if (context.attempts > 0) {
        set_state(TransferState::RUNNING);
    }

    spec_.total_size = size;
    if (size) {
        LOG_DEBUG("[{}] Object {} is {}", session_id_, spec_.object_id,
                  core::utils::StringUtils::format_bytes(*size));
    } else {
        LOG_DEBUG("[{}] Size of {} is unknown until the first response", session_id_, spec_.object_id);
    }

    return TransferResult::ok();
}

TransferResult TransferSession::check_integrity(uint64_t bytes_written,
                                                const std::optional<uint64_t>& known_size,
                                                const std::string& digest) const {
    if (known_size && bytes_written != *known_size) {
        return TransferResult(ErrorKind::SIZE_MISMATCH,
                              "Expected " + std::to_string(*known_size) + " bytes, wrote " +
                              std::to_string(bytes_written));
    }

    if (spec_.expected_digest &&
        core::utils::StringUtils::to_lower(*spec_.expected_digest) != digest) {
        return TransferResult(ErrorKind::SIZE_MISMATCH,
                              "Content digest " + digest + " does not match expected " +
                              *spec_.expected_digest);
    }

    return TransferResult::ok();
}

void TransferSession::set_state(TransferState state) {
    auto previous = state_.load();
    do {
        if (is_terminal(previous) || previous == state) {
            return;
        }
    } while (!state_.compare_exchange_weak(previous, state));

    LOG_DEBUG("[{}] {} -> {}", session_id_, to_string(previous), to_string(state));
}

TransferOutcome TransferSession::finish(TransferOutcome outcome,
                                        std::chrono::steady_clock::time_point start,
                                        const TransferResult& result) {
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (outcome.elapsed.count() > 0) {
        outcome.average_throughput_bps =
            static_cast<double>(outcome.bytes_transferred) * 1000.0 / outcome.elapsed.count();
    }

    switch (result.kind) {
        case ErrorKind::NONE:
            outcome.state = TransferState::COMPLETED;
            break;
        case ErrorKind::CANCELLED:
            outcome.state = TransferState::CANCELLED;
            outcome.error = result;
            break;
        default:
            outcome.state = TransferState::FAILED;
            outcome.error = result;
            break;
    }

    set_state(outcome.state);

    if (outcome.success()) {
        LOG_INFO("[{}] Completed: {} in {} ({}/s)", session_id_,
                 core::utils::StringUtils::format_bytes(outcome.bytes_transferred),
                 core::utils::StringUtils::format_duration(outcome.elapsed),
                 core::utils::StringUtils::format_bytes(static_cast<uint64_t>(outcome.average_throughput_bps)));
    } else if (outcome.state == TransferState::CANCELLED) {
        LOG_WARN("[{}] Cancelled after {}: {}", session_id_,
                 core::utils::StringUtils::format_bytes(outcome.bytes_transferred), result.message);
    } else {
        LOG_ERROR("[{}] Failed after {}: {}", session_id_,
                  core::utils::StringUtils::format_bytes(outcome.bytes_transferred), result.describe());
    }

    return outcome;
}

} // namespace chunkrelay::transfer
