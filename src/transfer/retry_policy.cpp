#include "chunkrelay/transfer/retry_policy.hpp"
#include "chunkrelay/core/config.hpp"
#include <algorithm>

namespace chunkrelay::transfer {

RetryPolicy::Options RetryPolicy::Options::for_class(OperationClass op_class) {
    Options options;
    options.max_attempts = (op_class == OperationClass::CHUNK) ? 5 : 3;
    return options;
}

RetryPolicy::Options RetryPolicy::Options::from_config(OperationClass op_class) {
    auto& config = core::Config::instance();
    Options options = for_class(op_class);

    if (op_class == OperationClass::CHUNK) {
        options.max_attempts = static_cast<uint32_t>(
            std::max(1, config.get_int("retry.chunk_attempts", static_cast<int>(options.max_attempts))));
    } else {
        options.max_attempts = static_cast<uint32_t>(
            std::max(1, config.get_int("retry.metadata_attempts", static_cast<int>(options.max_attempts))));
    }

    options.base_delay = std::chrono::milliseconds(
        config.get_int("retry.base_delay_ms", static_cast<int>(options.base_delay.count())));
    options.max_delay = std::chrono::milliseconds(
        config.get_int("retry.max_delay_ms", static_cast<int>(options.max_delay.count())));
    options.max_server_delay = std::chrono::seconds(
        config.get_int("retry.max_server_delay_s", 120));

    return options;
}

RetryPolicy::RetryPolicy()
    : RetryPolicy(Options{})
{
}

RetryPolicy::RetryPolicy(Options options, JitterSource jitter)
    : options_(options)
    , jitter_(std::move(jitter))
    , rng_(std::random_device{}())
{
}

RetryDecision RetryPolicy::next_delay(const RetryContext& context, const TransferResult& error) const {
    if (error.kind == ErrorKind::PERMANENT ||
        error.kind == ErrorKind::SIZE_MISMATCH ||
        error.kind == ErrorKind::CANCELLED ||
        error.kind == ErrorKind::NONE) {
        return RetryDecision::give_up();
    }

    if (context.attempts >= options_.max_attempts) {
        return RetryDecision::give_up();
    }

    if (error.kind == ErrorKind::RATE_LIMITED && error.retry_after) {
        // The hint is honoured as-is; only absurd values are clamped.
        auto hinted = std::max(*error.retry_after, std::chrono::milliseconds(0));
        return RetryDecision::retry(std::min(hinted, options_.max_server_delay));
    }

    return RetryDecision::retry(backoff_for(std::max<uint32_t>(context.attempts, 1)));
}

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t attempt) const {
    auto base = options_.base_delay;
    auto delay = base;

    // base * 2^(attempt - 1), saturating at max_delay
    for (uint32_t i = 1; i < attempt && delay < options_.max_delay; ++i) {
        delay *= 2;
    }

    delay += random_jitter(base);
    return std::min(delay, options_.max_delay);
}

std::chrono::milliseconds RetryPolicy::random_jitter(std::chrono::milliseconds bound) const {
    if (bound.count() <= 0) {
        return std::chrono::milliseconds(0);
    }

    if (jitter_) {
        return jitter_(bound);
    }

    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<int64_t> dist(0, bound.count() - 1);
    return std::chrono::milliseconds(dist(rng_));
}

} // namespace chunkrelay::transfer
