#pragma once

#include "transfer_types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <mutex>

namespace chunkrelay::transfer {

// Operations are budgeted by class: a failed chunk fetch loses one chunk of
// progress, a failed metadata call loses nothing.
enum class OperationClass {
    METADATA,
    CHUNK
};

struct RetryContext {
    uint32_t attempts = 0; // failed attempts so far
    std::chrono::milliseconds total_wait{0};
    ErrorKind last_error = ErrorKind::NONE;

    void record_failure(ErrorKind kind) {
        ++attempts;
        last_error = kind;
    }

    void record_wait(std::chrono::milliseconds delay) { total_wait += delay; }

    void reset() { *this = RetryContext{}; }
};

struct RetryDecision {
    enum class Action {
        RETRY,
        GIVE_UP
    };

    Action action;
    std::chrono::milliseconds delay{0};

    static RetryDecision retry(std::chrono::milliseconds d) { return {Action::RETRY, d}; }
    static RetryDecision give_up() { return {Action::GIVE_UP, std::chrono::milliseconds(0)}; }

    bool should_retry() const { return action == Action::RETRY; }
};

class RetryPolicy {
public:
    struct Options {
        // Total attempts allowed, the first one included.
        uint32_t max_attempts = 5;
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds max_delay{30000};
        // Clamp for server-provided Retry-After hints.
        std::chrono::milliseconds max_server_delay{120000};

        static Options for_class(OperationClass op_class);
        static Options from_config(OperationClass op_class);
    };

    // Returns a value in [0, bound).
    using JitterSource = std::function<std::chrono::milliseconds(std::chrono::milliseconds bound)>;

    RetryPolicy();
    explicit RetryPolicy(Options options, JitterSource jitter = nullptr);

    // Call after context.record_failure() for the failed attempt.
    RetryDecision next_delay(const RetryContext& context, const TransferResult& error) const;

    std::chrono::milliseconds backoff_for(uint32_t attempt) const;

    const Options& options() const { return options_; }

private:
    Options options_;
    JitterSource jitter_;

    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;

    std::chrono::milliseconds random_jitter(std::chrono::milliseconds bound) const;
};

} // namespace chunkrelay::transfer
