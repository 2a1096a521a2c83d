#include "chunkrelay/transfer/retry_runner.hpp"
#include <condition_variable>
#include <mutex>

namespace chunkrelay::transfer {

bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop) {
    if (stop.stop_requested()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, stop, duration, [] { return false; });

    return !stop.stop_requested();
}

TransferResult run_with_retry(const RetryPolicy& policy,
                              RetryContext& context,
                              std::stop_token stop,
                              const std::function<TransferResult()>& op,
                              const RetryObserver& on_retry) {
    while (true) {
        if (stop.stop_requested()) {
            return TransferResult::cancelled();
        }

        auto result = op();
        if (result.success()) {
            return result;
        }

        if (result.kind == ErrorKind::CANCELLED || stop.stop_requested()) {
            return TransferResult::cancelled(result.message);
        }

        context.record_failure(result.kind);

        auto decision = policy.next_delay(context, result);
        if (!decision.should_retry()) {
            result.attempts = context.attempts;
            return result;
        }

        if (on_retry) {
            on_retry(result, context, decision.delay);
        }

        if (!interruptible_sleep(decision.delay, stop)) {
            return TransferResult::cancelled();
        }
        context.record_wait(decision.delay);
    }
}

} // namespace chunkrelay::transfer
