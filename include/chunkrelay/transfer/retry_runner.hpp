#pragma once

#include "retry_policy.hpp"
#include "transfer_types.hpp"
#include <chrono>
#include <functional>
#include <stop_token>

namespace chunkrelay::transfer {

// Sleeps for the given duration unless stopped first. Returns false if stopped.
bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token stop);

using RetryObserver = std::function<void(const TransferResult& error,
                                         const RetryContext& context,
                                         std::chrono::milliseconds delay)>;

// Runs op until it succeeds, fails permanently, runs out of attempts or is
// stopped. The context carries attempts and waited time across calls and is
// left as-is for the caller to inspect; the returned error carries the number
// of attempts made.
TransferResult run_with_retry(const RetryPolicy& policy,
                              RetryContext& context,
                              std::stop_token stop,
                              const std::function<TransferResult()>& op,
                              const RetryObserver& on_retry = nullptr);

} // namespace chunkrelay::transfer
