/**
 * @file retry.hpp
 * @brief Retry backoff computation and retry decisions.
 *
 *   delay(n) = min(max, base * 2^n)
 *
 * With jitter the delay is drawn uniformly from [0, delay(n)] ("full
 * jitter"), so many workers retrying the same failure do not come back in
 * lockstep.
 */

#ifndef HIVE_RETRY_HPP_
#define HIVE_RETRY_HPP_

#include "hive/platform.hpp"
#include "hive/task.hpp"

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>

namespace hive {

/// @brief Deterministic part of the backoff; saturates at @p max_ms.
inline uint64_t BackoffDelayMs(uint32_t retry_count, uint64_t base_ms,
                               uint64_t max_ms) noexcept {
  if (base_ms == 0U) return 0U;
  if (retry_count >= 63U || base_ms > (max_ms >> retry_count)) {
    return max_ms;
  }
  return std::min(max_ms, base_ms << retry_count);
}

/**
 * @brief Delay before retry number @p retry_count + 1.
 * @param rng  Only consulted when @p jitter is set.
 */
inline uint64_t NextRetryDelayMs(uint32_t retry_count, uint64_t base_ms,
                                 uint64_t max_ms, bool jitter,
                                 std::mt19937_64& rng) {
  const uint64_t delay = BackoffDelayMs(retry_count, base_ms, max_ms);
  if (!jitter || delay == 0U) return delay;
  std::uniform_int_distribution<uint64_t> dist(0U, delay);
  return dist(rng);
}

/// @brief Plain count comparison against max_retries (empty: unlimited).
inline bool RetryPermitted(const RetryPolicy& policy,
                           uint32_t retries_so_far) noexcept {
  if (!policy.enabled) return false;
  return !policy.max_retries.has_value() ||
         retries_so_far < *policy.max_retries;
}

struct RetryDecision {
  bool retry = false;
  uint64_t delay_ms = 0;
  const char* reason = "";
};

/**
 * @brief Decide whether a terminal outcome is retried.
 *
 * - success and timeout are never retried;
 * - worker_lost is retried while the count permits;
 * - failure is retried when the handler asked for it (TaskResult::Retry),
 *   or when the error is retryable and its type is covered by retry_for.
 * An explicit countdown from the handler overrides the backoff.
 */
inline RetryDecision DecideRetry(const RetryPolicy& policy,
                                 const Outcome& outcome,
                                 uint32_t retries_so_far,
                                 std::mt19937_64& rng) {
  RetryDecision d;
  switch (outcome.kind) {
    case OutcomeKind::kSuccess:
      d.reason = "succeeded";
      return d;
    case OutcomeKind::kTimeout:
      d.reason = "time limit exceeded";
      return d;
    default:
      break;
  }
  if (!policy.enabled) {
    d.reason = "retries disabled";
    return d;
  }
  if (outcome.kind == OutcomeKind::kFailure && !outcome.retry_requested) {
    if (!outcome.error.retryable) {
      d.reason = "error is not retryable";
      return d;
    }
    if (!policy.retry_for.empty() &&
        std::find(policy.retry_for.begin(), policy.retry_for.end(),
                  outcome.error.type) == policy.retry_for.end()) {
      d.reason = "error type not in retry_for";
      return d;
    }
  }
  if (!RetryPermitted(policy, retries_so_far)) {
    d.reason = "max retries exceeded";
    return d;
  }
  d.retry = true;
  d.reason = (outcome.kind == OutcomeKind::kWorkerLost) ? "worker lost"
             : outcome.retry_requested                   ? "retry requested"
                                                         : "failure";
  if (outcome.retry_requested && outcome.retry_countdown_ms != 0U) {
    d.delay_ms = outcome.retry_countdown_ms;
  } else {
    d.delay_ms = NextRetryDelayMs(retries_so_far, policy.backoff_base_ms,
                                  policy.backoff_max_ms, policy.jitter, rng);
  }
  return d;
}

}  // namespace hive

#endif  // HIVE_RETRY_HPP_
