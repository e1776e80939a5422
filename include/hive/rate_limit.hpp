/**
 * @file rate_limit.hpp
 * @brief Per-task-type dispatch rate limits.
 *
 * A limit is written "N/s", "N/m" or "N/h" (a bare number means per
 * second). Each limited task type gets a token bucket of capacity 1
 * refilled at N per window, so dispatches are spaced evenly rather than
 * burst at the start of each window.
 */

#ifndef HIVE_RATE_LIMIT_HPP_
#define HIVE_RATE_LIMIT_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <unordered_map>

namespace hive {

/**
 * @brief Parse a rate-limit string into tokens per second.
 * @return 0.0 for an empty string (unlimited); empty on malformed input.
 */
inline optional<double> ParseRateLimit(const std::string& text) {
  if (text.empty()) return 0.0;
  const char* p = text.c_str();
  char* end = nullptr;
  double n = std::strtod(p, &end);
  if (end == p || !std::isfinite(n) || n < 0.0) return nullopt;
  if (*end == '\0') return n;
  if (*end != '/' || end[1] == '\0' || end[2] != '\0') return nullopt;
  switch (end[1]) {
    case 's': return n;
    case 'm': return n / 60.0;
    case 'h': return n / 3600.0;
    default:  return nullopt;
  }
}

// ============================================================================
// TokenBucket
// ============================================================================

class TokenBucket {
 public:
  /**
   * @param rate_per_sec  Refill rate; must be > 0.
   * @param capacity      Burst size.
   */
  explicit TokenBucket(double rate_per_sec, double capacity = 1.0) noexcept
      : rate_(rate_per_sec), capacity_(capacity), tokens_(capacity) {}

  /// @brief Take one token if available at @p now_us.
  bool TryConsume(uint64_t now_us) noexcept {
    Refill(now_us);
    if (tokens_ >= 1.0) {
      tokens_ -= 1.0;
      return true;
    }
    return false;
  }

  /// @brief Microseconds until one token will be available (0 if now).
  uint64_t ExpectedWaitUs(uint64_t now_us) noexcept {
    Refill(now_us);
    if (tokens_ >= 1.0) return 0U;
    return static_cast<uint64_t>(std::ceil((1.0 - tokens_) / rate_ * 1e6));
  }

  double Rate() const noexcept { return rate_; }

 private:
  void Refill(uint64_t now_us) noexcept {
    if (last_us_ == 0U) {
      last_us_ = now_us;
      return;
    }
    if (now_us <= last_us_) return;
    tokens_ += static_cast<double>(now_us - last_us_) * 1e-6 * rate_;
    if (tokens_ > capacity_) tokens_ = capacity_;
    last_us_ = now_us;
  }

  double rate_;
  double capacity_;
  double tokens_;
  uint64_t last_us_ = 0;
};

// ============================================================================
// RateLimiter
// ============================================================================

/// @brief Token buckets keyed by task name. Owned by the dispatcher loop.
class RateLimiter {
 public:
  /// @brief Set (rate > 0) or clear (rate <= 0) the limit of @p task.
  void Configure(const std::string& task, double rate_per_sec) {
    if (rate_per_sec <= 0.0) {
      buckets_.erase(task);
      return;
    }
    buckets_.erase(task);
    buckets_.emplace(task, TokenBucket(rate_per_sec));
  }

  bool IsLimited(const std::string& task) const {
    return buckets_.find(task) != buckets_.end();
  }

  /// @brief Consume a dispatch token; unlimited tasks always succeed.
  bool TryAcquire(const std::string& task, uint64_t now_us) {
    auto it = buckets_.find(task);
    return it == buckets_.end() || it->second.TryConsume(now_us);
  }

  uint64_t WaitUs(const std::string& task, uint64_t now_us) {
    auto it = buckets_.find(task);
    return (it == buckets_.end()) ? 0U : it->second.ExpectedWaitUs(now_us);
  }

 private:
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace hive

#endif  // HIVE_RATE_LIMIT_HPP_
