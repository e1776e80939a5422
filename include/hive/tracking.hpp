/**
 * @file tracking.hpp
 * @brief Per-request state owned by the dispatcher loop.
 *
 * State machine:
 *
 *   RECEIVED --> ELIGIBLE --> DISPATCHED --> ACKED
 *      |            |             |  \
 *      |            |             |   +--> RETRY_SCHEDULED --> RECEIVED
 *      v            v             v              |
 *   REJECTED <------+-------------+--------------+
 *
 * Not thread-safe: only the dispatcher thread touches a tracker.
 */

#ifndef HIVE_TRACKING_HPP_
#define HIVE_TRACKING_HPP_

#include "hive/log.hpp"
#include "hive/task.hpp"
#include "hive/timer.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>

#include <string>
#include <unordered_map>
#include <vector>

namespace hive {

enum class RequestState : uint8_t {
  kReceived = 0,
  kEligible,
  kDispatched,
  kAcked,
  kRetryScheduled,
  kRejected
};

static constexpr uint32_t kRequestStateCount = 6U;

inline const char* RequestStateName(RequestState s) noexcept {
  switch (s) {
    case RequestState::kReceived:       return "RECEIVED";
    case RequestState::kEligible:       return "ELIGIBLE";
    case RequestState::kDispatched:     return "DISPATCHED";
    case RequestState::kAcked:          return "ACKED";
    case RequestState::kRetryScheduled: return "RETRY_SCHEDULED";
    case RequestState::kRejected:       return "REJECTED";
    default:                            return "UNKNOWN";
  }
}

inline bool IsTerminal(RequestState s) noexcept {
  return s == RequestState::kAcked || s == RequestState::kRejected;
}

/// @brief Legal edges of the request state machine.
inline bool IsLegalTransition(RequestState from, RequestState to) noexcept {
  switch (from) {
    case RequestState::kReceived:
      return to == RequestState::kEligible || to == RequestState::kRejected;
    case RequestState::kEligible:
      return to == RequestState::kDispatched || to == RequestState::kRejected;
    case RequestState::kDispatched:
      return to == RequestState::kAcked ||
             to == RequestState::kRetryScheduled ||
             to == RequestState::kRejected;
    case RequestState::kRetryScheduled:
      return to == RequestState::kReceived || to == RequestState::kRejected;
    default:
      return false;
  }
}

enum class TrackError : uint8_t {
  kDuplicate = 0,
  kNotFound,
  kIllegalTransition,
  kNotTerminal
};

inline const char* TrackErrorName(TrackError e) noexcept {
  switch (e) {
    case TrackError::kDuplicate:         return "Duplicate";
    case TrackError::kNotFound:          return "NotFound";
    case TrackError::kIllegalTransition: return "IllegalTransition";
    case TrackError::kNotTerminal:       return "NotTerminal";
    default:                             return "Unknown";
  }
}

struct TrackedRequest {
  TaskRequest request;
  RequestState state = RequestState::kReceived;
  const TaskDefinition* definition = nullptr;
  uint64_t received_us = 0U;
  uint64_t due_us = 0U;            ///< steady time the ETA falls due; 0: now
  uint64_t dispatched_us = 0U;
  uint64_t hard_deadline_us = 0U;  ///< 0: no hard limit
  uint64_t hard_limit_ms = 0U;
  bool settled = false;            ///< broker ack/reject already issued
  bool terminate_sent = false;
  bool revoked = false;            ///< finish as REVOKED whatever the outcome
  optional<TimerId> timer;         ///< pending ETA/retry timer
  TaskError last_error;
};

class RequestTracker final {
 public:
  /// @return kDuplicate if the id is already live.
  expected<TrackedRequest*, TrackError> Insert(TrackedRequest entry) {
    using R = expected<TrackedRequest*, TrackError>;
    const std::string id = entry.request.id;
    const RequestState st = entry.state;
    auto res = entries_.emplace(id, std::move(entry));
    if (!res.second) return R::error(TrackError::kDuplicate);
    ++counts_[Index(st)];
    return R::success(&res.first->second);
  }

  TrackedRequest* Find(const std::string& id) {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  const TrackedRequest* Find(const std::string& id) const {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? &it->second : nullptr;
  }

  bool Contains(const std::string& id) const {
    return entries_.find(id) != entries_.end();
  }

  expected<void, TrackError> Transition(const std::string& id,
                                        RequestState to) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return expected<void, TrackError>::error(TrackError::kNotFound);
    }
    const RequestState from = it->second.state;
    if (!IsLegalTransition(from, to)) {
      HIVE_LOG_ERROR("Tracker", "%s: illegal transition %s -> %s", id.c_str(),
                     RequestStateName(from), RequestStateName(to));
      return expected<void, TrackError>::error(TrackError::kIllegalTransition);
    }
    --counts_[Index(from)];
    ++counts_[Index(to)];
    it->second.state = to;
    return expected<void, TrackError>::success();
  }

  /**
   * @brief Drop an entry. Allowed from ACKED, REJECTED, and
   *        RETRY_SCHEDULED once the retry was handed back to the broker.
   */
  expected<void, TrackError> Remove(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return expected<void, TrackError>::error(TrackError::kNotFound);
    }
    const RequestState st = it->second.state;
    if (!IsTerminal(st) && st != RequestState::kRetryScheduled) {
      return expected<void, TrackError>::error(TrackError::kNotTerminal);
    }
    --counts_[Index(st)];
    entries_.erase(it);
    return expected<void, TrackError>::success();
  }

  /**
   * @brief Dispatched requests whose hard deadline plus @p grace_us has
   *        passed and that were not already force-terminated.
   */
  uint32_t CollectOverdue(uint64_t now_us, uint64_t grace_us,
                          std::vector<std::string>& out) const {
    uint32_t n = 0U;
    for (const auto& kv : entries_) {
      const TrackedRequest& e = kv.second;
      if (e.state == RequestState::kDispatched && e.hard_deadline_us != 0U &&
          !e.terminate_sent && now_us >= e.hard_deadline_us + grace_us) {
        out.push_back(kv.first);
        ++n;
      }
    }
    return n;
  }

  uint32_t CountInState(RequestState s) const noexcept {
    return counts_[Index(s)];
  }

  /// @brief Entries counted against the prefetch window.
  uint32_t CountOccupying() const noexcept {
    return counts_[Index(RequestState::kEligible)] +
           counts_[Index(RequestState::kDispatched)];
  }

  size_t Size() const noexcept { return entries_.size(); }
  bool Empty() const noexcept { return entries_.empty(); }

  template <typename Fn>
  void ForEach(Fn&& fn) {
    for (auto& kv : entries_) fn(kv.second);
  }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& kv : entries_) fn(kv.second);
  }

  /// @brief Ids currently in @p s (copy; safe to mutate the tracker after).
  std::vector<std::string> IdsInState(RequestState s) const {
    std::vector<std::string> out;
    for (const auto& kv : entries_) {
      if (kv.second.state == s) out.push_back(kv.first);
    }
    return out;
  }

 private:
  static uint32_t Index(RequestState s) noexcept {
    return static_cast<uint32_t>(s);
  }

  std::unordered_map<std::string, TrackedRequest> entries_;
  uint32_t counts_[kRequestStateCount] = {};
};

}  // namespace hive

#endif  // HIVE_TRACKING_HPP_
