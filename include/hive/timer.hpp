/**
 * @file timer.hpp
 * @brief Loop-driven one-shot deadline queue.
 *
 * Unlike a scheduler thread, DeadlineQueue never fires on its own: the
 * owning event loop asks NextDeadlineUs() to size its poll timeout and
 * collects due payloads with PopExpired(). That keeps every timer action
 * (ETA release, retry countdown, rate-limit wakeup) on the loop thread.
 *
 * Not thread-safe; owned by a single loop.
 */

#ifndef HIVE_TIMER_HPP_
#define HIVE_TIMER_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hive {

struct TimerIdTag {};
using TimerId = NewType<uint64_t, TimerIdTag>;

enum class TimerError : uint8_t { kNotFound = 0 };

// ============================================================================
// DeadlineQueue<Payload>
// ============================================================================

/**
 * @brief Min-heap of (deadline, payload) with lazy cancellation.
 *
 * Deadlines are steady-clock microseconds (SteadyNowUs). Payloads with
 * equal deadlines come out in scheduling order.
 */
template <typename Payload>
class DeadlineQueue final {
 public:
  DeadlineQueue() = default;

  DeadlineQueue(const DeadlineQueue&) = delete;
  DeadlineQueue& operator=(const DeadlineQueue&) = delete;

  /// @brief Schedule @p payload at absolute steady time @p deadline_us.
  TimerId ScheduleAt(uint64_t deadline_us, Payload payload) {
    const uint64_t id = next_id_++;
    heap_.push(HeapEntry{deadline_us, id});
    live_.emplace(id, std::move(payload));
    return TimerId(id);
  }

  /// @brief Schedule @p payload @p delay_us from now.
  TimerId ScheduleAfter(uint64_t delay_us, Payload payload) {
    return ScheduleAt(SteadyNowUs() + delay_us, std::move(payload));
  }

  /// @brief Cancel a pending timer. The heap slot is reclaimed lazily.
  expected<void, TimerError> Cancel(TimerId id) {
    if (live_.erase(id.value()) == 0U) {
      return expected<void, TimerError>::error(TimerError::kNotFound);
    }
    return expected<void, TimerError>::success();
  }

  /// @brief Earliest live deadline, or empty when nothing is scheduled.
  optional<uint64_t> NextDeadlineUs() {
    DropCancelled();
    if (heap_.empty()) return nullopt;
    return heap_.top().deadline_us;
  }

  /**
   * @brief Move every payload due at @p now_us into @p out.
   * @return Number of payloads appended.
   */
  uint32_t PopExpired(uint64_t now_us, std::vector<Payload>& out) {
    uint32_t n = 0;
    while (!heap_.empty() && heap_.top().deadline_us <= now_us) {
      const uint64_t id = heap_.top().id;
      heap_.pop();
      auto it = live_.find(id);
      if (it == live_.end()) continue;  // cancelled
      out.push_back(std::move(it->second));
      live_.erase(it);
      ++n;
    }
    return n;
  }

  size_t Size() const noexcept { return live_.size(); }
  bool Empty() const noexcept { return live_.empty(); }

  void Clear() {
    live_.clear();
    heap_ = Heap();
  }

 private:
  struct HeapEntry {
    uint64_t deadline_us;
    uint64_t id;
  };

  struct Later {
    bool operator()(const HeapEntry& a, const HeapEntry& b) const noexcept {
      if (a.deadline_us != b.deadline_us) return a.deadline_us > b.deadline_us;
      return a.id > b.id;
    }
  };

  using Heap = std::priority_queue<HeapEntry, std::vector<HeapEntry>, Later>;

  void DropCancelled() {
    while (!heap_.empty() && live_.find(heap_.top().id) == live_.end()) {
      heap_.pop();
    }
  }

  Heap heap_;
  std::unordered_map<uint64_t, Payload> live_;
  uint64_t next_id_ = 1;
};

}  // namespace hive

#endif  // HIVE_TIMER_HPP_
