/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
/**
 * @file watchdog.hpp
 * @brief Slot watchdog: liveness probes and heartbeat timeouts.
 *
 * Every execution pool keeps one SlotWatchdog over its slots. A slot is
 * watched in one of two ways:
 *   - probe:     a function the watchdog calls on each Check(); returning
 *                false means the process/thread behind the slot is gone.
 *   - heartbeat: the monitored thread calls Beat() on the returned
 *                ThreadHeartbeat; silence longer than the timeout means it
 *                is hung.
 *
 * Check() collects transitions under the lock and runs callbacks after
 * releasing it, so a callback may re-enter the owning pool. Callbacks fire
 * on the healthy -> unhealthy edge only, and again on recovery.
 *
 * Typical usage (inside a pool supervisor loop):
 *
 *   hive::SlotWatchdog<64> wd;
 *   wd.SetOnLost(&Pool::OnSlotLost, this);
 *   for (uint32_t i = 0; i < n; ++i) wd.RegisterProbe("slot", &Pool::Probe, this);
 *   while (running) { wd.Check(); sleep(interval); }
 */

#ifndef HIVE_WATCHDOG_HPP_
#define HIVE_WATCHDOG_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace hive {

struct WatchdogSlotIdTag {};
using WatchdogSlotId = NewType<uint32_t, WatchdogSlotIdTag>;

enum class WatchdogError : uint8_t {
  kSlotsFull = 0,   ///< All watchdog slots are occupied.
  kInvalidTimeout,  ///< Timeout value is zero.
  kInvalidProbe,    ///< Probe function is null.
  kNotRegistered,   ///< Slot ID not found or already unregistered.
};

/// POD snapshot of a watchdog slot for diagnostic iteration.
struct WatchdogSlotInfo {
  uint32_t slot_id;
  const char* name;
  bool is_probe;
  uint64_t timeout_us;    ///< 0 for probe slots
  uint64_t last_beat_us;  ///< 0 for probe slots
  bool unhealthy;
};

// ============================================================================
// SlotWatchdog
// ============================================================================

/**
 * @tparam MaxSlots  Maximum number of concurrently watched slots.
 */
template <uint32_t MaxSlots = 64>
class SlotWatchdog final {
  static_assert(MaxSlots > 0, "MaxSlots must be greater than 0");

 public:
  /// @return true while the watched unit is alive.
  using ProbeFn = bool (*)(uint32_t slot_id, void* ctx);
  /// Fired for a probe that turned false or a heartbeat that went silent.
  using LostCallback = void (*)(uint32_t slot_id, const char* name, void* ctx);
  using RecoverCallback = void (*)(uint32_t slot_id, const char* name,
                                   void* ctx);

  struct RegResult {
    WatchdogSlotId id;
    ThreadHeartbeat* heartbeat;  ///< nullptr for probe slots
  };

  SlotWatchdog() noexcept = default;
  ~SlotWatchdog() noexcept { StopAutoCheck(); }

  SlotWatchdog(const SlotWatchdog&) = delete;
  SlotWatchdog& operator=(const SlotWatchdog&) = delete;

  // --------------------------------------------------------------------------
  // Registration
  // --------------------------------------------------------------------------

  /**
   * @brief Watch a thread by heartbeat.
   * @param timeout_ms  Silence longer than this marks the slot unhealthy.
   */
  expected<RegResult, WatchdogError> Register(const char* name,
                                              uint32_t timeout_ms) noexcept {
    if (timeout_ms == 0U) {
      return expected<RegResult, WatchdogError>::error(
          WatchdogError::kInvalidTimeout);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* s = AcquireLocked();
    if (s == nullptr) {
      return expected<RegResult, WatchdogError>::error(
          WatchdogError::kSlotsFull);
    }
    s->name.assign(TruncateToCapacity, name);
    s->probe = nullptr;
    s->probe_ctx = nullptr;
    s->timeout_us = static_cast<uint64_t>(timeout_ms) * 1000ULL;
    s->heartbeat.Beat();
    s->unhealthy = false;
    s->active.store(true, std::memory_order_release);
    return expected<RegResult, WatchdogError>::success(
        RegResult{WatchdogSlotId(Index(s)), &s->heartbeat});
  }

  /**
   * @brief Watch a unit through a liveness probe evaluated on each Check().
   *
   * The probe runs without the watchdog lock held.
   */
  expected<RegResult, WatchdogError> RegisterProbe(const char* name,
                                                   ProbeFn probe,
                                                   void* ctx) noexcept {
    if (probe == nullptr) {
      return expected<RegResult, WatchdogError>::error(
          WatchdogError::kInvalidProbe);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* s = AcquireLocked();
    if (s == nullptr) {
      return expected<RegResult, WatchdogError>::error(
          WatchdogError::kSlotsFull);
    }
    s->name.assign(TruncateToCapacity, name);
    s->probe = probe;
    s->probe_ctx = ctx;
    s->timeout_us = 0;
    s->unhealthy = false;
    s->active.store(true, std::memory_order_release);
    return expected<RegResult, WatchdogError>::success(
        RegResult{WatchdogSlotId(Index(s)), nullptr});
  }

  expected<void, WatchdogError> Unregister(WatchdogSlotId id) noexcept {
    const uint32_t idx = id.value();
    if (idx >= MaxSlots) {
      return expected<void, WatchdogError>::error(
          WatchdogError::kNotRegistered);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!slots_[idx].active.load(std::memory_order_relaxed)) {
      return expected<void, WatchdogError>::error(
          WatchdogError::kNotRegistered);
    }
    slots_[idx].active.store(false, std::memory_order_release);
    return expected<void, WatchdogError>::success();
  }

  /// @brief Beat a heartbeat slot by ID. Lock-free.
  void Feed(WatchdogSlotId id) noexcept {
    const uint32_t idx = id.value();
    if (HIVE_LIKELY(idx < MaxSlots)) {
      slots_[idx].heartbeat.Beat();
    }
  }

  /**
   * @brief Mark a slot healthy again without firing a callback.
   *
   * For owners that replaced the monitored unit inside the lost callback:
   * the next failure of the replacement is then a fresh edge.
   */
  void Reset(WatchdogSlotId id) noexcept {
    const uint32_t idx = id.value();
    if (idx >= MaxSlots) return;
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[idx].unhealthy = false;
    slots_[idx].heartbeat.Beat();
  }

  void SetOnLost(LostCallback fn, void* ctx = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    on_lost_ = fn;
    lost_ctx_ = ctx;
  }

  void SetOnRecovered(RecoverCallback fn, void* ctx = nullptr) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    on_recovered_ = fn;
    recover_ctx_ = ctx;
  }

  // --------------------------------------------------------------------------
  // Check
  // --------------------------------------------------------------------------

  /**
   * @brief Evaluate every slot and fire edge callbacks.
   * @return Number of slots currently unhealthy.
   */
  uint32_t Check() noexcept {
    struct Pending {
      uint32_t slot_id;
      FixedString<32> name;
      bool lost;
    };
    struct ProbeCall {
      uint32_t slot_id;
      ProbeFn fn;
      void* ctx;
    };

    // Phase 1: snapshot probes under lock, evaluate them outside it.
    ProbeCall probes[MaxSlots];
    uint32_t probe_count = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (uint32_t i = 0U; i < MaxSlots; ++i) {
        if (slots_[i].active.load(std::memory_order_acquire) &&
            slots_[i].probe != nullptr) {
          probes[probe_count++] = ProbeCall{i, slots_[i].probe,
                                            slots_[i].probe_ctx};
        }
      }
    }
    bool probe_alive[MaxSlots];
    for (uint32_t i = 0U; i < MaxSlots; ++i) probe_alive[i] = true;
    for (uint32_t i = 0U; i < probe_count; ++i) {
      probe_alive[probes[i].slot_id] =
          probes[i].fn(probes[i].slot_id, probes[i].ctx);
    }

    // Phase 2: collect edges under lock.
    Pending pending[MaxSlots];
    uint32_t pending_count = 0U;
    uint32_t unhealthy = 0U;
    LostCallback on_lost = nullptr;
    RecoverCallback on_recovered = nullptr;
    void* lost_ctx = nullptr;
    void* recover_ctx = nullptr;
    const uint64_t now = SteadyNowUs();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      on_lost = on_lost_;
      lost_ctx = lost_ctx_;
      on_recovered = on_recovered_;
      recover_ctx = recover_ctx_;
      for (uint32_t i = 0U; i < MaxSlots; ++i) {
        Slot& s = slots_[i];
        if (!s.active.load(std::memory_order_acquire)) continue;
        bool bad;
        if (s.probe != nullptr) {
          bad = !probe_alive[i];
        } else {
          const uint64_t last = s.heartbeat.LastBeatUs();
          bad = (now > last) && ((now - last) > s.timeout_us);
        }
        if (bad != s.unhealthy) {
          s.unhealthy = bad;
          pending[pending_count].slot_id = i;
          pending[pending_count].name = s.name;
          pending[pending_count].lost = bad;
          ++pending_count;
        }
        if (s.unhealthy) ++unhealthy;
      }
    }

    // Phase 3: execute callbacks outside lock.
    for (uint32_t i = 0U; i < pending_count; ++i) {
      if (pending[i].lost) {
        if (on_lost != nullptr) {
          on_lost(pending[i].slot_id, pending[i].name.c_str(), lost_ctx);
        }
      } else if (on_recovered != nullptr) {
        on_recovered(pending[i].slot_id, pending[i].name.c_str(),
                     recover_ctx);
      }
    }
    return unhealthy;
  }

  // --------------------------------------------------------------------------
  // Query
  // --------------------------------------------------------------------------

  bool IsUnhealthy(WatchdogSlotId id) const noexcept {
    const uint32_t idx = id.value();
    if (idx >= MaxSlots) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_[idx].active.load(std::memory_order_acquire) &&
           slots_[idx].unhealthy;
  }

  uint32_t ActiveCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      if (slots_[i].active.load(std::memory_order_acquire)) ++count;
    }
    return count;
  }

  static constexpr uint32_t Capacity() noexcept { return MaxSlots; }

  template <typename Fn>
  void ForEachSlot(Fn&& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      const Slot& s = slots_[i];
      if (!s.active.load(std::memory_order_acquire)) continue;
      WatchdogSlotInfo info{};
      info.slot_id = i;
      info.name = s.name.c_str();
      info.is_probe = (s.probe != nullptr);
      info.timeout_us = s.timeout_us;
      info.last_beat_us = info.is_probe ? 0U : s.heartbeat.LastBeatUs();
      info.unhealthy = s.unhealthy;
      fn(info);
    }
  }

  // --------------------------------------------------------------------------
  // Self-driven check
  // --------------------------------------------------------------------------

  /// @brief Run Check() every @p interval_ms on an internal thread.
  void StartAutoCheck(uint32_t interval_ms) noexcept {
    if (interval_ms == 0U) return;
    bool expected_state = false;
    if (!auto_check_running_.compare_exchange_strong(
            expected_state, true, std::memory_order_acq_rel)) {
      return;
    }
    auto_check_thread_ = std::thread([this, interval_ms]() {
      while (auto_check_running_.load(std::memory_order_acquire)) {
        Check();
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
      }
    });
  }

  void StopAutoCheck() noexcept {
    bool expected_state = true;
    if (!auto_check_running_.compare_exchange_strong(
            expected_state, false, std::memory_order_acq_rel)) {
      return;
    }
    if (auto_check_thread_.joinable()) {
      auto_check_thread_.join();
    }
  }

 private:
  struct Slot {
    std::atomic<bool> active{false};
    ThreadHeartbeat heartbeat;
    ProbeFn probe{nullptr};
    void* probe_ctx{nullptr};
    uint64_t timeout_us{0};
    bool unhealthy{false};  ///< Protected by mutex_.
    FixedString<32> name;
  };

  Slot* AcquireLocked() noexcept {
    for (uint32_t i = 0U; i < MaxSlots; ++i) {
      if (!slots_[i].active.load(std::memory_order_relaxed)) return &slots_[i];
    }
    return nullptr;
  }

  uint32_t Index(const Slot* s) const noexcept {
    return static_cast<uint32_t>(s - slots_);
  }

  Slot slots_[MaxSlots]{};
  mutable std::mutex mutex_;
  LostCallback on_lost_{nullptr};
  void* lost_ctx_{nullptr};
  RecoverCallback on_recovered_{nullptr};
  void* recover_ctx_{nullptr};
  std::atomic<bool> auto_check_running_{false};
  std::thread auto_check_thread_;
};

}  // namespace hive

#endif  // HIVE_WATCHDOG_HPP_
