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
 * @file pool.hpp
 * @brief Execution pool contract shared by every concurrency strategy.
 *
 * Architecture:
 *   Dispatcher --Submit(req, on_complete)--> ExecutionPool
 *                                               | pending (bounded)
 *                                        slot[0..N-1]  (process / thread /
 *                                               |       green thread / inline)
 *   on_complete(Outcome) <----- exactly once ---+
 *
 * Every strategy keeps a CompletionLedger keyed by request id. A dispatch
 * to a slot binds a fresh token; an outcome is delivered only when its
 * token still matches, so a late result from an abandoned thread or a
 * killed green thread is discarded instead of being reported twice.
 * Callbacks always run after the pool lock is released.
 */

#ifndef HIVE_POOL_HPP_
#define HIVE_POOL_HPP_

#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/registry.hpp"
#include "hive/task.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifndef HIVE_POOL_MAX_SLOTS
#define HIVE_POOL_MAX_SLOTS 64U
#endif

namespace hive {

static constexpr uint32_t kMaxPoolSlots = HIVE_POOL_MAX_SLOTS;

// ============================================================================
// Strategy
// ============================================================================

enum class PoolStrategy : uint8_t {
  kProcessFork = 0,
  kProcessSpawn,
  kGreenThread,
  kNativeThread,
  kSolo
};

inline const char* PoolStrategyName(PoolStrategy s) noexcept {
  switch (s) {
    case PoolStrategy::kProcessFork:  return "prefork";
    case PoolStrategy::kProcessSpawn: return "spawn";
    case PoolStrategy::kGreenThread:  return "green";
    case PoolStrategy::kNativeThread: return "threads";
    case PoolStrategy::kSolo:         return "solo";
    default:                          return "unknown";
  }
}

/// @brief Accepts the canonical names plus the long aliases.
inline optional<PoolStrategy> ParsePoolStrategy(const char* name) noexcept {
  if (name == nullptr) return nullopt;
  struct Entry {
    const char* name;
    PoolStrategy strategy;
  };
  static constexpr Entry kTable[] = {
      {"prefork", PoolStrategy::kProcessFork},
      {"fork", PoolStrategy::kProcessFork},
      {"process-fork", PoolStrategy::kProcessFork},
      {"spawn", PoolStrategy::kProcessSpawn},
      {"process-spawn", PoolStrategy::kProcessSpawn},
      {"green", PoolStrategy::kGreenThread},
      {"green-thread", PoolStrategy::kGreenThread},
      {"threads", PoolStrategy::kNativeThread},
      {"thread", PoolStrategy::kNativeThread},
      {"native-thread", PoolStrategy::kNativeThread},
      {"solo", PoolStrategy::kSolo},
  };
  for (const auto& e : kTable) {
    if (std::strcmp(name, e.name) == 0) return e.strategy;
  }
  return nullopt;
}

/// @brief Whether this build/host can run @p s.
inline bool IsStrategySupported(PoolStrategy s) noexcept {
  switch (s) {
    case PoolStrategy::kProcessFork:
    case PoolStrategy::kProcessSpawn:
#if defined(HIVE_HAS_FORK)
      return true;
#else
      return false;
#endif
    case PoolStrategy::kGreenThread:
#if defined(HIVE_HAS_UCONTEXT)
      return true;
#else
      return false;
#endif
    case PoolStrategy::kNativeThread:
    case PoolStrategy::kSolo:
      return true;
    default:
      return false;
  }
}

// ============================================================================
// Configuration / errors
// ============================================================================

struct PoolConfig {
  PoolStrategy strategy = PoolStrategy::kNativeThread;
  uint32_t concurrency = 4;
  uint32_t max_tasks_per_child = 0;    ///< 0: unlimited
  uint64_t max_memory_per_child = 0;   ///< RSS bytes, 0: unlimited
  uint32_t watchdog_interval_ms = 100;
  uint64_t default_soft_limit_ms = 0;  ///< used when task/message set none
  uint64_t default_hard_limit_ms = 0;
  std::string name = "hive";
  std::string hostname;
  std::string spawn_executable;        ///< empty: /proc/self/exe
  std::vector<std::string> spawn_args;
  size_t green_stack_size = 256U * 1024U;
};

enum class PoolError : uint8_t {
  kUnsupportedStrategy = 0,
  kStartFailed,
  kInvalidConfig,
  kAlreadyStarted,
  kNotRunning,
  kShuttingDown,
  kQueueFull,
  kDuplicateRequest,
  kUnknownRequest,
  kInvalidSlot
};

inline const char* PoolErrorName(PoolError e) noexcept {
  switch (e) {
    case PoolError::kUnsupportedStrategy: return "UnsupportedStrategy";
    case PoolError::kStartFailed:         return "StartFailed";
    case PoolError::kInvalidConfig:       return "InvalidConfig";
    case PoolError::kAlreadyStarted:      return "AlreadyStarted";
    case PoolError::kNotRunning:          return "NotRunning";
    case PoolError::kShuttingDown:        return "ShuttingDown";
    case PoolError::kQueueFull:           return "QueueFull";
    case PoolError::kDuplicateRequest:    return "DuplicateRequest";
    case PoolError::kUnknownRequest:      return "UnknownRequest";
    case PoolError::kInvalidSlot:         return "InvalidSlot";
    default:                              return "Unknown";
  }
}

/// @brief Why Terminate() was called; selects the reported outcome kind.
enum class TerminateReason : uint8_t {
  kRevoked = 0,  ///< -> worker_lost ("Terminated")
  kTimeLimit     ///< -> timeout
};

using CompletionFn = std::function<void(const Outcome&)>;

enum class SlotState : uint8_t { kStarting = 0, kIdle, kBusy, kStopped };

inline const char* SlotStateName(SlotState s) noexcept {
  switch (s) {
    case SlotState::kStarting: return "starting";
    case SlotState::kIdle:     return "idle";
    case SlotState::kBusy:     return "busy";
    case SlotState::kStopped:  return "stopped";
    default:                   return "unknown";
  }
}

/// @brief Diagnostic snapshot of one slot.
struct SlotInfo {
  uint32_t id = 0;
  SlotState state = SlotState::kStarting;
  std::string request_id;  ///< empty when idle
  uint64_t started_us = 0;
  int32_t pid = 0;         ///< process strategies only
  uint32_t tasks_completed = 0;
  uint64_t generation = 0; ///< bumped each time the slot is recycled
};

struct PoolStats {
  uint64_t submitted{0U};
  uint64_t completed{0U};
  uint64_t succeeded{0U};
  uint64_t failed{0U};
  uint64_t timeouts{0U};
  uint64_t worker_lost{0U};
  uint64_t restarts{0U};
  uint32_t pending{0U};      ///< accepted, not yet on a slot
  uint32_t outstanding{0U};  ///< accepted, no outcome yet
};

// ============================================================================
// ExecutionPool
// ============================================================================

/**
 * @brief Strategy-independent pool contract.
 *
 * Submit/Terminate/RestartSlot never block on task execution. Outcomes
 * are delivered on a pool-owned thread (or inside Drive() for the solo
 * strategy); the callback should only hand the outcome over.
 */
class ExecutionPool {
 public:
  virtual ~ExecutionPool() = default;

  virtual PoolStrategy Strategy() const noexcept = 0;

  /// @brief Bring all slots up. Fails with kStartFailed when a slot cannot.
  virtual expected<void, PoolError> Start() = 0;

  /**
   * @brief Queue @p req; @p on_complete runs exactly once with its outcome.
   * @return kNotRunning, kShuttingDown, kDuplicateRequest (id in flight),
   *         or kQueueFull (all slots busy and the pending queue is full).
   */
  virtual expected<void, PoolError> Submit(const TaskRequest& req,
                                           CompletionFn on_complete) = 0;

  /// @brief Recycle a slot; a busy slot is recycled after its task ends.
  virtual expected<void, PoolError> RestartSlot(uint32_t slot_id) = 0;

  /**
   * @brief Force-stop an in-flight request. Asynchronous: the outcome
   *        (timeout or worker_lost, per @p reason) arrives via the callback.
   */
  virtual expected<void, PoolError> Terminate(
      const std::string& request_id,
      TerminateReason reason = TerminateReason::kRevoked) = 0;

  /**
   * @brief Stop accepting work, wait up to @p grace_ms for in-flight work,
   *        then force-stop what remains. Idempotent.
   */
  virtual void Shutdown(uint32_t grace_ms) = 0;

  /// @brief Run queued work on the caller's thread. Only solo needs it.
  virtual uint32_t Drive() { return 0U; }

  virtual uint32_t Concurrency() const noexcept = 0;
  virtual uint32_t Outstanding() const = 0;
  virtual bool IsRunning() const noexcept = 0;
  virtual std::vector<SlotInfo> Slots() const = 0;
  virtual PoolStats GetStats() const = 0;
};

// ============================================================================
// Shared implementation pieces
// ============================================================================

namespace detail {

/**
 * @brief request id -> completion callback, with per-dispatch tokens.
 *
 * Not thread-safe; guarded by the owning pool's mutex.
 */
class CompletionLedger {
 public:
  /// @return false if @p id is already outstanding.
  bool Add(const std::string& id, CompletionFn fn) {
    return entries_.emplace(id, Entry{std::move(fn), 0U}).second;
  }

  /// @brief Start a new dispatch of @p id. @return its token (never 0).
  uint64_t Bind(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return 0U;
    it->second.token = ++next_token_;
    return it->second.token;
  }

  /**
   * @brief Remove @p id and return its callback if @p token is current.
   *        Token 0 matches an entry that was never dispatched or any entry
   *        when @p any is set.
   */
  CompletionFn Take(const std::string& id, uint64_t token, bool any = false) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return CompletionFn();
    if (!any && it->second.token != token) return CompletionFn();
    CompletionFn fn = std::move(it->second.fn);
    entries_.erase(it);
    return fn;
  }

  bool Contains(const std::string& id) const {
    return entries_.find(id) != entries_.end();
  }

  uint64_t TokenOf(const std::string& id) const {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? it->second.token : 0U;
  }

  size_t Size() const noexcept { return entries_.size(); }
  bool Empty() const noexcept { return entries_.empty(); }

  std::vector<std::string> Ids() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
  }

 private:
  struct Entry {
    CompletionFn fn;
    uint64_t token;
  };
  std::unordered_map<std::string, Entry> entries_;
  uint64_t next_token_ = 0U;
};

/// @brief Outcome waiting for delivery outside the pool lock.
struct Delivery {
  CompletionFn fn;
  Outcome outcome;
};
using Deliveries = std::vector<Delivery>;

inline void FlushDeliveries(Deliveries& d) {
  for (auto& x : d) x.fn(x.outcome);
  d.clear();
}

inline expected<void, PoolError> ValidatePoolConfig(const PoolConfig& cfg) {
  if (!IsStrategySupported(cfg.strategy)) {
    HIVE_LOG_ERROR("Pool", "strategy '%s' is not available on this platform",
                   PoolStrategyName(cfg.strategy));
    return expected<void, PoolError>::error(PoolError::kUnsupportedStrategy);
  }
  if (cfg.concurrency == 0U || cfg.concurrency > kMaxPoolSlots) {
    HIVE_LOG_ERROR("Pool", "concurrency %u outside [1, %u]", cfg.concurrency,
                   kMaxPoolSlots);
    return expected<void, PoolError>::error(PoolError::kInvalidConfig);
  }
  if (cfg.watchdog_interval_ms == 0U) {
    return expected<void, PoolError>::error(PoolError::kInvalidConfig);
  }
  return expected<void, PoolError>::success();
}

/**
 * @brief Bookkeeping every strategy shares: run state, ledger, bounded
 *        pending queue, statistics and the drain wait used by Shutdown().
 */
class PoolBase : public ExecutionPool {
 public:
  PoolBase(const PoolConfig& cfg, const TaskRegistry& registry,
           PoolStrategy strategy)
      : config_(cfg), registry_(registry) {
    config_.strategy = strategy;
    if (config_.hostname.empty()) config_.hostname = "localhost";
  }

  PoolStrategy Strategy() const noexcept override { return config_.strategy; }

  uint32_t Concurrency() const noexcept override { return config_.concurrency; }

  uint32_t Outstanding() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(ledger_.Size());
  }

  bool IsRunning() const noexcept override {
    return state_.load(std::memory_order_acquire) == RunState::kRunning;
  }

  PoolStats GetStats() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats s = stats_;
    s.pending = static_cast<uint32_t>(pending_.size());
    s.outstanding = static_cast<uint32_t>(ledger_.Size());
    return s;
  }

  const PoolConfig& Config() const noexcept { return config_; }

 protected:
  enum class RunState : uint8_t { kCreated = 0, kRunning, kShuttingDown, kStopped };

  /// @brief Checks shared by every Start(). Caller holds mutex_.
  expected<void, PoolError> BeginStartLocked() {
    if (state_.load(std::memory_order_acquire) != RunState::kCreated) {
      return expected<void, PoolError>::error(PoolError::kAlreadyStarted);
    }
    return ValidatePoolConfig(config_);
  }

  /**
   * @brief Admission control. Caller holds mutex_.
   *
   * At most `concurrency` requests wait beyond those occupying slots.
   */
  expected<void, PoolError> AdmitLocked(const TaskRequest& req,
                                        CompletionFn& fn) {
    const RunState st = state_.load(std::memory_order_acquire);
    if (st == RunState::kCreated) {
      return expected<void, PoolError>::error(PoolError::kNotRunning);
    }
    if (st != RunState::kRunning) {
      return expected<void, PoolError>::error(PoolError::kShuttingDown);
    }
    if (ledger_.Contains(req.id)) {
      return expected<void, PoolError>::error(PoolError::kDuplicateRequest);
    }
    if (ledger_.Size() >= 2U * static_cast<size_t>(config_.concurrency)) {
      return expected<void, PoolError>::error(PoolError::kQueueFull);
    }
    (void)ledger_.Add(req.id, std::move(fn));
    ++stats_.submitted;
    return expected<void, PoolError>::success();
  }

  /**
   * @brief Retire @p o.request_id if @p token is current; the callback is
   *        queued on @p out. @return false for a stale outcome.
   */
  bool CompleteLocked(Outcome&& o, uint64_t token, Deliveries& out,
                      bool any_token = false) {
    CompletionFn fn = ledger_.Take(o.request_id, token, any_token);
    if (!fn) {
      HIVE_LOG_DEBUG("Pool", "discarding stale outcome for %s (%s)",
                     o.request_id.c_str(), OutcomeKindName(o.kind));
      return false;
    }
    ++stats_.completed;
    switch (o.kind) {
      case OutcomeKind::kSuccess:    ++stats_.succeeded; break;
      case OutcomeKind::kFailure:    ++stats_.failed; break;
      case OutcomeKind::kTimeout:    ++stats_.timeouts; break;
      case OutcomeKind::kWorkerLost: ++stats_.worker_lost; break;
      default: break;
    }
    out.push_back(Delivery{std::move(fn), std::move(o)});
    if (ledger_.Empty()) drained_cv_.notify_all();
    return true;
  }

  /// @brief Pop a pending request; false when none.
  bool TakePendingLocked(TaskRequest* out) {
    if (pending_.empty()) return false;
    *out = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }

  /// @brief Remove a not-yet-started request by id.
  bool RemovePendingLocked(const std::string& id) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (it->id == id) {
        pending_.erase(it);
        return true;
      }
    }
    return false;
  }

  /// @brief Report every pending request as lost. Caller holds mutex_.
  void FailPendingLocked(const char* why, Deliveries& out) {
    while (!pending_.empty()) {
      TaskRequest req = std::move(pending_.front());
      pending_.pop_front();
      (void)CompleteLocked(Outcome::WorkerLost(req.id, why, kNoSlot), 0U, out,
                           true);
    }
  }

  /// @brief Outcome reported when a running request is force-stopped.
  static Outcome TerminatedOutcome(const std::string& id, TerminateReason r,
                                   uint64_t limit_ms, uint64_t runtime_us,
                                   uint32_t slot) {
    if (r == TerminateReason::kTimeLimit) {
      return Outcome::Timeout(id, limit_ms, runtime_us, slot);
    }
    Outcome o = Outcome::WorkerLost(id, "Terminated", slot,
                                    error_type::kTerminated);
    o.runtime_us = runtime_us;
    return o;
  }

  /**
   * @brief Block until every outstanding request completed or @p grace_ms
   *        elapsed. @return true when drained.
   */
  bool WaitDrained(std::unique_lock<std::mutex>& lock, uint32_t grace_ms) {
    if (ledger_.Empty()) return true;
    if (grace_ms == 0U) return false;
    return drained_cv_.wait_for(lock, std::chrono::milliseconds(grace_ms),
                                [this] { return ledger_.Empty(); });
  }

  EffectiveLimits LimitsFor(const TaskRequest& req) const {
    auto def = registry_.Lookup(req.task);
    return ResolveLimits(req, def.has_value() ? def.value() : nullptr,
                         config_.default_soft_limit_ms,
                         config_.default_hard_limit_ms);
  }

  PoolConfig config_;
  const TaskRegistry& registry_;
  mutable std::mutex mutex_;
  std::condition_variable drained_cv_;
  std::atomic<RunState> state_{RunState::kCreated};
  CompletionLedger ledger_;
  std::deque<TaskRequest> pending_;
  PoolStats stats_;
};

}  // namespace detail

}  // namespace hive

#endif  // HIVE_POOL_HPP_
