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
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
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
 * @file dispatcher.hpp
 * @brief Single-threaded dispatch loop between a Broker and an ExecutionPool.
 *
 * One RunOnce() iteration:
 *   1. retry broker settlements that failed while it was unavailable
 *   2. wait on the waker (pool outcomes, revokes, stop) and the broker fd
 *   3. drain posted events
 *   4. fire ETA / retry / rate-limit timers
 *   5. force-terminate requests past their hard deadline plus grace
 *   6. consume messages while the prefetch window has room
 *   7. submit eligible requests (concurrency first, then rate tokens)
 *   8. pool.Drive() for strategies that run on this thread
 *
 * Only the loop thread touches tracker, timers and rate limiter.
 * RequestStop(), Revoke() and GetStats() may be called from any thread.
 */

#ifndef HIVE_DISPATCHER_HPP_
#define HIVE_DISPATCHER_HPP_

#include "hive/broker.hpp"
#include "hive/codec.hpp"
#include "hive/io_poller.hpp"
#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/pool.hpp"
#include "hive/rate_limit.hpp"
#include "hive/registry.hpp"
#include "hive/retry.hpp"
#include "hive/task.hpp"
#include "hive/timer.hpp"
#include "hive/tracking.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>

#include <algorithm>
#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace hive {

// ============================================================================
// Configuration / errors / stats
// ============================================================================

/// Where a scheduled retry waits out its countdown.
enum class RetryRoute : uint8_t {
  kInternal = 0,  ///< local timer; the original delivery stays unsettled
  kBroker         ///< republish with ETA, then ack the original
};

inline const char* RetryRouteName(RetryRoute r) noexcept {
  return (r == RetryRoute::kBroker) ? "broker" : "internal";
}

enum class StopMode : uint8_t { kWarm = 0, kCold };

struct DispatcherConfig {
  std::string hostname = "localhost";
  uint32_t prefetch_multiplier = 4U;  ///< window = concurrency * this; 0: none
  uint32_t poll_interval_ms = 100U;
  uint32_t sweep_interval_ms = 1000U;
  uint32_t hard_limit_grace_ms = 1000U;
  uint32_t shutdown_grace_ms = 10000U;  ///< warm stop wait for in-flight work
  uint64_t default_soft_limit_ms = 0U;
  uint64_t default_hard_limit_ms = 0U;
  RetryRoute retry_route = RetryRoute::kInternal;
  uint32_t revoked_capacity = 10000U;
  uint64_t rng_seed = 0U;  ///< 0: seeded from std::random_device
};

enum class DispatchError : uint8_t {
  kNotStarted = 0,
  kAlreadyStarted,
  kStopped,
  kPoolNotRunning,
  kPollFailed,
  kBrokerUnavailable
};

inline const char* DispatchErrorName(DispatchError e) noexcept {
  switch (e) {
    case DispatchError::kNotStarted:        return "NotStarted";
    case DispatchError::kAlreadyStarted:    return "AlreadyStarted";
    case DispatchError::kStopped:           return "Stopped";
    case DispatchError::kPoolNotRunning:    return "PoolNotRunning";
    case DispatchError::kPollFailed:        return "PollFailed";
    case DispatchError::kBrokerUnavailable: return "BrokerUnavailable";
    default:                                return "Unknown";
  }
}

struct TaskStats {
  uint64_t received = 0U;
  uint64_t succeeded = 0U;
  uint64_t failed = 0U;
  uint64_t retried = 0U;
  uint64_t revoked = 0U;
  uint64_t total_runtime_us = 0U;
};

struct DispatcherStats {
  uint64_t received = 0U;
  uint64_t dispatched = 0U;
  uint64_t succeeded = 0U;
  uint64_t failed = 0U;
  uint64_t timeouts = 0U;
  uint64_t worker_lost = 0U;
  uint64_t retried = 0U;
  uint64_t revoked = 0U;
  uint64_t expired = 0U;
  uint64_t rejected = 0U;       ///< rejected without requeue
  uint64_t requeued = 0U;
  uint64_t decode_errors = 0U;
  uint64_t unknown_tasks = 0U;
  uint64_t duplicates = 0U;
  uint64_t store_failures = 0U;
  uint64_t backlog = 0U;        ///< settlements waiting for the broker
  std::map<std::string, TaskStats> per_task;
};

namespace detail {

/// @brief Insertion-ordered id set that forgets its oldest entries.
class BoundedIdSet final {
 public:
  explicit BoundedIdSet(uint32_t capacity) noexcept
      : capacity_(capacity == 0U ? 1U : capacity) {}

  void Add(const std::string& id) {
    if (!ids_.insert(id).second) return;
    order_.push_back(id);
    while (order_.size() > capacity_) {
      ids_.erase(order_.front());
      order_.pop_front();
    }
  }

  bool Contains(const std::string& id) const {
    return ids_.find(id) != ids_.end();
  }

  size_t Size() const noexcept { return ids_.size(); }

 private:
  uint32_t capacity_;
  std::deque<std::string> order_;
  std::unordered_set<std::string> ids_;
};

}  // namespace detail

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final {
 public:
  Dispatcher(const DispatcherConfig& cfg, TaskRegistry& registry,
             ExecutionPool& pool, Broker& broker,
             ResultBackend* backend = nullptr)
      : config_(cfg),
        registry_(registry),
        pool_(pool),
        broker_(broker),
        backend_(backend),
        revoked_(cfg.revoked_capacity),
        rng_(cfg.rng_seed != 0U ? cfg.rng_seed
                                : static_cast<uint64_t>(std::random_device{}())) {
    if (config_.poll_interval_ms == 0U) config_.poll_interval_ms = 1U;
  }

  ~Dispatcher() {
    // Outcome callbacks capture this; no pool thread may outlive us.
    if (state_.load(std::memory_order_acquire) == State::kRunning ||
        state_.load(std::memory_order_acquire) == State::kStopping) {
      pool_.Shutdown(0U);
    }
  }

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  /**
   * @brief Freeze the registry and begin consuming.
   * @return kAlreadyStarted, kPoolNotRunning, or kPollFailed.
   */
  expected<void, DispatchError> Start() {
    using R = expected<void, DispatchError>;
    if (state_.load(std::memory_order_acquire) != State::kCreated) {
      return R::error(DispatchError::kAlreadyStarted);
    }
    if (!pool_.IsRunning()) return R::error(DispatchError::kPoolNotRunning);
    if (!poller_.IsValid() || !waker_.IsValid() ||
        !poller_.Add(waker_.Fd(), static_cast<uint8_t>(IoEvent::kReadable))) {
      HIVE_LOG_ERROR("Dispatcher", "poller setup failed");
      return R::error(DispatchError::kPollFailed);
    }
    registry_.Freeze();
    registry_.ForEach([this](const TaskDefinition& def) {
      auto rate = ParseRateLimit(def.options.rate_limit);
      if (rate.has_value() && *rate > 0.0) {
        rate_limiter_.Configure(def.name, *rate);
        HIVE_LOG_INFO("Dispatcher", "task '%s' rate limited to %.3f/s",
                      def.name.c_str(), *rate);
      }
    });
    next_sweep_us_ = SteadyNowUs() + SweepIntervalUs();
    state_.store(State::kRunning, std::memory_order_release);
    HIVE_LOG_INFO("Dispatcher",
                  "[%s] consuming: concurrency=%u prefetch=%u retry=%s",
                  config_.hostname.c_str(), pool_.Concurrency(),
                  PrefetchWindow(), RetryRouteName(config_.retry_route));
    return R::success();
  }

  /**
   * @brief One loop iteration, waiting at most @p max_wait_ms.
   * @return Units of work done (messages, events, timers, submissions), or
   *         kNotStarted / kStopped / kPollFailed, or kBrokerUnavailable
   *         when the broker failed during this iteration. Events and
   *         timers were still processed in that case.
   */
  expected<uint32_t, DispatchError> RunOnce(uint32_t max_wait_ms) {
    using R = expected<uint32_t, DispatchError>;
    const State st = state_.load(std::memory_order_acquire);
    if (st == State::kCreated) return R::error(DispatchError::kNotStarted);
    if (st == State::kStopped) return R::error(DispatchError::kStopped);

    broker_down_ = false;
    uint32_t work = 0U;
    if (!FlushBacklog()) broker_down_ = true;

    UpdateBrokerWatch();
    auto w = poller_.Wait(ComputeWaitMs(max_wait_ms));
    if (!w) {
      HIVE_LOG_ERROR("Dispatcher", "poll failed");
      return R::error(DispatchError::kPollFailed);
    }
    waker_.Drain();

    work += DrainEvents();
    work += FireTimers(SteadyNowUs());
    work += SweepHardLimits(SteadyNowUs());

    if (state_.load(std::memory_order_acquire) == State::kRunning &&
        !broker_down_) {
      work += Consume();
    }
    if (state_.load(std::memory_order_acquire) != State::kStopped) {
      work += ProcessReady();
      work += pool_.Drive();
    }
    if (state_.load(std::memory_order_acquire) == State::kStopping) {
      work += DrainEvents();
      AdvanceStop();
    }
    if (broker_down_) return R::error(DispatchError::kBrokerUnavailable);
    return R::success(work);
  }

  /**
   * @brief Loop until stopped. Broker outages are logged and retried with
   *        a growing wait (up to 5 s); pool outcomes keep flowing meanwhile.
   */
  expected<void, DispatchError> Run() {
    using R = expected<void, DispatchError>;
    uint32_t wait_ms = config_.poll_interval_ms;
    bool outage = false;
    while (true) {
      auto r = RunOnce(wait_ms);
      if (r) {
        if (outage) {
          HIVE_LOG_INFO("Dispatcher", "broker available again");
          outage = false;
        }
        wait_ms = config_.poll_interval_ms;
        continue;
      }
      switch (r.get_error()) {
        case DispatchError::kStopped:
          return R::success();
        case DispatchError::kBrokerUnavailable:
          if (!outage) {
            HIVE_LOG_WARN("Dispatcher", "broker unavailable, backing off");
            outage = true;
          }
          wait_ms = std::min<uint32_t>(std::max<uint32_t>(wait_ms, 50U) * 2U,
                                       kMaxBackoffMs);
          break;
        default:
          HIVE_LOG_ERROR("Dispatcher", "loop failed: %s",
                         DispatchErrorName(r.get_error()));
          return R::error(r.get_error());
      }
    }
  }

  /// @brief Ask the loop to stop. A cold request upgrades a warm stop.
  void RequestStop(StopMode mode) { Post(Event::Stop(mode)); }

  /// @brief Revoke @p request_id: drop it if queued, terminate it if running.
  void Revoke(const std::string& request_id) {
    Post(Event::Revoke(request_id));
  }

  bool IsRunning() const noexcept {
    return state_.load(std::memory_order_acquire) == State::kRunning;
  }

  bool IsStopped() const noexcept {
    return state_.load(std::memory_order_acquire) == State::kStopped;
  }

  DispatcherStats GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return stats_;
  }

  /// Loop thread only.
  const RequestTracker& Tracker() const noexcept { return tracker_; }

  uint32_t PrefetchWindow() const noexcept {
    return pool_.Concurrency() * config_.prefetch_multiplier;
  }

  const DispatcherConfig& Config() const noexcept { return config_; }

 private:
  static constexpr uint32_t kMaxBackoffMs = 5000U;
  static constexpr uint32_t kMaxConsumeBatch = 1024U;
  /// Longest ETA hold or retry countdown, about ten years.
  static constexpr uint64_t kMaxHoldMs = 3650ULL * 24U * 3600U * 1000U;

  enum class State : uint8_t { kCreated = 0, kRunning, kStopping, kStopped };

  struct Event {
    enum class Kind : uint8_t { kOutcome = 0, kRevoke, kStop };
    Kind kind = Kind::kOutcome;
    Outcome outcome;
    std::string id;
    StopMode mode = StopMode::kWarm;

    static Event FromOutcome(const Outcome& o) {
      Event e;
      e.kind = Kind::kOutcome;
      e.outcome = o;
      return e;
    }
    static Event Revoke(const std::string& id) {
      Event e;
      e.kind = Kind::kRevoke;
      e.id = id;
      return e;
    }
    static Event Stop(StopMode m) {
      Event e;
      e.kind = Kind::kStop;
      e.mode = m;
      return e;
    }
  };

  struct TimerEvent {
    enum class Kind : uint8_t { kEta = 0, kRetry, kRateWake };
    Kind kind;
    std::string key;  ///< request id, or task name for kRateWake
  };

  struct Settlement {
    uint64_t tag;
    std::string request_id;
    bool ack;
    bool requeue;
    bool has_reason;
    TaskError reason;
  };

  // -- Event queue (any thread) --

  void Post(Event&& ev) {
    {
      std::lock_guard<std::mutex> lock(events_mu_);
      events_.push_back(std::move(ev));
    }
    waker_.Notify();
  }

  uint32_t DrainEvents() {
    std::vector<Event> batch;
    {
      std::lock_guard<std::mutex> lock(events_mu_);
      batch.swap(events_);
    }
    for (auto& ev : batch) {
      switch (ev.kind) {
        case Event::Kind::kOutcome: HandleOutcome(ev.outcome); break;
        case Event::Kind::kRevoke:  HandleRevoke(ev.id); break;
        case Event::Kind::kStop:    BeginStop(ev.mode); break;
      }
    }
    return static_cast<uint32_t>(batch.size());
  }

  bool HasQueuedEvents() {
    std::lock_guard<std::mutex> lock(events_mu_);
    return !events_.empty();
  }

  // -- Waiting --

  int32_t ComputeWaitMs(uint32_t max_wait_ms) {
    if (HasQueuedEvents()) return 0;
    uint64_t wait_us = static_cast<uint64_t>(max_wait_ms) * 1000U;
    const uint64_t now = SteadyNowUs();
    auto next = timers_.NextDeadlineUs();
    if (next.has_value()) wait_us = std::min(wait_us, (*next > now) ? *next - now : 0U);
    if (tracker_.CountInState(RequestState::kDispatched) != 0U) {
      wait_us = std::min(wait_us, (next_sweep_us_ > now) ? next_sweep_us_ - now : 0U);
    }
    if (broker_.ReadyFd() < 0 || !backlog_.empty()) {
      wait_us = std::min<uint64_t>(wait_us, config_.poll_interval_ms * 1000ULL);
    }
    if (state_.load(std::memory_order_acquire) == State::kStopping) {
      wait_us = std::min<uint64_t>(wait_us, config_.poll_interval_ms * 1000ULL);
    }
    return static_cast<int32_t>(std::min<uint64_t>(
        (wait_us + 999U) / 1000U, static_cast<uint64_t>(INT32_MAX)));
  }

  /// Watch the broker fd only while there is window room, or a readable
  /// fd with a full window would spin the loop.
  void UpdateBrokerWatch() {
    const int32_t fd = broker_.ReadyFd();
    if (fd < 0) return;
    const bool want = state_.load(std::memory_order_acquire) == State::kRunning &&
                      HasWindowRoom();
    if (want == broker_watched_) return;
    if (want) {
      broker_watched_ =
          poller_.Add(fd, static_cast<uint8_t>(IoEvent::kReadable)).has_value();
    } else {
      (void)poller_.Remove(fd);
      broker_watched_ = false;
    }
  }

  bool HasWindowRoom() const noexcept {
    const uint32_t window = PrefetchWindow();
    return window == 0U || tracker_.CountOccupying() < window;
  }

  // -- Consuming --

  uint32_t Consume() {
    uint32_t n = 0U;
    while (n < kMaxConsumeBatch && HasWindowRoom()) {
      auto r = broker_.Receive(0U);
      if (!r) {
        HIVE_LOG_WARN("Dispatcher", "receive failed: %s",
                      BrokerErrorName(r.get_error()));
        broker_down_ = true;
        break;
      }
      if (!r.value().has_value()) break;
      HandleMessage(std::move(*r.value()));
      ++n;
    }
    return n;
  }

  void HandleMessage(BrokerMessage&& msg) {
    Bump([](DispatcherStats& s) { ++s.received; });

    auto decoded = DecodeTaskMessage(msg.body);
    if (!decoded) {
      HIVE_LOG_ERROR("Dispatcher", "undecodable message tag=%llu: %s",
                     static_cast<unsigned long long>(msg.delivery_tag),
                     CodecErrorName(decoded.get_error()));
      Bump([](DispatcherStats& s) { ++s.decode_errors; ++s.rejected; });
      Settle(Settlement{msg.delivery_tag, std::string(), false, false, true,
                        TaskError{error_type::kDecodeError,
                                  CodecErrorName(decoded.get_error()), false}});
      return;
    }
    TaskRequest req = std::move(decoded.value());
    req.delivery_tag = msg.delivery_tag;
    if (req.queue.empty()) req.queue = msg.queue;

    if (tracker_.Contains(req.id)) {
      HIVE_LOG_WARN("Dispatcher", "%s: duplicate of a live request, rejected",
                    req.id.c_str());
      Bump([](DispatcherStats& s) { ++s.duplicates; ++s.rejected; });
      Settle(Settlement{msg.delivery_tag, req.id, false, false, true,
                        TaskError{"DuplicateRequest", "id already in flight", false}});
      return;
    }

    auto def = registry_.Lookup(req.task);
    if (!def) {
      HIVE_LOG_ERROR("Dispatcher", "%s: unknown task '%s'", req.id.c_str(),
                     req.task.c_str());
      TaskError err{error_type::kUnknownTask,
                    "task '" + req.task + "' is not registered", false};
      Bump([](DispatcherStats& s) { ++s.unknown_tasks; ++s.rejected; });
      StoreResult(req, nullptr, ResultStatus::kFailure, nullptr, err, 0U);
      Settle(Settlement{msg.delivery_tag, req.id, false, false, true, err});
      return;
    }
    const TaskDefinition* definition = def.value();
    BumpTask(req.task, [](TaskStats& t) { ++t.received; });

    if (revoked_.Contains(req.id)) {
      HIVE_LOG_INFO("Dispatcher", "%s: revoked before receipt, discarded",
                    req.id.c_str());
      DiscardUntracked(req, definition, error_type::kRevoked, "revoked");
      return;
    }
    if (IsExpired(req)) {
      HIVE_LOG_INFO("Dispatcher", "%s: expired before receipt", req.id.c_str());
      Bump([](DispatcherStats& s) { ++s.expired; });
      DiscardUntracked(req, definition, error_type::kExpired, "expired");
      return;
    }

    TrackedRequest entry;
    entry.request = std::move(req);
    entry.definition = definition;
    entry.received_us = SteadyNowUs();
    auto ins = tracker_.Insert(std::move(entry));
    if (!ins) return;  // Contains() was checked above
    TrackedRequest* e = ins.value();
    HIVE_LOG_DEBUG("Dispatcher", "%s: received %s[%s] tag=%llu",
                   e->request.id.c_str(), e->request.task.c_str(),
                   e->request.queue.c_str(),
                   static_cast<unsigned long long>(e->request.delivery_tag));
    HoldOrRelease(*e);
  }

  /// RECEIVED -> ELIGIBLE now, or after its ETA.
  void HoldOrRelease(TrackedRequest& e) {
    const uint64_t wall = WallNowMs();
    if (e.request.eta_ms > wall) {
      const uint64_t delay_us =
          std::min<uint64_t>(e.request.eta_ms - wall, kMaxHoldMs) * 1000U;
      e.due_us = SteadyNowUs() + delay_us;
      e.timer = timers_.ScheduleAt(
          e.due_us, TimerEvent{TimerEvent::Kind::kEta, e.request.id});
      HIVE_LOG_DEBUG("Dispatcher", "%s: held %llums for eta",
                     e.request.id.c_str(),
                     static_cast<unsigned long long>(delay_us / 1000U));
      return;
    }
    MakeEligible(e);
  }

  void MakeEligible(TrackedRequest& e) {
    e.timer = nullopt;
    if (IsExpired(e.request)) {
      HIVE_LOG_INFO("Dispatcher", "%s: expired before it became due",
                    e.request.id.c_str());
      Bump([](DispatcherStats& s) { ++s.expired; });
      FinishRevoked(e, error_type::kExpired, "expired");
      return;
    }
    if (!tracker_.Transition(e.request.id, RequestState::kEligible)) return;
    ready_.push_back(e.request.id);
  }

  static bool IsExpired(const TaskRequest& req) {
    return req.expires_ms != 0U && WallNowMs() >= req.expires_ms;
  }

  // -- Submission --

  uint32_t ProcessReady() {
    uint32_t n = 0U;
    const uint64_t now = SteadyNowUs();
    std::deque<std::string> blocked;
    while (!ready_.empty()) {
      if (tracker_.CountInState(RequestState::kDispatched) >= pool_.Concurrency()) {
        break;
      }
      std::string id = std::move(ready_.front());
      ready_.pop_front();
      TrackedRequest* e = tracker_.Find(id);
      if (e == nullptr || e->state != RequestState::kEligible) continue;

      const std::string& task = e->request.task;
      if (!rate_limiter_.TryAcquire(task, now)) {
        ScheduleRateWake(task, now);
        blocked.push_back(std::move(id));
        continue;
      }
      if (!SubmitToPool(*e)) {
        blocked.push_back(std::move(id));
        break;
      }
      ++n;
    }
    // Blocked entries keep their place ahead of anything not yet examined.
    while (!blocked.empty()) {
      ready_.push_front(std::move(blocked.back()));
      blocked.pop_back();
    }
    return n;
  }

  void ScheduleRateWake(const std::string& task, uint64_t now_us) {
    if (!rate_wakes_.insert(task).second) return;
    const uint64_t wait_us = std::max<uint64_t>(rate_limiter_.WaitUs(task, now_us), 1000U);
    (void)timers_.ScheduleAt(now_us + wait_us,
                             TimerEvent{TimerEvent::Kind::kRateWake, task});
  }

  bool SubmitToPool(TrackedRequest& e) {
    const EffectiveLimits limits =
        ResolveLimits(e.request, e.definition, config_.default_soft_limit_ms,
                      config_.default_hard_limit_ms);
    TaskRequest sub = e.request;
    sub.soft_time_limit_ms = limits.soft_ms;
    sub.hard_time_limit_ms = limits.hard_ms;

    auto r = pool_.Submit(sub, [this](const Outcome& o) {
      Post(Event::FromOutcome(o));
    });
    if (!r) {
      if (r.get_error() != PoolError::kQueueFull) {
        HIVE_LOG_WARN("Dispatcher", "%s: submit failed: %s",
                      e.request.id.c_str(), PoolErrorName(r.get_error()));
      }
      return false;
    }
    if (!tracker_.Transition(e.request.id, RequestState::kDispatched)) {
      return false;
    }
    const uint64_t now = SteadyNowUs();
    e.dispatched_us = now;
    e.hard_limit_ms = limits.hard_ms;
    e.hard_deadline_us = (limits.hard_ms != 0U) ? now + limits.hard_ms * 1000U : 0U;
    Bump([](DispatcherStats& s) { ++s.dispatched; });
    HIVE_LOG_DEBUG("Dispatcher", "%s: dispatched (soft=%llums hard=%llums)",
                   e.request.id.c_str(),
                   static_cast<unsigned long long>(limits.soft_ms),
                   static_cast<unsigned long long>(limits.hard_ms));

    if (e.definition->options.ack_mode == AckMode::kEarly && !e.settled) {
      Settle(Settlement{e.request.delivery_tag, e.request.id, true, false,
                        false, TaskError()});
      e.settled = true;
    }
    return true;
  }

  // -- Timers and sweeps --

  uint32_t FireTimers(uint64_t now_us) {
    std::vector<TimerEvent> due;
    const uint32_t n = timers_.PopExpired(now_us, due);
    for (const auto& t : due) {
      if (t.kind == TimerEvent::Kind::kRateWake) {
        rate_wakes_.erase(t.key);
        continue;
      }
      TrackedRequest* e = tracker_.Find(t.key);
      if (e == nullptr) continue;
      if (t.kind == TimerEvent::Kind::kEta && e->state == RequestState::kReceived) {
        MakeEligible(*e);
      } else if (t.kind == TimerEvent::Kind::kRetry &&
                 e->state == RequestState::kRetryScheduled) {
        e->timer = nullopt;
        if (tracker_.Transition(t.key, RequestState::kReceived)) {
          HIVE_LOG_DEBUG("Dispatcher", "%s: retry %u due", t.key.c_str(),
                         e->request.retries);
          MakeEligible(*e);
        }
      }
    }
    return n;
  }

  uint32_t SweepHardLimits(uint64_t now_us) {
    if (now_us < next_sweep_us_) return 0U;
    next_sweep_us_ = now_us + SweepIntervalUs();
    std::vector<std::string> overdue;
    tracker_.CollectOverdue(now_us, config_.hard_limit_grace_ms * 1000ULL, overdue);
    for (const auto& id : overdue) {
      TrackedRequest* e = tracker_.Find(id);
      HIVE_LOG_WARN("Dispatcher", "%s: hard limit %llums overdue, terminating",
                    id.c_str(), static_cast<unsigned long long>(e->hard_limit_ms));
      auto r = pool_.Terminate(id, TerminateReason::kTimeLimit);
      if (!r && r.get_error() != PoolError::kUnknownRequest) {
        HIVE_LOG_ERROR("Dispatcher", "%s: terminate failed: %s", id.c_str(),
                       PoolErrorName(r.get_error()));
        continue;
      }
      e->terminate_sent = true;
    }
    return static_cast<uint32_t>(overdue.size());
  }

  uint64_t SweepIntervalUs() const noexcept {
    return std::max<uint64_t>(config_.sweep_interval_ms, 1U) * 1000U;
  }

  // -- Outcomes --

  void HandleOutcome(const Outcome& o) {
    TrackedRequest* e = tracker_.Find(o.request_id);
    if (e == nullptr || e->state != RequestState::kDispatched) {
      HIVE_LOG_DEBUG("Dispatcher", "%s: stale outcome %s ignored",
                     o.request_id.c_str(), OutcomeKindName(o.kind));
      return;
    }
    BumpTask(e->request.task,
             [&o](TaskStats& t) { t.total_runtime_us += o.runtime_us; });

    if (e->revoked) {
      FinishRevoked(*e, error_type::kRevoked, "revoked");
      return;
    }
    if (cold_stop_ && o.kind != OutcomeKind::kSuccess) {
      // Killed by the shutdown itself; hand it back to the broker.
      Requeue(*e, "worker shutting down");
      return;
    }

    switch (o.kind) {
      case OutcomeKind::kSuccess:
        FinishSuccess(*e, o);
        return;
      case OutcomeKind::kTimeout:
        Bump([](DispatcherStats& s) { ++s.timeouts; });
        break;
      case OutcomeKind::kWorkerLost:
        Bump([](DispatcherStats& s) { ++s.worker_lost; });
        break;
      default:
        break;
    }

    const RetryDecision d = DecideRetry(e->definition->options.retry, o,
                                        e->request.retries, rng_);
    if (d.retry) {
      ScheduleRetry(*e, d.delay_ms, o.error, d.reason);
      return;
    }
    HIVE_LOG_INFO("Dispatcher", "%s: %s failed (%s: %s), not retried: %s",
                  e->request.id.c_str(), e->request.task.c_str(),
                  o.error.type.c_str(), o.error.message.c_str(), d.reason);
    FinishFailure(*e, o);
  }

  void FinishSuccess(TrackedRequest& e, const Outcome& o) {
    HIVE_LOG_INFO("Dispatcher", "%s: %s succeeded in %.3fs",
                  e.request.id.c_str(), e.request.task.c_str(),
                  static_cast<double>(o.runtime_us) / 1e6);
    Bump([](DispatcherStats& s) { ++s.succeeded; });
    BumpTask(e.request.task, [](TaskStats& t) { ++t.succeeded; });
    StoreResult(e.request, e.definition, ResultStatus::kSuccess, &o.result,
                TaskError(), o.runtime_us);
    if (!e.settled) {
      Settle(Settlement{e.request.delivery_tag, e.request.id, true, false,
                        false, TaskError()});
      e.settled = true;
    }
    Finalize(e, RequestState::kAcked);
  }

  void FinishFailure(TrackedRequest& e, const Outcome& o) {
    Bump([](DispatcherStats& s) { ++s.failed; ++s.rejected; });
    BumpTask(e.request.task, [](TaskStats& t) { ++t.failed; });
    StoreResult(e.request, e.definition, ResultStatus::kFailure, nullptr,
                o.error, o.runtime_us);
    if (!e.settled) {
      Settle(Settlement{e.request.delivery_tag, e.request.id, false, false,
                        true, o.error});
      e.settled = true;
    }
    Finalize(e, RequestState::kRejected);
  }

  /// Reject without requeue and record REVOKED. Any non-terminal state.
  void FinishRevoked(TrackedRequest& e, const char* type, const char* why) {
    CancelTimer(e);
    const TaskError err{type, why, false};
    Bump([](DispatcherStats& s) { ++s.rejected; });
    if (std::string(type) == error_type::kRevoked) {
      Bump([](DispatcherStats& s) { ++s.revoked; });
      BumpTask(e.request.task, [](TaskStats& t) { ++t.revoked; });
    }
    StoreResult(e.request, e.definition, ResultStatus::kRevoked, nullptr, err, 0U);
    if (!e.settled) {
      Settle(Settlement{e.request.delivery_tag, e.request.id, false, false,
                        true, err});
      e.settled = true;
    }
    Finalize(e, RequestState::kRejected);
  }

  void Requeue(TrackedRequest& e, const char* why) {
    CancelTimer(e);
    if (e.settled) {
      AbandonAcked(e, why);
      return;
    }
    HIVE_LOG_INFO("Dispatcher", "%s: requeued (%s)", e.request.id.c_str(), why);
    Bump([](DispatcherStats& s) { ++s.requeued; });
    Settle(Settlement{e.request.delivery_tag, e.request.id, false, true, false,
                      TaskError()});
    e.settled = true;
    Finalize(e, RequestState::kRejected);
  }

  /// Acked early, so the broker no longer holds it: record a terminal
  /// FAILURE instead of handing it back.
  void AbandonAcked(TrackedRequest& e, const char* why) {
    HIVE_LOG_WARN("Dispatcher", "%s: already acked, recorded as failed (%s)",
                  e.request.id.c_str(), why);
    TaskError err = e.last_error;
    if (err.type.empty()) err = TaskError{error_type::kWorkerLost, why, false};
    err.message += std::string(" (") + why + ")";
    Bump([](DispatcherStats& s) { ++s.failed; });
    BumpTask(e.request.task, [](TaskStats& t) { ++t.failed; });
    StoreResult(e.request, e.definition, ResultStatus::kFailure, nullptr, err, 0U);
    Finalize(e, RequestState::kRejected);
  }

  void Finalize(TrackedRequest& e, RequestState terminal) {
    const std::string id = e.request.id;
    if (!tracker_.Transition(id, terminal)) return;
    (void)tracker_.Remove(id);
  }

  void CancelTimer(TrackedRequest& e) {
    if (e.timer.has_value()) {
      (void)timers_.Cancel(*e.timer);
      e.timer = nullopt;
    }
  }

  /// Record a request that never entered the tracker as REVOKED.
  void DiscardUntracked(const TaskRequest& req, const TaskDefinition* def,
                        const char* type, const char* why) {
    const TaskError err{type, why, false};
    Bump([](DispatcherStats& s) { ++s.rejected; });
    if (std::string(type) == error_type::kRevoked) {
      Bump([](DispatcherStats& s) { ++s.revoked; });
      BumpTask(req.task, [](TaskStats& t) { ++t.revoked; });
    }
    StoreResult(req, def, ResultStatus::kRevoked, nullptr, err, 0U);
    Settle(Settlement{req.delivery_tag, req.id, false, false, true, err});
  }

  // -- Retries --

  void ScheduleRetry(TrackedRequest& e, uint64_t delay_ms, const TaskError& err,
                     const char* why) {
    delay_ms = std::min<uint64_t>(delay_ms, kMaxHoldMs);
    if (!tracker_.Transition(e.request.id, RequestState::kRetryScheduled)) return;
    e.last_error = err;
    e.terminate_sent = false;
    e.hard_deadline_us = 0U;
    Bump([](DispatcherStats& s) { ++s.retried; });
    BumpTask(e.request.task, [](TaskStats& t) { ++t.retried; });
    HIVE_LOG_INFO("Dispatcher", "%s: retry %u in %llums (%s: %s)",
                  e.request.id.c_str(), e.request.retries + 1U,
                  static_cast<unsigned long long>(delay_ms), why,
                  err.type.c_str());

    if (config_.retry_route == RetryRoute::kBroker && broker_.SupportsPublish() &&
        PublishRetry(e, e.request.retries + 1U, WallNowMs() + delay_ms)) {
      return;
    }
    e.request.retries += 1U;
    e.request.eta_ms = WallNowMs() + delay_ms;
    e.timer = timers_.ScheduleAfter(
        delay_ms * 1000U, TimerEvent{TimerEvent::Kind::kRetry, e.request.id});
  }

  /// Republish as retry number @p retries due at @p eta_ms, ack the
  /// original unless it was acked early, and drop the entry.
  bool PublishRetry(TrackedRequest& e, uint32_t retries, uint64_t eta_ms) {
    TaskRequest next = e.request;
    next.retries = retries;
    next.eta_ms = eta_ms;
    next.delivery_tag = 0U;
    auto r = broker_.Publish(EncodeTaskMessage(next), eta_ms);
    if (!r) {
      HIVE_LOG_WARN("Dispatcher", "%s: republish failed (%s)",
                    e.request.id.c_str(), BrokerErrorName(r.get_error()));
      if (r.get_error() == BrokerError::kUnavailable) broker_down_ = true;
      return false;
    }
    if (!e.settled) {
      Settle(Settlement{e.request.delivery_tag, e.request.id, true, false,
                        false, TaskError()});
      e.settled = true;
    }
    (void)tracker_.Remove(e.request.id);
    return true;
  }

  // -- Revocation --

  void HandleRevoke(const std::string& id) {
    revoked_.Add(id);
    TrackedRequest* e = tracker_.Find(id);
    if (e == nullptr) {
      HIVE_LOG_INFO("Dispatcher", "%s: revoke remembered", id.c_str());
      return;
    }
    if (e->state == RequestState::kDispatched) {
      HIVE_LOG_INFO("Dispatcher", "%s: revoking running task", id.c_str());
      e->revoked = true;
      auto r = pool_.Terminate(id, TerminateReason::kRevoked);
      if (!r && r.get_error() != PoolError::kUnknownRequest) {
        HIVE_LOG_ERROR("Dispatcher", "%s: terminate failed: %s", id.c_str(),
                       PoolErrorName(r.get_error()));
      }
      e->terminate_sent = true;
      return;
    }
    HIVE_LOG_INFO("Dispatcher", "%s: revoked while %s", id.c_str(),
                  RequestStateName(e->state));
    FinishRevoked(*e, error_type::kRevoked, "revoked");
  }

  // -- Stopping --

  void BeginStop(StopMode mode) {
    const State st = state_.load(std::memory_order_acquire);
    if (st == State::kStopped) return;
    if (st == State::kStopping && (mode == StopMode::kWarm || cold_stop_)) return;

    if (st == State::kRunning) {
      HIVE_LOG_INFO("Dispatcher", "%s stop: %u in flight",
                    mode == StopMode::kWarm ? "warm" : "cold",
                    tracker_.CountInState(RequestState::kDispatched));
      state_.store(State::kStopping, std::memory_order_release);
      stop_deadline_us_ = SteadyNowUs() + config_.shutdown_grace_ms * 1000ULL;
      ReleaseUndispatched();
    }
    if (mode == StopMode::kCold) {
      cold_stop_ = true;
      stop_deadline_us_ = SteadyNowUs();
    }
  }

  /// Hand back everything that has not reached a slot yet.
  void ReleaseUndispatched() {
    ready_.clear();
    for (RequestState s : {RequestState::kReceived, RequestState::kEligible}) {
      for (const auto& id : tracker_.IdsInState(s)) {
        TrackedRequest* e = tracker_.Find(id);
        if (e != nullptr) Requeue(*e, "worker stopping");
      }
    }
    for (const auto& id : tracker_.IdsInState(RequestState::kRetryScheduled)) {
      TrackedRequest* e = tracker_.Find(id);
      if (e != nullptr) ReleaseRetry(*e);
    }
  }

  /// A locally waiting retry goes back to the broker. Republishing keeps
  /// the retry count and ETA; a plain requeue loses both.
  void ReleaseRetry(TrackedRequest& e) {
    CancelTimer(e);
    if (broker_.SupportsPublish() &&
        PublishRetry(e, e.request.retries, e.request.eta_ms)) {
      return;
    }
    Requeue(e, "worker stopping, retry count lost");
  }

  void AdvanceStop() {
    const uint32_t inflight = tracker_.CountInState(RequestState::kDispatched);
    if (inflight != 0U && SteadyNowUs() < stop_deadline_us_) return;
    if (inflight != 0U) {
      HIVE_LOG_WARN("Dispatcher", "stopping pool with %u task(s) in flight",
                    inflight);
      cold_stop_ = true;
    }
    pool_.Shutdown(0U);
    (void)DrainEvents();
    // Anything the pool did not report back is handed to the broker.
    std::vector<std::string> left;
    tracker_.ForEach([&left](const TrackedRequest& e) {
      left.push_back(e.request.id);
    });
    for (const auto& id : left) {
      TrackedRequest* e = tracker_.Find(id);
      if (e == nullptr) continue;
      if (e->state == RequestState::kDispatched) {
        Requeue(*e, "no outcome before shutdown");
      } else if (e->state == RequestState::kRetryScheduled) {
        ReleaseRetry(*e);
      } else if (!IsTerminal(e->state)) {
        Requeue(*e, "worker stopping");
      }
    }
    timers_.Clear();
    if (!FlushBacklog()) {
      HIVE_LOG_ERROR("Dispatcher", "%zu settlement(s) undelivered at stop",
                     backlog_.size());
    }
    state_.store(State::kStopped, std::memory_order_release);
    const DispatcherStats s = GetStats();
    HIVE_LOG_INFO("Dispatcher",
                  "stopped: received=%llu succeeded=%llu failed=%llu "
                  "retried=%llu requeued=%llu",
                  static_cast<unsigned long long>(s.received),
                  static_cast<unsigned long long>(s.succeeded),
                  static_cast<unsigned long long>(s.failed),
                  static_cast<unsigned long long>(s.retried),
                  static_cast<unsigned long long>(s.requeued));
  }

  // -- Broker settlement --

  /// Ack/reject in arrival order; failures wait in the backlog.
  void Settle(Settlement&& s) {
    if (!backlog_.empty() || !TrySettle(s)) {
      backlog_.push_back(std::move(s));
      SetBacklogStat();
    }
  }

  /// @return false only when the broker is unavailable.
  bool TrySettle(const Settlement& s) {
    auto r = s.ack ? broker_.Ack(s.tag)
                   : broker_.Reject(s.tag, s.requeue,
                                    s.has_reason ? &s.reason : nullptr);
    if (r) return true;
    if (r.get_error() == BrokerError::kUnavailable) {
      broker_down_ = true;
      return false;
    }
    HIVE_LOG_ERROR("Dispatcher", "%s: %s of tag %llu failed: %s",
                   s.request_id.c_str(), s.ack ? "ack" : "reject",
                   static_cast<unsigned long long>(s.tag),
                   BrokerErrorName(r.get_error()));
    return true;
  }

  bool FlushBacklog() {
    while (!backlog_.empty()) {
      if (!TrySettle(backlog_.front())) {
        SetBacklogStat();
        return false;
      }
      backlog_.pop_front();
    }
    SetBacklogStat();
    return true;
  }

  void SetBacklogStat() {
    const uint64_t n = backlog_.size();
    Bump([n](DispatcherStats& s) { s.backlog = n; });
  }

  // -- Results --

  void StoreResult(const TaskRequest& req, const TaskDefinition* def,
                   ResultStatus status, const json* value,
                   const TaskError& err, uint64_t runtime_us) {
    if (backend_ == nullptr) return;
    if (def != nullptr && def->options.ignore_result) return;
    ResultRecord rec;
    rec.task_id = req.id;
    rec.task_name = req.task;
    rec.status = status;
    if (value != nullptr) rec.result = *value;
    rec.error = err;
    rec.retries = req.retries;
    rec.runtime_us = runtime_us;
    rec.hostname = config_.hostname;
    rec.date_done_ms = WallNowMs();
    auto r = backend_->StoreResult(req.id, rec);
    if (!r) {
      HIVE_LOG_ERROR("Dispatcher", "%s: storing %s result failed",
                     req.id.c_str(), ResultStatusName(status));
      Bump([](DispatcherStats& s) { ++s.store_failures; });
    }
  }

  // -- Stats --

  template <typename Fn>
  void Bump(Fn&& fn) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    fn(stats_);
  }

  template <typename Fn>
  void BumpTask(const std::string& task, Fn&& fn) {
    std::lock_guard<std::mutex> lock(stats_mu_);
    fn(stats_.per_task[task]);
  }

  DispatcherConfig config_;
  TaskRegistry& registry_;
  ExecutionPool& pool_;
  Broker& broker_;
  ResultBackend* backend_;

  std::atomic<State> state_{State::kCreated};
  bool cold_stop_ = false;
  bool broker_down_ = false;
  bool broker_watched_ = false;
  uint64_t stop_deadline_us_ = 0U;
  uint64_t next_sweep_us_ = 0U;

  IoPoller poller_;
  Waker waker_;
  std::mutex events_mu_;
  std::vector<Event> events_;

  RequestTracker tracker_;
  std::deque<std::string> ready_;
  DeadlineQueue<TimerEvent> timers_;
  RateLimiter rate_limiter_;
  std::unordered_set<std::string> rate_wakes_;
  detail::BoundedIdSet revoked_;
  std::deque<Settlement> backlog_;
  std::mt19937_64 rng_;

  mutable std::mutex stats_mu_;
  DispatcherStats stats_;
};

}  // namespace hive

#endif  // HIVE_DISPATCHER_HPP_
