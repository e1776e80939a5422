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
 * @file pool_thread.hpp
 * @brief Native-thread strategy: one OS thread per slot.
 *
 * Architecture:
 *   Submit() -> idle slot's channel (or pending queue)
 *                  |
 *            SlotThread[i] -- RunTask --> core.done
 *                                            |
 *                                  supervisor thread: deliver outcome,
 *                                  limits, recycling, watchdog probes
 *
 * Threads cannot be killed safely, so a hard limit or Terminate()
 * abandons the thread: its cancellation token is set, it is detached, the
 * outcome is reported at once and a fresh thread takes the slot. Anything
 * the abandoned thread posts later carries an old generation and is
 * dropped. Slot threads only share the reference-counted core and their
 * own channel with the pool, so a detached thread never touches a
 * destroyed pool.
 */

#ifndef HIVE_POOL_THREAD_HPP_
#define HIVE_POOL_THREAD_HPP_

#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/pool.hpp"
#include "hive/registry.hpp"
#include "hive/watchdog.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hive {

namespace detail {

/// @brief Mailbox between the pool and one slot thread generation.
struct ThreadSlotChannel {
  std::mutex mu;
  std::condition_variable cv;
  bool has_job = false;
  bool stop = false;
  TaskRequest job;
  uint64_t token = 0U;
  uint64_t soft_limit_ms = 0U;
  std::atomic<bool> cancel{false};
  std::atomic<bool> alive{true};  ///< cleared when the thread exits
};

/// @brief Completion inbox shared by the pool and all of its threads.
struct ThreadPoolCore {
  struct Done {
    uint32_t slot;
    uint64_t generation;
    uint64_t token;
    Outcome outcome;
  };

  void Post(Done&& d) {
    {
      std::lock_guard<std::mutex> lock(mu);
      if (closed) return;
      done.push_back(std::move(d));
    }
    cv.notify_one();
  }

  void Wake() { cv.notify_one(); }

  std::mutex mu;
  std::condition_variable cv;
  std::deque<Done> done;
  bool stop_supervisor = false;
  bool closed = false;
};

}  // namespace detail

class ThreadPool final : public detail::PoolBase {
 public:
  ThreadPool(const PoolConfig& cfg, const TaskRegistry& registry)
      : PoolBase(cfg, registry, PoolStrategy::kNativeThread),
        core_(std::make_shared<detail::ThreadPoolCore>()) {}

  ~ThreadPool() override { Shutdown(0U); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  expected<void, PoolError> Start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = BeginStartLocked();
    if (!r) return r;
    if (config_.max_memory_per_child != 0U) {
      HIVE_LOG_WARN("Pool", "[%s] max_memory_per_child is ignored for threads",
                    config_.name.c_str());
    }
    slots_.resize(config_.concurrency);
    watchdog_.SetOnLost(&ThreadPool::OnSlotLostThunk, this);
    for (uint32_t i = 0U; i < config_.concurrency; ++i) {
      auto reg = watchdog_.RegisterProbe("thread-slot", &ThreadPool::ProbeThunk,
                                         this);
      if (!reg.has_value() || reg.value().id.value() != i) {
        HIVE_LOG_ERROR("Pool", "[%s] watchdog registration failed for slot %u",
                       config_.name.c_str(), i);
        return expected<void, PoolError>::error(PoolError::kStartFailed);
      }
      SpawnSlotLocked(i);
    }
    state_.store(RunState::kRunning, std::memory_order_release);
    supervisor_ = std::thread([this]() { SupervisorLoop(); });
    HIVE_LOG_INFO("Pool", "[%s] thread pool started, %u slots",
                  config_.name.c_str(), config_.concurrency);
    return expected<void, PoolError>::success();
  }

  expected<void, PoolError> Submit(const TaskRequest& req,
                                   CompletionFn on_complete) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = AdmitLocked(req, on_complete);
    if (!r) return r;
    const uint32_t idle = FindIdleLocked();
    if (idle != kNoSlot) {
      StartOnSlotLocked(idle, req);
    } else {
      pending_.push_back(req);
    }
    return r;
  }

  expected<void, PoolError> RestartSlot(uint32_t slot_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != RunState::kRunning) {
      return expected<void, PoolError>::error(PoolError::kNotRunning);
    }
    if (slot_id >= slots_.size()) {
      return expected<void, PoolError>::error(PoolError::kInvalidSlot);
    }
    Slot& s = slots_[slot_id];
    if (s.state == SlotState::kBusy) {
      s.recycle_requested = true;
    } else {
      RecycleSlotLocked(slot_id);
      AssignPendingLocked();
    }
    return expected<void, PoolError>::success();
  }

  expected<void, PoolError> Terminate(const std::string& request_id,
                                      TerminateReason reason) override {
    detail::Deliveries out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!ledger_.Contains(request_id)) {
        return expected<void, PoolError>::error(PoolError::kUnknownRequest);
      }
      if (RemovePendingLocked(request_id)) {
        (void)CompleteLocked(
            TerminatedOutcome(request_id, reason, 0U, 0U, kNoSlot), 0U, out,
            true);
      } else {
        for (uint32_t i = 0U; i < slots_.size(); ++i) {
          Slot& s = slots_[i];
          if (s.state != SlotState::kBusy || s.request_id != request_id) {
            continue;
          }
          HIVE_LOG_WARN("Pool", "[%s] terminating %s on slot %u",
                        config_.name.c_str(), request_id.c_str(), i);
          (void)CompleteLocked(
              TerminatedOutcome(request_id, reason, s.hard_ms,
                                SteadyNowUs() - s.started_us, i),
              s.token, out);
          AbandonSlotLocked(i, true);
          AssignPendingLocked();
          break;
        }
      }
    }
    detail::FlushDeliveries(out);
    return expected<void, PoolError>::success();
  }

  void Shutdown(uint32_t grace_ms) override {
    detail::Deliveries out;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      const RunState st = state_.load(std::memory_order_acquire);
      if (st == RunState::kCreated) {
        state_.store(RunState::kStopped, std::memory_order_release);
        return;
      }
      if (st != RunState::kRunning) return;
      state_.store(RunState::kShuttingDown, std::memory_order_release);
      HIVE_LOG_INFO("Pool", "[%s] shutting down (grace %ums, %zu outstanding)",
                    config_.name.c_str(), grace_ms, ledger_.Size());
      if (!WaitDrained(lock, grace_ms)) {
        FailPendingLocked("Pool shut down before the task started", out);
        for (uint32_t i = 0U; i < slots_.size(); ++i) {
          Slot& s = slots_[i];
          if (s.state != SlotState::kBusy) continue;
          Outcome o = Outcome::WorkerLost(
              s.request_id, "Worker terminated at pool shutdown", i);
          o.runtime_us = SteadyNowUs() - s.started_us;
          (void)CompleteLocked(std::move(o), s.token, out);
          AbandonSlotLocked(i, false);
        }
      }
      for (auto& s : slots_) {
        if (s.state != SlotState::kBusy) s.state = SlotState::kStopped;
      }
    }
    detail::FlushDeliveries(out);

    {
      std::lock_guard<std::mutex> lock(core_->mu);
      core_->stop_supervisor = true;
    }
    core_->Wake();
    if (supervisor_.joinable()) supervisor_.join();

    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& s : slots_) StopThread(s);
    }
    {
      std::lock_guard<std::mutex> lock(core_->mu);
      core_->closed = true;
      core_->done.clear();
    }
    state_.store(RunState::kStopped, std::memory_order_release);
    HIVE_LOG_INFO("Pool", "[%s] stopped", config_.name.c_str());
  }

  std::vector<SlotInfo> Slots() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SlotInfo> out;
    out.reserve(slots_.size());
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      const Slot& s = slots_[i];
      SlotInfo info;
      info.id = i;
      info.state = s.state;
      info.request_id = s.request_id;
      info.started_us = s.started_us;
      info.tasks_completed = s.tasks_completed;
      info.generation = s.generation;
      out.push_back(std::move(info));
    }
    return out;
  }

 private:
  struct Slot {
    std::thread thread;
    std::shared_ptr<detail::ThreadSlotChannel> ch;
    uint64_t generation = 0U;
    SlotState state = SlotState::kStarting;
    std::string request_id;
    uint64_t token = 0U;
    uint64_t started_us = 0U;
    uint64_t soft_deadline_us = 0U;
    uint64_t hard_deadline_us = 0U;
    uint64_t hard_ms = 0U;
    bool soft_fired = false;
    bool recycle_requested = false;
    uint32_t tasks_completed = 0U;
  };

  // --------------------------------------------------------------------------
  // Slot thread
  // --------------------------------------------------------------------------

  static void SlotMain(std::shared_ptr<detail::ThreadPoolCore> core,
                       std::shared_ptr<detail::ThreadSlotChannel> ch,
                       const TaskRegistry* registry, std::string hostname,
                       uint32_t slot, uint64_t generation) {
    HIVE_SCOPE_EXIT(ch->alive.store(false, std::memory_order_release);
                    core->Wake());
    for (;;) {
      TaskRequest req;
      uint64_t token = 0U;
      uint64_t soft_ms = 0U;
      {
        std::unique_lock<std::mutex> lock(ch->mu);
        ch->cv.wait(lock, [&ch] { return ch->has_job || ch->stop; });
        if (ch->stop) return;
        req = std::move(ch->job);
        ch->has_job = false;
        token = ch->token;
        soft_ms = ch->soft_limit_ms;
      }
      ExecEnv env;
      env.hostname = hostname.c_str();
      env.cancel_flag = &ch->cancel;
      env.soft_limit_ms = soft_ms;
      env.slot = slot;
      Outcome o = RunTask(*registry, req, env);
      core->Post(detail::ThreadPoolCore::Done{slot, generation, token,
                                              std::move(o)});
    }
  }

  // --------------------------------------------------------------------------
  // Slot management (caller holds mutex_)
  // --------------------------------------------------------------------------

  void SpawnSlotLocked(uint32_t i) {
    Slot& s = slots_[i];
    s.ch = std::make_shared<detail::ThreadSlotChannel>();
    ++s.generation;
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.token = 0U;
    s.started_us = 0U;
    s.soft_fired = false;
    s.recycle_requested = false;
    s.tasks_completed = 0U;
    s.thread = std::thread(&ThreadPool::SlotMain, core_, s.ch, &registry_,
                           config_.hostname, i, s.generation);
  }

  /// @brief Ask an idle thread to exit and join it.
  static void StopThread(Slot& s) {
    if (s.ch) {
      {
        std::lock_guard<std::mutex> lock(s.ch->mu);
        s.ch->stop = true;
      }
      s.ch->cv.notify_one();
    }
    if (s.thread.joinable()) s.thread.join();
  }

  void RecycleSlotLocked(uint32_t i) {
    HIVE_LOG_DEBUG("Pool", "[%s] recycling thread slot %u",
                   config_.name.c_str(), i);
    StopThread(slots_[i]);
    ++stats_.restarts;
    SpawnSlotLocked(i);
  }

  /// @brief Cancel and detach a busy thread, optionally replacing it.
  void AbandonSlotLocked(uint32_t i, bool respawn) {
    Slot& s = slots_[i];
    s.ch->cancel.store(true, std::memory_order_release);
    {
      std::lock_guard<std::mutex> lock(s.ch->mu);
      s.ch->stop = true;
    }
    s.ch->cv.notify_one();
    if (s.thread.joinable()) s.thread.detach();
    if (respawn) {
      ++stats_.restarts;
      SpawnSlotLocked(i);
    } else {
      s.state = SlotState::kStopped;
      s.request_id.clear();
    }
  }

  uint32_t FindIdleLocked() const {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (slots_[i].state == SlotState::kIdle) return i;
    }
    return kNoSlot;
  }

  void StartOnSlotLocked(uint32_t i, const TaskRequest& req) {
    Slot& s = slots_[i];
    const EffectiveLimits limits = LimitsFor(req);
    const uint64_t now = SteadyNowUs();
    s.state = SlotState::kBusy;
    s.request_id = req.id;
    s.token = ledger_.Bind(req.id);
    s.started_us = now;
    s.soft_deadline_us = (limits.soft_ms != 0U) ? now + limits.soft_ms * 1000U : 0U;
    s.hard_deadline_us = (limits.hard_ms != 0U) ? now + limits.hard_ms * 1000U : 0U;
    s.hard_ms = limits.hard_ms;
    s.soft_fired = false;
    {
      std::lock_guard<std::mutex> lock(s.ch->mu);
      s.ch->job = req;
      s.ch->token = s.token;
      s.ch->soft_limit_ms = limits.soft_ms;
      s.ch->has_job = true;
      s.ch->cancel.store(false, std::memory_order_release);
    }
    s.ch->cv.notify_one();
  }

  void AssignPendingLocked() {
    for (;;) {
      const uint32_t idle = FindIdleLocked();
      if (idle == kNoSlot) return;
      TaskRequest req;
      if (!TakePendingLocked(&req)) return;
      StartOnSlotLocked(idle, req);
    }
  }

  void HandleDoneLocked(detail::ThreadPoolCore::Done& d,
                        detail::Deliveries& out) {
    if (d.slot >= slots_.size()) return;
    Slot& s = slots_[d.slot];
    if (d.generation != s.generation || s.state != SlotState::kBusy ||
        d.token != s.token) {
      HIVE_LOG_DEBUG("Pool", "[%s] late result for %s from abandoned thread",
                     config_.name.c_str(), d.outcome.request_id.c_str());
      return;
    }
    (void)CompleteLocked(std::move(d.outcome), d.token, out);
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.started_us = 0U;
    ++s.tasks_completed;
    const bool exhausted = config_.max_tasks_per_child != 0U &&
                           s.tasks_completed >= config_.max_tasks_per_child;
    if ((exhausted || s.recycle_requested) &&
        state_.load(std::memory_order_acquire) == RunState::kRunning) {
      RecycleSlotLocked(d.slot);
    }
  }

  void EnforceLimitsLocked(uint64_t now, detail::Deliveries& out) {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.state != SlotState::kBusy) continue;
      if (s.soft_deadline_us != 0U && !s.soft_fired &&
          now >= s.soft_deadline_us) {
        s.soft_fired = true;
        s.ch->cancel.store(true, std::memory_order_release);
        HIVE_LOG_WARN("Pool", "[%s] soft time limit exceeded for %s",
                      config_.name.c_str(), s.request_id.c_str());
      }
      if (s.hard_deadline_us != 0U && now >= s.hard_deadline_us) {
        HIVE_LOG_ERROR("Pool", "[%s] hard time limit (%llums) exceeded for %s",
                       config_.name.c_str(),
                       static_cast<unsigned long long>(s.hard_ms),
                       s.request_id.c_str());
        (void)CompleteLocked(Outcome::Timeout(s.request_id, s.hard_ms,
                                              now - s.started_us, i),
                             s.token, out);
        AbandonSlotLocked(i, true);
      }
    }
  }

  // --------------------------------------------------------------------------
  // Supervisor
  // --------------------------------------------------------------------------

  void SupervisorLoop() {
    const auto interval = std::chrono::milliseconds(config_.watchdog_interval_ms);
    std::deque<detail::ThreadPoolCore::Done> batch;
    for (;;) {
      bool stop = false;
      {
        std::unique_lock<std::mutex> lock(core_->mu);
        core_->cv.wait_for(lock, interval, [this] {
          return !core_->done.empty() || core_->stop_supervisor;
        });
        batch.swap(core_->done);
        stop = core_->stop_supervisor;
      }
      detail::Deliveries out;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& d : batch) HandleDoneLocked(d, out);
        EnforceLimitsLocked(SteadyNowUs(), out);
        AssignPendingLocked();
      }
      batch.clear();
      detail::FlushDeliveries(out);
      (void)watchdog_.Check();
      if (stop) return;
    }
  }

  static bool ProbeThunk(uint32_t slot_id, void* ctx) {
    auto* self = static_cast<ThreadPool*>(ctx);
    std::lock_guard<std::mutex> lock(self->mutex_);
    if (slot_id >= self->slots_.size()) return true;
    const Slot& s = self->slots_[slot_id];
    if (s.state == SlotState::kStopped || !s.ch) return true;
    return s.ch->alive.load(std::memory_order_acquire);
  }

  static void OnSlotLostThunk(uint32_t slot_id, const char* /*name*/,
                              void* ctx) {
    static_cast<ThreadPool*>(ctx)->OnSlotLost(slot_id);
  }

  /// @brief A slot thread exited on its own (e.g. pthread_exit in a handler).
  void OnSlotLost(uint32_t i) {
    detail::Deliveries out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (i >= slots_.size()) return;
      Slot& s = slots_[i];
      if (s.state == SlotState::kStopped ||
          s.ch->alive.load(std::memory_order_acquire)) {
        return;
      }
      HIVE_LOG_ERROR("Pool", "[%s] thread slot %u exited unexpectedly%s%s",
                     config_.name.c_str(), i,
                     s.state == SlotState::kBusy ? " while running " : "",
                     s.state == SlotState::kBusy ? s.request_id.c_str() : "");
      if (s.state == SlotState::kBusy) {
        Outcome o = Outcome::WorkerLost(
            s.request_id, "Worker thread exited prematurely", i);
        o.runtime_us = SteadyNowUs() - s.started_us;
        (void)CompleteLocked(std::move(o), s.token, out);
      }
      if (s.thread.joinable()) s.thread.join();
      ++stats_.restarts;
      if (state_.load(std::memory_order_acquire) == RunState::kRunning ||
          !pending_.empty()) {
        SpawnSlotLocked(i);
        AssignPendingLocked();
      } else {
        s.state = SlotState::kStopped;
      }
    }
    watchdog_.Reset(WatchdogSlotId(i));
    detail::FlushDeliveries(out);
  }

  std::shared_ptr<detail::ThreadPoolCore> core_;
  std::vector<Slot> slots_;
  SlotWatchdog<kMaxPoolSlots> watchdog_;
  std::thread supervisor_;
};

}  // namespace hive

#endif  // HIVE_POOL_THREAD_HPP_
