/**
 * @file pool_green.hpp
 * @brief Green-thread strategy: cooperative ucontext green threads on a
 *        single hub thread.
 *
 * Architecture:
 *   Submit() -> free slot -> hub.jobs
 *                               |
 *                 hub thread: one green thread per job, round-robin
 *                 switching at TaskContext::Yield()
 *                               |
 *                            hub.done -> supervisor: deliver, limits,
 *                                        hub liveness probe
 *
 * A green thread cannot be preempted. A hard limit or Terminate() marks
 * it killed and reports the outcome immediately; the slot is free again
 * at once. The killed green thread unwinds at its next Yield() and its
 * result is dropped. A handler that never yields stalls the whole hub;
 * the hub heartbeat probe reports that.
 */

#ifndef HIVE_POOL_GREEN_HPP_
#define HIVE_POOL_GREEN_HPP_

#include "hive/platform.hpp"

#if defined(HIVE_HAS_UCONTEXT)

#include "hive/log.hpp"
#include "hive/pool.hpp"
#include "hive/registry.hpp"
#include "hive/watchdog.hpp"

#include <ucontext.h>

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

struct GreenFlags {
  std::atomic<bool> cancel{false};
  std::atomic<bool> killed{false};
};

/// Thrown out of Yield() to unwind a killed green thread.
struct GreenletExit {};

/// @brief State shared by the pool and its hub thread.
struct GreenHub {
  struct Job {
    TaskRequest req;
    uint64_t token;
    uint32_t slot;
    uint64_t soft_ms;
    std::shared_ptr<GreenFlags> flags;
  };
  struct Done {
    uint32_t slot;
    uint64_t token;
    Outcome outcome;
  };

  std::mutex mu;
  std::condition_variable cv;       ///< hub waits for jobs
  std::condition_variable done_cv;  ///< supervisor waits for results
  std::deque<Job> jobs;
  std::deque<Done> done;
  bool stop = false;
  bool stop_supervisor = false;
  bool exited = false;
  ThreadHeartbeat heartbeat;

  const TaskRegistry* registry = nullptr;
  std::string hostname;
  size_t stack_size = 0U;
};

struct Greenlet {
  ucontext_t ctx;
  ucontext_t* hub_ctx = nullptr;
  std::unique_ptr<char[]> stack;
  GreenHub* hub = nullptr;
  GreenHub::Job job;
  Outcome outcome;
  bool finished = false;
};

}  // namespace detail

class GreenPool final : public detail::PoolBase {
 public:
  GreenPool(const PoolConfig& cfg, const TaskRegistry& registry)
      : PoolBase(cfg, registry, PoolStrategy::kGreenThread),
        hub_(std::make_shared<detail::GreenHub>()) {
    hub_->registry = &registry_;
    hub_->hostname = config_.hostname;
    hub_->stack_size =
        (config_.green_stack_size >= 32U * 1024U) ? config_.green_stack_size
                                                  : 32U * 1024U;
    const uint64_t t = static_cast<uint64_t>(config_.watchdog_interval_ms) * 10U;
    hub_timeout_us_ = ((t > 1000U) ? t : 1000U) * 1000U;
  }

  ~GreenPool() override { Shutdown(0U); }

  GreenPool(const GreenPool&) = delete;
  GreenPool& operator=(const GreenPool&) = delete;

  expected<void, PoolError> Start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = BeginStartLocked();
    if (!r) return r;
    slots_.resize(config_.concurrency);
    for (auto& s : slots_) s.state = SlotState::kIdle;
    watchdog_.SetOnLost(&GreenPool::OnHubStalled, this);
    watchdog_.SetOnRecovered(&GreenPool::OnHubRecovered, this);
    hub_->heartbeat.Beat();
    if (!watchdog_.RegisterProbe("green-hub", &GreenPool::ProbeHub, this)) {
      return expected<void, PoolError>::error(PoolError::kStartFailed);
    }
    state_.store(RunState::kRunning, std::memory_order_release);
    hub_thread_ = std::thread(&GreenPool::HubMain, hub_);
    supervisor_ = std::thread([this]() { SupervisorLoop(); });
    HIVE_LOG_INFO("Pool", "[%s] green pool started, %u green threads",
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

  /// Green threads are created per task; there is nothing to recycle.
  expected<void, PoolError> RestartSlot(uint32_t slot_id) override {
    if (slot_id >= config_.concurrency) {
      return expected<void, PoolError>::error(PoolError::kInvalidSlot);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot_id < slots_.size()) ++slots_[slot_id].generation;
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
          (void)CompleteLocked(
              TerminatedOutcome(request_id, reason, s.hard_ms,
                                SteadyNowUs() - s.started_us, i),
              s.token, out);
          KillSlotLocked(i);
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
      if (!WaitDrained(lock, grace_ms)) {
        FailPendingLocked("Pool shut down before the task started", out);
        for (uint32_t i = 0U; i < slots_.size(); ++i) {
          Slot& s = slots_[i];
          if (s.state != SlotState::kBusy) continue;
          Outcome o = Outcome::WorkerLost(
              s.request_id, "Green thread killed at pool shutdown", i);
          o.runtime_us = SteadyNowUs() - s.started_us;
          (void)CompleteLocked(std::move(o), s.token, out);
          KillSlotLocked(i);
        }
      }
      for (auto& s : slots_) s.state = SlotState::kStopped;
    }
    detail::FlushDeliveries(out);

    {
      std::lock_guard<std::mutex> lock(hub_->mu);
      hub_->stop = true;
      hub_->stop_supervisor = true;
    }
    hub_->cv.notify_all();
    hub_->done_cv.notify_all();
    if (supervisor_.joinable()) supervisor_.join();

    // A green thread that never yields keeps the hub busy forever.
    bool exited = false;
    {
      std::unique_lock<std::mutex> lock(hub_->mu);
      exited = hub_->done_cv.wait_for(
          lock, std::chrono::milliseconds(kHubJoinTimeoutMs),
          [this] { return hub_->exited; });
    }
    if (hub_thread_.joinable()) {
      if (exited) {
        hub_thread_.join();
      } else {
        HIVE_LOG_ERROR("Pool", "[%s] green hub did not stop, detaching it",
                       config_.name.c_str());
        hub_thread_.detach();
      }
    }
    state_.store(RunState::kStopped, std::memory_order_release);
    HIVE_LOG_INFO("Pool", "[%s] stopped", config_.name.c_str());
  }

  std::vector<SlotInfo> Slots() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SlotInfo> out;
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
  static constexpr uint32_t kHubJoinTimeoutMs = 1000U;

  struct Slot {
    SlotState state = SlotState::kStarting;
    std::string request_id;
    uint64_t token = 0U;
    uint64_t started_us = 0U;
    uint64_t soft_deadline_us = 0U;
    uint64_t hard_deadline_us = 0U;
    uint64_t hard_ms = 0U;
    bool soft_fired = false;
    uint32_t tasks_completed = 0U;
    uint64_t generation = 0U;
    std::shared_ptr<detail::GreenFlags> flags;
  };

  // --------------------------------------------------------------------------
  // Hub thread
  // --------------------------------------------------------------------------

  static void Trampoline(uint32_t hi, uint32_t lo) {
    const uint64_t bits = (static_cast<uint64_t>(hi) << 32) | lo;
    auto* g = reinterpret_cast<detail::Greenlet*>(static_cast<uintptr_t>(bits));
    ExecEnv env;
    env.hostname = g->hub->hostname.c_str();
    env.cancel_flag = &g->job.flags->cancel;
    env.soft_limit_ms = g->job.soft_ms;
    env.yield = &GreenPool::YieldThunk;
    env.yield_ctx = g;
    env.slot = g->job.slot;
    g->outcome = RunTask(*g->hub->registry, g->job.req, env);
    g->finished = true;
    // Returning resumes the hub through uc_link.
  }

  static void YieldThunk(void* ctx) {
    auto* g = static_cast<detail::Greenlet*>(ctx);
    (void)::swapcontext(&g->ctx, g->hub_ctx);
#if defined(__cpp_exceptions)
    if (g->job.flags->killed.load(std::memory_order_acquire)) {
      throw detail::GreenletExit{};
    }
#endif
  }

  static bool MakeGreenlet(detail::GreenHub* hub, ucontext_t* hub_ctx,
                           detail::Greenlet* g) {
    if (::getcontext(&g->ctx) != 0) return false;
    g->hub = hub;
    g->hub_ctx = hub_ctx;
    g->stack.reset(new char[hub->stack_size]);
    g->ctx.uc_stack.ss_sp = g->stack.get();
    g->ctx.uc_stack.ss_size = hub->stack_size;
    g->ctx.uc_link = hub_ctx;
    const uint64_t bits = static_cast<uint64_t>(reinterpret_cast<uintptr_t>(g));
    ::makecontext(&g->ctx, reinterpret_cast<void (*)()>(&GreenPool::Trampoline),
                  2, static_cast<uint32_t>(bits >> 32),
                  static_cast<uint32_t>(bits & 0xFFFFFFFFU));
    return true;
  }

  static void HubMain(std::shared_ptr<detail::GreenHub> hub) {
    ucontext_t hub_ctx;
    std::vector<std::unique_ptr<detail::Greenlet>> greenlets;
    for (;;) {
      hub->heartbeat.Beat();
      {
        std::unique_lock<std::mutex> lock(hub->mu);
        if (greenlets.empty()) {
          hub->cv.wait_for(lock, std::chrono::milliseconds(50), [&hub] {
            return !hub->jobs.empty() || hub->stop;
          });
        }
        if (hub->stop && greenlets.empty()) break;
        while (!hub->jobs.empty()) {
          auto g = std::make_unique<detail::Greenlet>();
          g->job = std::move(hub->jobs.front());
          hub->jobs.pop_front();
          if (!MakeGreenlet(hub.get(), &hub_ctx, g.get())) {
            hub->done.push_back(detail::GreenHub::Done{
                g->job.slot, g->job.token,
                Outcome::WorkerLost(g->job.req.id,
                                    "Could not create green thread",
                                    g->job.slot)});
            hub->done_cv.notify_one();
            continue;
          }
          greenlets.push_back(std::move(g));
        }
      }
      bool progressed = false;
      for (size_t i = 0U; i < greenlets.size();) {
        detail::Greenlet* g = greenlets[i].get();
        (void)::swapcontext(&hub_ctx, &g->ctx);
        hub->heartbeat.Beat();
        if (!g->finished) {
          ++i;
          continue;
        }
        progressed = true;
        if (!g->job.flags->killed.load(std::memory_order_acquire)) {
          std::lock_guard<std::mutex> lock(hub->mu);
          hub->done.push_back(detail::GreenHub::Done{
              g->job.slot, g->job.token, std::move(g->outcome)});
          hub->done_cv.notify_one();
        }
        greenlets.erase(greenlets.begin() + static_cast<std::ptrdiff_t>(i));
      }
      if (!progressed && !greenlets.empty()) std::this_thread::yield();
    }
    std::lock_guard<std::mutex> lock(hub->mu);
    hub->exited = true;
    hub->done_cv.notify_all();
  }

  // --------------------------------------------------------------------------
  // Slots (caller holds mutex_)
  // --------------------------------------------------------------------------

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
    s.flags = std::make_shared<detail::GreenFlags>();
    {
      std::lock_guard<std::mutex> lock(hub_->mu);
      hub_->jobs.push_back(
          detail::GreenHub::Job{req, s.token, i, limits.soft_ms, s.flags});
    }
    hub_->cv.notify_one();
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

  void KillSlotLocked(uint32_t i) {
    Slot& s = slots_[i];
    if (s.flags) {
      s.flags->cancel.store(true, std::memory_order_release);
      s.flags->killed.store(true, std::memory_order_release);
    }
    s.flags.reset();
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.started_us = 0U;
  }

  void HandleDoneLocked(detail::GreenHub::Done& d, detail::Deliveries& out) {
    if (d.slot >= slots_.size()) {
      (void)CompleteLocked(std::move(d.outcome), d.token, out);
      return;
    }
    Slot& s = slots_[d.slot];
    if (s.state != SlotState::kBusy || s.token != d.token) return;
    (void)CompleteLocked(std::move(d.outcome), d.token, out);
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.started_us = 0U;
    s.flags.reset();
    ++s.tasks_completed;
  }

  void EnforceLimitsLocked(uint64_t now, detail::Deliveries& out) {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.state != SlotState::kBusy) continue;
      if (s.soft_deadline_us != 0U && !s.soft_fired &&
          now >= s.soft_deadline_us) {
        s.soft_fired = true;
        if (s.flags) s.flags->cancel.store(true, std::memory_order_release);
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
        KillSlotLocked(i);
      }
    }
  }

  // --------------------------------------------------------------------------
  // Supervisor
  // --------------------------------------------------------------------------

  void SupervisorLoop() {
    const auto interval = std::chrono::milliseconds(config_.watchdog_interval_ms);
    std::deque<detail::GreenHub::Done> batch;
    for (;;) {
      bool stop = false;
      {
        std::unique_lock<std::mutex> lock(hub_->mu);
        hub_->done_cv.wait_for(lock, interval, [this] {
          return !hub_->done.empty() || hub_->stop_supervisor;
        });
        batch.swap(hub_->done);
        stop = hub_->stop_supervisor;
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

  static bool ProbeHub(uint32_t /*slot_id*/, void* ctx) {
    auto* self = static_cast<GreenPool*>(ctx);
    return SteadyNowUs() - self->hub_->heartbeat.LastBeatUs() <
           self->hub_timeout_us_;
  }

  static void OnHubStalled(uint32_t /*slot_id*/, const char* /*name*/,
                           void* ctx) {
    auto* self = static_cast<GreenPool*>(ctx);
    HIVE_LOG_ERROR("Pool",
                   "[%s] green hub blocked for over %llums: a task is not "
                   "yielding",
                   self->config_.name.c_str(),
                   static_cast<unsigned long long>(self->hub_timeout_us_ / 1000U));
  }

  static void OnHubRecovered(uint32_t /*slot_id*/, const char* /*name*/,
                             void* ctx) {
    auto* self = static_cast<GreenPool*>(ctx);
    HIVE_LOG_INFO("Pool", "[%s] green hub running again",
                  self->config_.name.c_str());
  }

  std::shared_ptr<detail::GreenHub> hub_;
  uint64_t hub_timeout_us_ = 0U;
  std::vector<Slot> slots_;
  SlotWatchdog<1> watchdog_;
  std::thread hub_thread_;
  std::thread supervisor_;
};

}  // namespace hive

#endif  // HIVE_HAS_UCONTEXT

#endif  // HIVE_POOL_GREEN_HPP_
