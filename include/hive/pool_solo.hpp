/**
 * @file pool_solo.hpp
 * @brief Solo strategy: one slot, executed inline on the caller's thread.
 *
 * Submit() only queues; the owning loop calls Drive() to run queued work.
 * There is nothing to preempt, so a run that overran its hard limit is
 * reported as a timeout once it returns.
 */

#ifndef HIVE_POOL_SOLO_HPP_
#define HIVE_POOL_SOLO_HPP_

#include "hive/log.hpp"
#include "hive/pool.hpp"
#include "hive/registry.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace hive {

class SoloPool final : public detail::PoolBase {
 public:
  SoloPool(const PoolConfig& cfg, const TaskRegistry& registry)
      : PoolBase(cfg, registry, PoolStrategy::kSolo) {
    config_.concurrency = 1U;
  }

  ~SoloPool() override { Shutdown(0U); }

  expected<void, PoolError> Start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = BeginStartLocked();
    if (!r) return r;
    state_.store(RunState::kRunning, std::memory_order_release);
    HIVE_LOG_INFO("Pool", "[%s] solo pool started", config_.name.c_str());
    return expected<void, PoolError>::success();
  }

  expected<void, PoolError> Submit(const TaskRequest& req,
                                   CompletionFn on_complete) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = AdmitLocked(req, on_complete);
    if (!r) return r;
    pending_.push_back(req);
    return r;
  }

  expected<void, PoolError> RestartSlot(uint32_t slot_id) override {
    if (slot_id != 0U) {
      return expected<void, PoolError>::error(PoolError::kInvalidSlot);
    }
    return expected<void, PoolError>::success();
  }

  /**
   * A queued request completes immediately. The running request (only
   * reachable from inside a handler) gets its cancellation token set.
   */
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
      } else if (running_id_ == request_id) {
        cancel_.store(true, std::memory_order_release);
      }
    }
    detail::FlushDeliveries(out);
    return expected<void, PoolError>::success();
  }

  void Shutdown(uint32_t grace_ms) override {
    RunState st = state_.load(std::memory_order_acquire);
    if (st == RunState::kStopped) return;
    if (st == RunState::kRunning) {
      state_.store(RunState::kShuttingDown, std::memory_order_release);
    }
    // Queued work may still run inline within the grace period.
    const uint64_t deadline_us =
        SteadyNowUs() + static_cast<uint64_t>(grace_ms) * 1000U;
    while (grace_ms != 0U && SteadyNowUs() < deadline_us && RunOne()) {
    }
    detail::Deliveries out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      FailPendingLocked("Pool shut down before the task started", out);
      state_.store(RunState::kStopped, std::memory_order_release);
    }
    detail::FlushDeliveries(out);
  }

  /// @brief Run every queued request. @return number executed.
  uint32_t Drive() override {
    if (state_.load(std::memory_order_acquire) != RunState::kRunning) {
      return 0U;
    }
    uint32_t n = 0U;
    while (RunOne()) ++n;
    return n;
  }

  std::vector<SlotInfo> Slots() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    SlotInfo info;
    info.id = 0U;
    info.state = running_id_.empty() ? SlotState::kIdle : SlotState::kBusy;
    if (state_.load(std::memory_order_acquire) == RunState::kStopped) {
      info.state = SlotState::kStopped;
    }
    info.request_id = running_id_;
    info.started_us = started_us_;
    info.tasks_completed = tasks_completed_;
    return std::vector<SlotInfo>{info};
  }

 private:
  bool RunOne() {
    TaskRequest req;
    EffectiveLimits limits;
    uint64_t token = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!TakePendingLocked(&req)) return false;
      token = ledger_.Bind(req.id);
      running_id_ = req.id;
      started_us_ = SteadyNowUs();
      cancel_.store(false, std::memory_order_release);
    }
    limits = LimitsFor(req);

    ExecEnv env;
    env.hostname = config_.hostname.c_str();
    env.cancel_flag = &cancel_;
    env.soft_limit_ms = limits.soft_ms;
    env.slot = 0U;
    Outcome o = RunTask(registry_, req, env);

    if (limits.hard_ms != 0U && o.runtime_us > limits.hard_ms * 1000U) {
      HIVE_LOG_WARN("Pool", "[%s] %s ran %llums past its %llums hard limit",
                    config_.name.c_str(), req.id.c_str(),
                    static_cast<unsigned long long>(o.runtime_us / 1000U),
                    static_cast<unsigned long long>(limits.hard_ms));
      o = Outcome::Timeout(req.id, limits.hard_ms, o.runtime_us, 0U);
    }

    detail::Deliveries out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_id_.clear();
      started_us_ = 0U;
      ++tasks_completed_;
      (void)CompleteLocked(std::move(o), token, out);
    }
    detail::FlushDeliveries(out);
    return true;
  }

  std::atomic<bool> cancel_{false};
  std::string running_id_;
  uint64_t started_us_ = 0U;
  uint32_t tasks_completed_ = 0U;
};

}  // namespace hive

#endif  // HIVE_POOL_SOLO_HPP_
