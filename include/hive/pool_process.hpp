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
 * @file pool_process.hpp
 * @brief Process strategies: prefork (fork) and spawn (fork + exec).
 *
 * Architecture:
 *   Submit()/Terminate() --pending/commands + Waker--> supervisor thread
 *                                                          | IoPoller
 *                               child[0..N-1] <--frames--> socketpair
 *
 * The supervisor thread owns every child. It writes request frames,
 * reads reply frames, enforces time limits (SIGUSR1 at the soft limit,
 * SIGKILL at the hard limit), recycles children after
 * max_tasks_per_child tasks or when RSS exceeds max_memory_per_child, and
 * runs the slot watchdog whose probes reap dead children. A child that
 * dies while busy is reported as worker_lost and replaced.
 */

#ifndef HIVE_POOL_PROCESS_HPP_
#define HIVE_POOL_PROCESS_HPP_

#include "hive/platform.hpp"

#if defined(HIVE_HAS_FORK)

#include "hive/child.hpp"
#include "hive/codec.hpp"
#include "hive/io_poller.hpp"
#include "hive/log.hpp"
#include "hive/pool.hpp"
#include "hive/process.hpp"
#include "hive/registry.hpp"
#include "hive/watchdog.hpp"

#include <signal.h>

#include <cstdint>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hive {

class ProcessPool final : public detail::PoolBase {
 public:
  /// @param spawn  true: fork + exec config.spawn_executable per child.
  ProcessPool(const PoolConfig& cfg, const TaskRegistry& registry, bool spawn)
      : PoolBase(cfg, registry,
                 spawn ? PoolStrategy::kProcessSpawn : PoolStrategy::kProcessFork),
        spawn_(spawn) {}

  ~ProcessPool() override { Shutdown(0U); }

  ProcessPool(const ProcessPool&) = delete;
  ProcessPool& operator=(const ProcessPool&) = delete;

  expected<void, PoolError> Start() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = BeginStartLocked();
    if (!r) return r;
    if (spawn_ && config_.spawn_executable.empty()) {
#if defined(HIVE_PLATFORM_LINUX)
      config_.spawn_executable = "/proc/self/exe";
#else
      HIVE_LOG_ERROR("Pool", "[%s] spawn strategy needs spawn_executable",
                     config_.name.c_str());
      return expected<void, PoolError>::error(PoolError::kInvalidConfig);
#endif
    }
    if (!poller_.IsValid() || !waker_.IsValid() ||
        !poller_.Add(waker_.Fd(), static_cast<uint8_t>(IoEvent::kReadable))) {
      return expected<void, PoolError>::error(PoolError::kStartFailed);
    }

    slots_.resize(config_.concurrency);
    watchdog_.SetOnLost(&ProcessPool::OnChildLostThunk, this);
    for (uint32_t i = 0U; i < config_.concurrency; ++i) {
      auto reg = watchdog_.RegisterProbe("child", &ProcessPool::ProbeThunk, this);
      if (!reg.has_value() || reg.value().id.value() != i) {
        return expected<void, PoolError>::error(PoolError::kStartFailed);
      }
    }
    for (uint32_t i = 0U; i < config_.concurrency; ++i) {
      if (!StartChild(i)) {
        HIVE_LOG_ERROR("Pool", "[%s] could not start child %u",
                       config_.name.c_str(), i);
        for (uint32_t j = 0U; j < i; ++j) StopChild(j, 0U);
        return expected<void, PoolError>::error(PoolError::kStartFailed);
      }
    }
    PublishSnapshotLocked();
    state_.store(RunState::kRunning, std::memory_order_release);
    supervisor_ = std::thread([this]() { SupervisorLoop(); });
    HIVE_LOG_INFO("Pool", "[%s] %s pool started, %u children",
                  config_.name.c_str(), PoolStrategyName(config_.strategy),
                  config_.concurrency);
    return expected<void, PoolError>::success();
  }

  expected<void, PoolError> Submit(const TaskRequest& req,
                                   CompletionFn on_complete) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto r = AdmitLocked(req, on_complete);
      if (!r) return r;
      pending_.push_back(req);
    }
    waker_.Notify();
    return expected<void, PoolError>::success();
  }

  expected<void, PoolError> RestartSlot(uint32_t slot_id) override {
    if (slot_id >= config_.concurrency) {
      return expected<void, PoolError>::error(PoolError::kInvalidSlot);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_.load(std::memory_order_acquire) != RunState::kRunning) {
        return expected<void, PoolError>::error(PoolError::kNotRunning);
      }
      commands_.push_back(Command{Command::kRestart, std::string(),
                                  TerminateReason::kRevoked, slot_id});
    }
    waker_.Notify();
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
        commands_.push_back(
            Command{Command::kTerminate, request_id, reason, kNoSlot});
      }
    }
    detail::FlushDeliveries(out);
    waker_.Notify();
    return expected<void, PoolError>::success();
  }

  void Shutdown(uint32_t grace_ms) override {
    bool drained = true;
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
      drained = WaitDrained(lock, grace_ms);
    }
    force_stop_.store(!drained, std::memory_order_release);
    stop_.store(true, std::memory_order_release);
    waker_.Notify();
    if (supervisor_.joinable()) supervisor_.join();
    state_.store(RunState::kStopped, std::memory_order_release);
    HIVE_LOG_INFO("Pool", "[%s] stopped", config_.name.c_str());
  }

  std::vector<SlotInfo> Slots() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
  }

 private:
  static constexpr uint64_t kRespawnBackoffUs = 1000000U;
  static constexpr uint32_t kRecycleWaitMs = 1000U;

  struct Slot {
    ChildProcess child;
    SlotState state = SlotState::kStarting;
    std::string request_id;
    uint64_t token = 0U;
    uint64_t started_us = 0U;
    uint64_t soft_deadline_us = 0U;
    uint64_t hard_deadline_us = 0U;
    uint64_t hard_ms = 0U;
    bool soft_sent = false;
    bool recycle_requested = false;
    bool in_poller = false;
    uint32_t tasks_completed = 0U;
    uint64_t generation = 0U;
    uint64_t respawn_at_us = 0U;
    FrameReader reader;
  };

  struct Command {
    enum Kind : uint8_t { kTerminate = 0, kRestart };
    Kind kind;
    std::string request_id;
    TerminateReason reason;
    uint32_t slot;
  };

  // --------------------------------------------------------------------------
  // Child lifecycle (supervisor thread, or Start() before it exists)
  // --------------------------------------------------------------------------

  std::vector<int> SiblingFds(uint32_t self) const {
    std::vector<int> fds;
    fds.push_back(waker_.Fd());
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (i != self && slots_[i].child.Fd() >= 0) {
        fds.push_back(slots_[i].child.Fd());
      }
    }
    return fds;
  }

  bool StartChild(uint32_t i) {
    Slot& s = slots_[i];
    expected<ChildProcess, ProcessError> r =
        expected<ChildProcess, ProcessError>::error(ProcessError::kForkFailed);
    if (spawn_) {
      SpawnSpec spec;
      spec.executable = config_.spawn_executable;
      spec.args = config_.spawn_args;
      spec.env.emplace_back(kChildHostnameEnv, config_.hostname);
      spec.env.emplace_back(kChildLogLevelEnv,
                            log::detail::LevelTag(log::GetLevel()));
      spec.fd_env_name = kChildFdEnv;
      r = ChildProcess::Spawn(spec);
    } else {
      const TaskRegistry& registry = registry_;
      const std::string hostname = config_.hostname;
      r = ChildProcess::Fork(
          [&registry, &hostname](int fd) {
            return RunChildLoop(registry, fd, hostname);
          },
          SiblingFds(i));
    }
    if (!r) {
      HIVE_LOG_ERROR("Pool", "[%s] slot %u: %s failed: %s",
                     config_.name.c_str(), i, spawn_ ? "spawn" : "fork",
                     ProcessErrorName(r.get_error()));
      s.state = SlotState::kStopped;
      s.respawn_at_us = SteadyNowUs() + kRespawnBackoffUs;
      return false;
    }
    s.child = std::move(r.value());
    (void)detail::SetNonBlocking(s.child.Fd());
    s.in_poller = static_cast<bool>(
        poller_.Add(s.child.Fd(), static_cast<uint8_t>(IoEvent::kReadable)));
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.token = 0U;
    s.started_us = 0U;
    s.recycle_requested = false;
    s.tasks_completed = 0U;
    s.respawn_at_us = 0U;
    s.reader.Reset();
    ++s.generation;
    HIVE_LOG_DEBUG("Pool", "[%s] slot %u: child pid %d up",
                   config_.name.c_str(), i, static_cast<int>(s.child.Pid()));
    return true;
  }

  void DetachChannel(Slot& s) {
    if (s.in_poller) {
      (void)poller_.Remove(s.child.Fd());
      s.in_poller = false;
    }
  }

  /// @brief Orderly stop: close the channel, wait, then SIGKILL.
  void StopChild(uint32_t i, uint32_t wait_ms) {
    Slot& s = slots_[i];
    if (!s.child.Valid()) return;
    DetachChannel(s);
    s.child.CloseChannel();
    if (wait_ms != 0U) {
      ExitStatus st = s.child.WaitFor(wait_ms);
      if (st.timed_out) (void)s.child.Kill();
    } else {
      (void)s.child.Kill();
    }
    s.child = ChildProcess();
    s.state = SlotState::kStopped;
  }

  void Recycle(uint32_t i, const char* why) {
    HIVE_LOG_INFO("Pool", "[%s] recycling child %d on slot %u (%s)",
                  config_.name.c_str(),
                  static_cast<int>(slots_[i].child.Pid()), i, why);
    StopChild(i, kRecycleWaitMs);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.restarts;
    }
    (void)StartChild(i);
  }

  /// @brief SIGKILL a busy child, report @p o, and replace the child.
  void KillBusy(uint32_t i, Outcome&& o) {
    Slot& s = slots_[i];
    {
      std::lock_guard<std::mutex> lock(mutex_);
      (void)CompleteLocked(std::move(o), s.token, deliveries_);
      ++stats_.restarts;
    }
    DetachChannel(s);
    (void)s.child.Kill();
    s.child = ChildProcess();
    s.state = SlotState::kStopped;
    s.request_id.clear();
    if (!stop_.load(std::memory_order_acquire)) (void)StartChild(i);
  }

  /// @brief Reaped child: report its request (if any) and replace it.
  void HandleChildExit(uint32_t i) {
    Slot& s = slots_[i];
    const std::string status = s.child.Status().Describe();
    const int pid = static_cast<int>(s.child.Pid());
    DetachChannel(s);
    if (s.state == SlotState::kBusy) {
      HIVE_LOG_ERROR("Pool", "[%s] child %d died running %s: %s",
                     config_.name.c_str(), pid, s.request_id.c_str(),
                     status.c_str());
      Outcome o = Outcome::WorkerLost(
          s.request_id, "Worker exited prematurely: " + status, i);
      o.runtime_us = SteadyNowUs() - s.started_us;
      std::lock_guard<std::mutex> lock(mutex_);
      (void)CompleteLocked(std::move(o), s.token, deliveries_);
      ++stats_.restarts;
    } else {
      HIVE_LOG_WARN("Pool", "[%s] idle child %d exited: %s",
                    config_.name.c_str(), pid, status.c_str());
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.restarts;
    }
    s.child = ChildProcess();
    s.state = SlotState::kStopped;
    s.request_id.clear();
    if (!stop_.load(std::memory_order_acquire)) (void)StartChild(i);
    watchdog_.Reset(WatchdogSlotId(i));
  }

  // --------------------------------------------------------------------------
  // Request flow
  // --------------------------------------------------------------------------

  void Dispatch(uint32_t i, TaskRequest&& req, uint64_t token) {
    Slot& s = slots_[i];
    const EffectiveLimits limits = LimitsFor(req);
    const uint64_t now = SteadyNowUs();
    s.state = SlotState::kBusy;
    s.request_id = req.id;
    s.token = token;
    s.started_us = now;
    s.soft_deadline_us = (limits.soft_ms != 0U) ? now + limits.soft_ms * 1000U : 0U;
    s.hard_deadline_us = (limits.hard_ms != 0U) ? now + limits.hard_ms * 1000U : 0U;
    s.hard_ms = limits.hard_ms;
    s.soft_sent = false;
    auto w = SendFrame(s.child.Fd(), EncodeChildRequest(req, limits.soft_ms));
    if (!w) {
      HIVE_LOG_ERROR("Pool", "[%s] slot %u: send failed: %s",
                     config_.name.c_str(), i, ProcessErrorName(w.get_error()));
      KillBusy(i, Outcome::WorkerLost(req.id, "Could not hand task to worker",
                                      i));
    }
  }

  void AssignPending() {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      if (slots_[i].state != SlotState::kIdle) continue;
      TaskRequest req;
      uint64_t token = 0U;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!TakePendingLocked(&req)) return;
        token = ledger_.Bind(req.id);
      }
      Dispatch(i, std::move(req), token);
    }
  }

  void HandleReply(uint32_t i, const std::string& frame) {
    Slot& s = slots_[i];
    auto reply = DecodeChildReply(frame);
    if (!reply) {
      HIVE_LOG_ERROR("Pool", "[%s] slot %u: bad reply frame: %s",
                     config_.name.c_str(), i, CodecErrorName(reply.get_error()));
      if (s.state == SlotState::kBusy) {
        KillBusy(i, Outcome::WorkerLost(s.request_id,
                                        "Worker sent a malformed reply", i));
      }
      return;
    }
    ChildReply& r = reply.value();
    if (s.state != SlotState::kBusy || r.id != s.request_id) {
      HIVE_LOG_WARN("Pool", "[%s] slot %u: unexpected reply for %s",
                    config_.name.c_str(), i, r.id.c_str());
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      (void)CompleteLocked(
          Outcome::FromResult(r.id, std::move(r.result), r.runtime_us, i),
          s.token, deliveries_);
    }
    s.state = SlotState::kIdle;
    s.request_id.clear();
    s.started_us = 0U;
    ++s.tasks_completed;

    if (stop_.load(std::memory_order_acquire)) return;
    if (config_.max_tasks_per_child != 0U &&
        s.tasks_completed >= config_.max_tasks_per_child) {
      Recycle(i, "max tasks per child");
    } else if (s.recycle_requested) {
      Recycle(i, "restart requested");
    } else if (config_.max_memory_per_child != 0U) {
      optional<uint64_t> rss = ReadRssBytes(s.child.Pid());
      if (rss.has_value() && *rss > config_.max_memory_per_child) {
        HIVE_LOG_WARN("Pool", "[%s] child %d RSS %llu bytes over limit %llu",
                      config_.name.c_str(), static_cast<int>(s.child.Pid()),
                      static_cast<unsigned long long>(*rss),
                      static_cast<unsigned long long>(
                          config_.max_memory_per_child));
        Recycle(i, "max memory per child");
      }
    }
  }

  void ReadFromSlot(uint32_t i) {
    Slot& s = slots_[i];
    char buf[16384];
    std::string frame;
    for (;;) {
      if (!s.in_poller) return;
      auto n = ReadSome(s.child.Fd(), buf, sizeof(buf));
      if (!n) {
        // EOF: the child is exiting; the watchdog probe reaps it.
        HIVE_LOG_DEBUG("Pool", "[%s] slot %u: channel closed (%s)",
                       config_.name.c_str(), i, ProcessErrorName(n.get_error()));
        DetachChannel(s);
        return;
      }
      if (n.value() == 0U) return;
      s.reader.Feed(buf, n.value());
      const uint64_t generation = s.generation;
      while (s.generation == generation && s.reader.Next(&frame)) {
        HandleReply(i, frame);
      }
      if (s.generation != generation) return;
      if (s.reader.Failed()) {
        HIVE_LOG_ERROR("Pool", "[%s] slot %u: oversized reply frame",
                       config_.name.c_str(), i);
        if (s.state == SlotState::kBusy) {
          KillBusy(i, Outcome::WorkerLost(s.request_id,
                                          "Worker sent a malformed reply", i));
        } else {
          Recycle(i, "protocol error");
        }
        return;
      }
    }
  }

  void RunCommands() {
    std::vector<Command> cmds;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cmds.swap(commands_);
    }
    for (auto& c : cmds) {
      if (c.kind == Command::kRestart) {
        if (c.slot >= slots_.size()) continue;
        if (slots_[c.slot].state == SlotState::kBusy) {
          slots_[c.slot].recycle_requested = true;
        } else if (slots_[c.slot].state == SlotState::kIdle) {
          Recycle(c.slot, "restart requested");
        }
        continue;
      }
      for (uint32_t i = 0U; i < slots_.size(); ++i) {
        Slot& s = slots_[i];
        if (s.state != SlotState::kBusy || s.request_id != c.request_id) {
          continue;
        }
        HIVE_LOG_WARN("Pool", "[%s] terminating %s (child %d)",
                      config_.name.c_str(), c.request_id.c_str(),
                      static_cast<int>(s.child.Pid()));
        KillBusy(i, TerminatedOutcome(c.request_id, c.reason, s.hard_ms,
                                      SteadyNowUs() - s.started_us, i));
        break;
      }
    }
  }

  void EnforceLimits(uint64_t now) {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.state != SlotState::kBusy) continue;
      if (s.soft_deadline_us != 0U && !s.soft_sent && now >= s.soft_deadline_us) {
        s.soft_sent = true;
        HIVE_LOG_WARN("Pool", "[%s] soft time limit exceeded for %s",
                      config_.name.c_str(), s.request_id.c_str());
        (void)s.child.Signal(SIGUSR1);
      }
      if (s.hard_deadline_us != 0U && now >= s.hard_deadline_us) {
        HIVE_LOG_ERROR("Pool",
                       "[%s] hard time limit (%llums) exceeded for %s, "
                       "killing child %d",
                       config_.name.c_str(),
                       static_cast<unsigned long long>(s.hard_ms),
                       s.request_id.c_str(), static_cast<int>(s.child.Pid()));
        KillBusy(i, Outcome::Timeout(s.request_id, s.hard_ms,
                                     now - s.started_us, i));
      }
    }
  }

  void RespawnStopped(uint64_t now) {
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.state == SlotState::kStopped && s.respawn_at_us != 0U &&
          now >= s.respawn_at_us) {
        (void)StartChild(i);
      }
    }
  }

  int32_t NextTimeoutMs(uint64_t now) const {
    uint64_t timeout_us =
        static_cast<uint64_t>(config_.watchdog_interval_ms) * 1000U;
    for (const auto& s : slots_) {
      if (s.state != SlotState::kBusy) continue;
      const uint64_t deadlines[2] = {s.soft_sent ? 0U : s.soft_deadline_us,
                                     s.hard_deadline_us};
      for (uint64_t d : deadlines) {
        if (d == 0U) continue;
        const uint64_t wait = (d > now) ? d - now : 0U;
        if (wait < timeout_us) timeout_us = wait;
      }
    }
    return static_cast<int32_t>((timeout_us + 999U) / 1000U);
  }

  void PublishSnapshotLocked() {
    snapshot_.clear();
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      const Slot& s = slots_[i];
      SlotInfo info;
      info.id = i;
      info.state = s.state;
      info.request_id = s.request_id;
      info.started_us = s.started_us;
      info.pid = static_cast<int32_t>(s.child.Pid());
      info.tasks_completed = s.tasks_completed;
      info.generation = s.generation;
      snapshot_.push_back(std::move(info));
    }
  }

  // --------------------------------------------------------------------------
  // Supervisor
  // --------------------------------------------------------------------------

  void SupervisorLoop() {
    while (!stop_.load(std::memory_order_acquire)) {
      auto n = poller_.Wait(NextTimeoutMs(SteadyNowUs()));
      if (n.has_value()) {
        const PollResult* results = poller_.Results();
        for (uint32_t k = 0U; k < n.value(); ++k) {
          const int32_t fd = results[k].fd;
          if (fd == waker_.Fd()) {
            waker_.Drain();
            continue;
          }
          for (uint32_t i = 0U; i < slots_.size(); ++i) {
            if (slots_[i].in_poller && slots_[i].child.Fd() == fd) {
              ReadFromSlot(i);
              break;
            }
          }
        }
      }
      RunCommands();
      (void)watchdog_.Check();
      const uint64_t now = SteadyNowUs();
      EnforceLimits(now);
      RespawnStopped(now);
      AssignPending();
      Flush();
    }
    StopAll();
  }

  void Flush() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      PublishSnapshotLocked();
    }
    detail::FlushDeliveries(deliveries_);
  }

  /// @brief Final pass once Shutdown() released the supervisor.
  void StopAll() {
    const bool force = force_stop_.load(std::memory_order_acquire);
    for (uint32_t i = 0U; i < slots_.size(); ++i) {
      Slot& s = slots_[i];
      if (s.state == SlotState::kBusy) {
        Outcome o = Outcome::WorkerLost(
            s.request_id, "Worker terminated at pool shutdown", i);
        o.runtime_us = SteadyNowUs() - s.started_us;
        std::lock_guard<std::mutex> lock(mutex_);
        (void)CompleteLocked(std::move(o), s.token, deliveries_);
      }
      StopChild(i, force ? 0U : kRecycleWaitMs);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      FailPendingLocked("Pool shut down before the task started", deliveries_);
    }
    Flush();
  }

  static bool ProbeThunk(uint32_t slot_id, void* ctx) {
    auto* self = static_cast<ProcessPool*>(ctx);
    if (slot_id >= self->slots_.size()) return true;
    Slot& s = self->slots_[slot_id];
    if (!s.child.Valid()) return true;
    return !s.child.TryReap();
  }

  static void OnChildLostThunk(uint32_t slot_id, const char* /*name*/,
                               void* ctx) {
    auto* self = static_cast<ProcessPool*>(ctx);
    if (slot_id < self->slots_.size() && self->slots_[slot_id].child.Valid() &&
        self->slots_[slot_id].child.Reaped()) {
      self->HandleChildExit(slot_id);
    }
  }

  const bool spawn_;
  IoPoller poller_;
  Waker waker_;
  std::vector<Slot> slots_;             ///< supervisor thread only
  detail::Deliveries deliveries_;       ///< supervisor thread only
  SlotWatchdog<kMaxPoolSlots> watchdog_;
  std::vector<Command> commands_;       ///< guarded by mutex_
  std::vector<SlotInfo> snapshot_;      ///< guarded by mutex_
  std::atomic<bool> stop_{false};
  std::atomic<bool> force_stop_{false};
  std::thread supervisor_;
};

}  // namespace hive

#endif  // HIVE_HAS_FORK

#endif  // HIVE_POOL_PROCESS_HPP_
