/**
 * @file worker.hpp
 * @brief Worker facade: options -> pool -> dispatcher, plus signal handling.
 *
 * Usage:
 * @code
 *   int main() {
 *     hive::TaskRegistry registry;
 *     RegisterTasks(registry);
 *     if (hive::RunChildIfRequested(registry)) return 0;  // spawn children
 *     hive::Worker worker(options, registry, broker, &backend);
 *     auto r = worker.RunUntilSignal();   // SIGINT/SIGTERM: warm, again: cold
 *   }
 * @endcode
 */

#ifndef HIVE_WORKER_HPP_
#define HIVE_WORKER_HPP_

#include "hive/broker.hpp"
#include "hive/dispatcher.hpp"
#include "hive/log.hpp"
#include "hive/pool.hpp"
#include "hive/pool_factory.hpp"
#include "hive/registry.hpp"
#include "hive/shutdown.hpp"
#include "hive/worker_options.hpp"

#if defined(HIVE_HAS_FORK)
#include "hive/child.hpp"
#endif

#include <csignal>
#include <cstdint>

#include <atomic>
#include <memory>
#include <thread>

namespace hive {

enum class WorkerError : uint8_t {
  kAlreadyStarted = 0,
  kNotStarted,
  kPoolCreateFailed,
  kPoolStartFailed,
  kDispatcherFailed,
  kSignalSetupFailed,
  kLoopFailed
};

inline const char* WorkerErrorName(WorkerError e) noexcept {
  switch (e) {
    case WorkerError::kAlreadyStarted:    return "AlreadyStarted";
    case WorkerError::kNotStarted:        return "NotStarted";
    case WorkerError::kPoolCreateFailed:  return "PoolCreateFailed";
    case WorkerError::kPoolStartFailed:   return "PoolStartFailed";
    case WorkerError::kDispatcherFailed:  return "DispatcherFailed";
    case WorkerError::kSignalSetupFailed: return "SignalSetupFailed";
    case WorkerError::kLoopFailed:        return "LoopFailed";
    default:                              return "Unknown";
  }
}

/// @brief First SIGINT/SIGTERM is warm; a repeat, or SIGQUIT, is cold.
inline StopMode StopModeForSignal(int signo, uint32_t signals_seen) noexcept {
  if (signo == SIGQUIT || signals_seen > 1U) return StopMode::kCold;
  return StopMode::kWarm;
}

class Worker final {
 public:
  Worker(const WorkerOptions& options, TaskRegistry& registry, Broker& broker,
         ResultBackend* backend = nullptr)
      : options_(options),
        registry_(registry),
        broker_(broker),
        backend_(backend) {}

  ~Worker() {
    // Dispatcher first: its destructor stops the pool it references.
    dispatcher_.reset();
    if (pool_) pool_->Shutdown(0U);
  }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  /// @brief Create and start the pool, then start the dispatcher.
  expected<void, WorkerError> Start() {
    using R = expected<void, WorkerError>;
    if (pool_) return R::error(WorkerError::kAlreadyStarted);
    log::SetLevel(options_.log_level);

    auto created = CreatePool(options_.pool, registry_);
    if (!created) {
      HIVE_LOG_ERROR("Worker", "cannot create %s pool: %s",
                     PoolStrategyName(options_.pool.strategy),
                     PoolErrorName(created.get_error()));
      return R::error(WorkerError::kPoolCreateFailed);
    }
    pool_ = std::move(created.value());
    auto started = pool_->Start();
    if (!started) {
      HIVE_LOG_ERROR("Worker", "pool start failed: %s",
                     PoolErrorName(started.get_error()));
      pool_->Shutdown(0U);
      return R::error(WorkerError::kPoolStartFailed);
    }

    dispatcher_.reset(new Dispatcher(options_.dispatcher, registry_, *pool_,
                                     broker_, backend_));
    auto disp = dispatcher_->Start();
    if (!disp) {
      HIVE_LOG_ERROR("Worker", "dispatcher start failed: %s",
                     DispatchErrorName(disp.get_error()));
      dispatcher_.reset();
      pool_->Shutdown(0U);
      return R::error(WorkerError::kDispatcherFailed);
    }
    HIVE_LOG_INFO("Worker", "%s ready: %zu task(s), %s x%u",
                  options_.pool.hostname.c_str(), registry_.Size(),
                  PoolStrategyName(pool_->Strategy()), pool_->Concurrency());
    return R::success();
  }

  /// @brief Run the dispatch loop on this thread until a stop completes.
  expected<void, WorkerError> Run() {
    using R = expected<void, WorkerError>;
    if (!dispatcher_) {
      auto s = Start();
      if (!s) return s;
    }
    auto r = dispatcher_->Run();
    if (!r) {
      HIVE_LOG_ERROR("Worker", "dispatch loop failed: %s",
                     DispatchErrorName(r.get_error()));
      return R::error(WorkerError::kLoopFailed);
    }
    return R::success();
  }

  /**
   * @brief Run() with SIGINT/SIGTERM/SIGQUIT mapped to stop requests.
   *
   * A watcher thread turns each signal into RequestStop(); the loop itself
   * never runs in signal context.
   */
  expected<void, WorkerError> RunUntilSignal() {
    using R = expected<void, WorkerError>;
    ShutdownManager signals;
    if (!signals.IsValid() || !signals.InstallSignalHandlers()) {
      HIVE_LOG_ERROR("Worker", "signal handler setup failed");
      return R::error(WorkerError::kSignalSetupFailed);
    }
    if (!dispatcher_) {
      auto s = Start();
      if (!s) return s;
    }

    std::atomic<bool> done{false};
    std::thread watcher([this, &signals, &done] {
      uint32_t seen = 0U;
      while (!done.load(std::memory_order_acquire)) {
        const int signo = signals.WaitForSignal(100);
        if (signo == ShutdownManager::kTimedOut) continue;
        ++seen;
        const StopMode mode = StopModeForSignal(signo, seen);
        HIVE_LOG_INFO("Worker", "signal %d: %s stop", signo,
                      mode == StopMode::kWarm ? "warm" : "cold");
        RequestStop(mode);
      }
    });
    auto r = Run();
    done.store(true, std::memory_order_release);
    watcher.join();
    return r;
  }

  /// @brief Thread-safe; valid once Start() succeeded.
  void RequestStop(StopMode mode) {
    if (dispatcher_) dispatcher_->RequestStop(mode);
  }

  /// @brief Thread-safe; valid once Start() succeeded.
  void Revoke(const std::string& request_id) {
    if (dispatcher_) dispatcher_->Revoke(request_id);
  }

  bool IsStopped() const noexcept {
    return dispatcher_ != nullptr && dispatcher_->IsStopped();
  }

  DispatcherStats Stats() const {
    return dispatcher_ ? dispatcher_->GetStats() : DispatcherStats();
  }

  ExecutionPool* Pool() noexcept { return pool_.get(); }
  Dispatcher* GetDispatcher() noexcept { return dispatcher_.get(); }
  const WorkerOptions& Options() const noexcept { return options_; }

 private:
  WorkerOptions options_;
  TaskRegistry& registry_;
  Broker& broker_;
  ResultBackend* backend_;
  std::unique_ptr<ExecutionPool> pool_;
  std::unique_ptr<Dispatcher> dispatcher_;
};

}  // namespace hive

#endif  // HIVE_WORKER_HPP_
