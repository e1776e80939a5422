/**
 * @file test_tasks.hpp
 * @brief Task handlers shared by the test binaries and hive_test_child.
 */

#ifndef HIVE_TESTS_TEST_TASKS_HPP_
#define HIVE_TESTS_TEST_TASKS_HPP_

#include "hive/platform.hpp"
#include "hive/pool.hpp"
#include "hive/registry.hpp"
#include "hive/task.hpp"

#include <pthread.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace hive_test {

/// Invocation counter; meaningful for in-process strategies only.
inline std::atomic<uint32_t>& Calls() {
  static std::atomic<uint32_t> n{0U};
  return n;
}

/// Sleep @p ms in small steps, stopping early on cancellation.
inline bool NapCooperatively(hive::TaskContext& ctx, int64_t ms) {
  const uint64_t end = hive::SteadyNowUs() + static_cast<uint64_t>(ms) * 1000U;
  while (hive::SteadyNowUs() < end) {
    if (ctx.SoftLimitExceeded()) return false;
    ctx.Yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

inline hive::TaskResult Add(const hive::TaskArgs& args, hive::TaskContext&) {
  ++Calls();
  return hive::TaskResult::Success(args.IntAt(0).value_or(0) +
                                   args.IntAt(1).value_or(0));
}

inline hive::TaskResult Echo(const hive::TaskArgs& args, hive::TaskContext&) {
  ++Calls();
  return hive::TaskResult::Success(
      hive::json{{"args", args.Positional()}, {"kwargs", args.Keywords()}});
}

inline hive::TaskResult Fail(const hive::TaskArgs&, hive::TaskContext&) {
  ++Calls();
  return hive::TaskResult::Failure("ValueError", "boom");
}

inline hive::TaskResult FailFatal(const hive::TaskArgs&, hive::TaskContext&) {
  ++Calls();
  return hive::TaskResult::Failure("ValueError", "fatal", false);
}

inline hive::TaskResult Throw(const hive::TaskArgs&, hive::TaskContext&) {
  ++Calls();
  throw std::runtime_error("thrown from handler");
}

/// args[0]: ms to sleep cooperatively.
inline hive::TaskResult Sleep(const hive::TaskArgs& args,
                              hive::TaskContext& ctx) {
  ++Calls();
  if (!NapCooperatively(ctx, args.IntAt(0).value_or(0))) {
    return hive::TaskResult::Failure(hive::error_type::kSoftTimeLimitExceeded,
                                     "stopped at soft limit", false);
  }
  return hive::TaskResult::Success("slept");
}

/// args[0]: ms to block, ignoring cancellation.
inline hive::TaskResult Block(const hive::TaskArgs& args, hive::TaskContext&) {
  ++Calls();
  std::this_thread::sleep_for(
      std::chrono::milliseconds(args.IntAt(0).value_or(0)));
  return hive::TaskResult::Success("blocked");
}

/// Terminates the hosting process with exit code 3.
inline hive::TaskResult Crash(const hive::TaskArgs&, hive::TaskContext&) {
  std::_Exit(3);
}

/// Ends the hosting thread without returning.
inline hive::TaskResult ExitThread(const hive::TaskArgs&, hive::TaskContext&) {
  ::pthread_exit(nullptr);
}

/// Ends the hosting thread until ctx.Retries() reaches args[0].
inline hive::TaskResult ExitThreadUntil(const hive::TaskArgs& args,
                                        hive::TaskContext& ctx) {
  if (static_cast<int64_t>(ctx.Retries()) < args.IntAt(0).value_or(1)) {
    ::pthread_exit(nullptr);
  }
  return hive::TaskResult::Success(ctx.Retries());
}

/// kwargs.countdown_ms: explicit retry countdown.
inline hive::TaskResult Retry(const hive::TaskArgs& args, hive::TaskContext&) {
  ++Calls();
  return hive::TaskResult::Retry(
      static_cast<uint64_t>(args.IntKw("countdown_ms").value_or(5)),
      hive::TaskError{"RetryMe", "asked to retry", true});
}

/// Fails until ctx.Retries() reaches args[0], then returns the retry count.
inline hive::TaskResult Flaky(const hive::TaskArgs& args,
                              hive::TaskContext& ctx) {
  ++Calls();
  if (static_cast<int64_t>(ctx.Retries()) < args.IntAt(0).value_or(1)) {
    return hive::TaskResult::Failure("Transient", "not yet");
  }
  return hive::TaskResult::Success(ctx.Retries());
}

inline hive::TaskResult Hostname(const hive::TaskArgs&, hive::TaskContext& ctx) {
  return hive::TaskResult::Success(std::string(ctx.Hostname()));
}

inline hive::TaskResult Pid(const hive::TaskArgs&, hive::TaskContext&) {
  return hive::TaskResult::Success(static_cast<int64_t>(::getpid()));
}

/// Allocates and touches args[0] MiB, keeping it for the process lifetime.
inline hive::TaskResult Grow(const hive::TaskArgs& args, hive::TaskContext&) {
  const size_t bytes = static_cast<size_t>(args.IntAt(0).value_or(1)) << 20U;
  char* p = static_cast<char*>(std::malloc(bytes));
  if (p == nullptr) return hive::TaskResult::Failure("MemoryError", "malloc");
  for (size_t i = 0; i < bytes; i += 4096U) p[i] = 1;
  return hive::TaskResult::Success(static_cast<int64_t>(::getpid()));
}

/// Retry policy with short, deterministic backoff.
inline hive::RetryPolicy FastRetry(uint32_t max_retries = 3U) {
  hive::RetryPolicy p;
  p.max_retries = max_retries;
  p.backoff_base_ms = 10U;
  p.backoff_max_ms = 40U;
  p.jitter = false;
  return p;
}

inline void RegisterTestTasks(hive::TaskRegistry& registry) {
  hive::TaskOptions fast;
  fast.retry = FastRetry();

  (void)registry.Register("test.add", &Add, fast);
  (void)registry.Register("test.echo", &Echo, fast);
  (void)registry.Register("test.fail", &Fail, fast);
  (void)registry.Register("test.fail_fatal", &FailFatal, fast);
  (void)registry.Register("test.throw", &Throw, fast);
  (void)registry.Register("test.sleep", &Sleep, fast);
  (void)registry.Register("test.block", &Block, fast);
  (void)registry.Register("test.crash", &Crash, fast);
  (void)registry.Register("test.exit_thread", &ExitThread, fast);
  (void)registry.Register("test.exit_until", &ExitThreadUntil, fast);
  (void)registry.Register("test.retry", &Retry, fast);
  (void)registry.Register("test.flaky", &Flaky, fast);
  (void)registry.Register("test.hostname", &Hostname, fast);
  (void)registry.Register("test.pid", &Pid, fast);
  (void)registry.Register("test.grow", &Grow, fast);
}

/// A request for @p task with JSON-encoded positional @p args.
inline hive::TaskRequest MakeRequest(const std::string& id,
                                     const std::string& task,
                                     const std::string& args = "[]") {
  hive::TaskRequest r;
  r.id = id;
  r.task = task;
  r.args_json = args;
  return r;
}

/// Thread-safe record of pool outcomes keyed by request id.
class OutcomeSink {
 public:
  hive::CompletionFn Callback() {
    return [this](const hive::Outcome& o) {
      std::lock_guard<std::mutex> lock(mu_);
      ++deliveries_[o.request_id];
      outcomes_[o.request_id] = o;
    };
  }

  bool Has(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return outcomes_.find(id) != outcomes_.end();
  }

  hive::Outcome Get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = outcomes_.find(id);
    return (it != outcomes_.end()) ? it->second : hive::Outcome();
  }

  /// Times the callback ran for @p id.
  uint32_t Deliveries(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = deliveries_.find(id);
    return (it != deliveries_.end()) ? it->second : 0U;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return outcomes_.size();
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, hive::Outcome> outcomes_;
  std::map<std::string, uint32_t> deliveries_;
};

/// Spin until @p pred holds or @p timeout_ms passes.
template <typename Pred>
bool WaitUntil(Pred pred, uint32_t timeout_ms = 5000U) {
  const auto end =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= end) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

}  // namespace hive_test

#endif  // HIVE_TESTS_TEST_TASKS_HPP_
