/**
 * @file child.hpp
 * @brief Pool child side of the process strategies.
 *
 * A forked child calls RunChildLoop() directly. A spawned child is a fresh
 * exec of the worker program, whose main() must register its tasks and
 * then call RunChildIfRequested() before doing anything else:
 *
 * @code
 *   int main(int argc, char** argv) {
 *     hive::TaskRegistry registry;
 *     RegisterTasks(registry);
 *     hive::RunChildIfRequested(registry);  // does not return in a child
 *     ...
 *   }
 * @endcode
 */

#ifndef HIVE_CHILD_HPP_
#define HIVE_CHILD_HPP_

#include "hive/platform.hpp"

#if defined(HIVE_HAS_FORK)

#include "hive/codec.hpp"
#include "hive/log.hpp"
#include "hive/process.hpp"
#include "hive/registry.hpp"
#include "hive/task.hpp"

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <string>

namespace hive {

/// Environment variables a spawning parent sets for its child.
constexpr const char* kChildFdEnv = "HIVE_CHILD_FD";
constexpr const char* kChildHostnameEnv = "HIVE_CHILD_HOSTNAME";
constexpr const char* kChildLogLevelEnv = "HIVE_CHILD_LOG_LEVEL";

namespace detail {

/// Set by SIGUSR1 (the parent's soft time limit signal).
inline std::atomic<bool>& ChildCancelFlag() noexcept {
  static std::atomic<bool> flag{false};
  return flag;
}

inline void OnSoftLimitSignal(int /*signo*/) {
  ChildCancelFlag().store(true, std::memory_order_relaxed);
}

inline void InstallChildSignals() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = &OnSoftLimitSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  (void)::sigaction(SIGUSR1, &sa, nullptr);
  // Terminal Ctrl-C reaches the whole process group; the parent decides.
  (void)::signal(SIGINT, SIG_IGN);
  (void)::signal(SIGPIPE, SIG_IGN);
}

inline TaskResult ResultFromOutcome(Outcome&& o) {
  if (o.kind == OutcomeKind::kSuccess) {
    return TaskResult::Success(std::move(o.result));
  }
  if (o.retry_requested) {
    return TaskResult::Retry(o.retry_countdown_ms, std::move(o.error));
  }
  return TaskResult::Failure(std::move(o.error));
}

}  // namespace detail

/// @brief Send one length-prefixed frame.
inline expected<void, ProcessError> SendFrame(int fd,
                                              const std::string& payload) {
  std::string buf;
  buf.reserve(payload.size() + 4U);
  AppendFrame(buf, payload);
  return WriteAll(fd, buf.data(), buf.size());
}

/**
 * @brief Serve requests from the parent on @p fd until it closes.
 *
 * @return Process exit code: 0 on orderly EOF, 1 on I/O error, 2 on a
 *         protocol error.
 */
inline int RunChildLoop(const TaskRegistry& registry, int fd,
                        const std::string& hostname) {
  detail::InstallChildSignals();
  HIVE_LOG_DEBUG("Child", "child %d serving on fd %d",
                 static_cast<int>(::getpid()), fd);

  FrameReader reader;
  std::string frame;
  char buf[16384];
  for (;;) {
    auto n = ReadSome(fd, buf, sizeof(buf));
    if (!n) {
      if (n.get_error() == ProcessError::kPeerClosed) {
        HIVE_LOG_DEBUG("Child", "parent closed channel, exiting");
        return 0;
      }
      HIVE_LOG_ERROR("Child", "read failed: %s",
                     ProcessErrorName(n.get_error()));
      return 1;
    }
    if (n.value() == 0U) continue;
    reader.Feed(buf, n.value());

    while (reader.Next(&frame)) {
      uint64_t soft_ms = 0U;
      auto req = DecodeChildRequest(frame, &soft_ms);
      if (!req) {
        HIVE_LOG_ERROR("Child", "bad request frame: %s",
                       CodecErrorName(req.get_error()));
        return 2;
      }
      detail::ChildCancelFlag().store(false, std::memory_order_relaxed);
      ExecEnv env;
      env.hostname = hostname.c_str();
      env.cancel_flag = &detail::ChildCancelFlag();
      env.soft_limit_ms = soft_ms;
      Outcome o = RunTask(registry, req.value(), env);
      const std::string id = o.request_id;
      const uint64_t runtime_us = o.runtime_us;
      auto w = SendFrame(
          fd, EncodeChildReply(id, detail::ResultFromOutcome(std::move(o)),
                               runtime_us));
      if (!w) {
        if (w.get_error() == ProcessError::kPeerClosed) return 0;
        HIVE_LOG_ERROR("Child", "reply for %s failed: %s", id.c_str(),
                       ProcessErrorName(w.get_error()));
        return 1;
      }
    }
    if (reader.Failed()) {
      HIVE_LOG_ERROR("Child", "oversized frame from parent");
      return 2;
    }
  }
}

/**
 * @brief If this process was started as a spawn-strategy child, serve the
 *        parent and exit. Otherwise return false immediately.
 */
inline bool RunChildIfRequested(const TaskRegistry& registry) {
  const char* fd_text = std::getenv(kChildFdEnv);
  if (fd_text == nullptr || *fd_text == '\0') return false;
  char* end = nullptr;
  const long fd = std::strtol(fd_text, &end, 10);
  if (end == fd_text || *end != '\0' || fd < 0) {
    HIVE_LOG_ERROR("Child", "invalid %s='%s'", kChildFdEnv, fd_text);
    std::exit(2);
  }
  const char* level_text = std::getenv(kChildLogLevelEnv);
  log::Level level;
  if (level_text != nullptr && log::ParseLevel(level_text, &level)) {
    log::SetLevel(level);
  }
  const char* host = std::getenv(kChildHostnameEnv);
  const std::string hostname = (host != nullptr) ? host : "";
  (void)::unsetenv(kChildFdEnv);
  (void)detail::SetCloexec(static_cast<int>(fd), true);
  std::exit(RunChildLoop(registry, static_cast<int>(fd), hostname));
}

}  // namespace hive

#endif  // HIVE_HAS_FORK

#endif  // HIVE_CHILD_HPP_
