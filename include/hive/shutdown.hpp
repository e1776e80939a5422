/**
 * @file shutdown.hpp
 * @brief Signal-driven worker shutdown for POSIX systems (Linux/macOS).
 *
 * A self-pipe makes the signal handler async-signal-safe: each delivered
 * SIGINT/SIGTERM/SIGQUIT writes its number to the pipe, and a watcher
 * thread reads them with WaitForSignal(). The worker maps the first
 * SIGINT/SIGTERM to a warm stop and a repeat (or SIGQUIT) to a cold stop.
 * Cleanup callbacks run in LIFO order. Compatible with -fno-exceptions.
 */

#ifndef HIVE_SHUTDOWN_HPP_
#define HIVE_SHUTDOWN_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace hive {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// @brief Cleanup callback. Receives the signal number (0 for manual).
using ShutdownFn = void (*)(int signo);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may be active per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownManager
// ============================================================================

/**
 * Usage:
 * @code
 *   hive::ShutdownManager mgr;
 *   mgr.InstallSignalHandlers();
 *   int first = mgr.WaitForSignal(-1);   // warm stop
 *   int second = mgr.WaitForSignal(-1);  // cold stop
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr int kTimedOut = -1;

  explicit ShutdownManager(uint32_t max_callbacks = 16) noexcept
      : max_callbacks_((max_callbacks <= kMaxCallbacks) ? max_callbacks
                                                        : kMaxCallbacks) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) {
      return;  // invalid: every call reports kAlreadyInstantiated
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    for (int fd : pipe_fd_) {
      (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    // A signal storm must never block the handler.
    (void)::fcntl(pipe_fd_[1], F_SETFL, ::fcntl(pipe_fd_[1], F_GETFL) | O_NONBLOCK);
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::GetShutdownInstance() == this) {
      RestoreSignalHandlers();
      detail::GetShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= max_callbacks_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_++] = fn;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Install handlers for SIGINT, SIGTERM and SIGQUIT (SA_RESTART).
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    for (uint32_t i = 0; i < kSignalCount; ++i) {
      if (::sigaction(kSignals[i], &sa, &previous_[i]) != 0) {
        return expected<void, ShutdownError>::error(
            ShutdownError::kSignalInstallFailed);
      }
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Manually request shutdown; wakes WaitForSignal() with @p signo.
  void Quit(int signo = 0) noexcept { Post(signo); }

  /**
   * @brief Block until the next signal (or Quit) arrives.
   * @param timeout_ms  -1 waits forever.
   * @return The signal number, 0 for a manual Quit(), kTimedOut on timeout.
   */
  int WaitForSignal(int32_t timeout_ms = -1) noexcept {
    if (pipe_fd_[0] < 0) return kTimedOut;
    struct pollfd pfd;
    pfd.fd = pipe_fd_[0];
    pfd.events = POLLIN;
    for (;;) {
      pfd.revents = 0;
      int r = ::poll(&pfd, 1, timeout_ms);
      if (r < 0 && errno == EINTR) continue;
      if (r <= 0) return kTimedOut;
      uint8_t byte = 0;
      ssize_t n = ::read(pipe_fd_[0], &byte, 1);
      if (n == 1) return static_cast<int>(byte);
      if (n < 0 && errno == EINTR) continue;
      return kTimedOut;
    }
  }

  /// @brief Block for the first signal, then run callbacks LIFO.
  void WaitForShutdown() noexcept {
    int signo = WaitForSignal(-1);
    RunCallbacks(signo < 0 ? 0 : signo);
  }

  void RunCallbacks(int signo) noexcept {
    for (uint32_t i = callback_count_; i > 0U; --i) {
      if (callbacks_[i - 1U] != nullptr) callbacks_[i - 1U](signo);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return signal_count_.load(std::memory_order_acquire) > 0U;
  }

  /// @brief Signals (and Quit calls) received so far.
  uint32_t SignalCount() const noexcept {
    return signal_count_.load(std::memory_order_acquire);
  }

 private:
  static constexpr uint32_t kMaxCallbacks = 16;
  static constexpr uint32_t kSignalCount = 3;
  static constexpr int kSignals[kSignalCount] = {SIGINT, SIGTERM, SIGQUIT};

  void Post(int signo) noexcept {
    signal_count_.fetch_add(1U, std::memory_order_acq_rel);
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = static_cast<uint8_t>(signo);
      ssize_t n = ::write(pipe_fd_[1], &byte, 1);
      (void)n;
    }
  }

  void RestoreSignalHandlers() noexcept {
    if (!installed_) return;
    for (uint32_t i = 0; i < kSignalCount; ++i) {
      (void)::sigaction(kSignals[i], &previous_[i], nullptr);
    }
    installed_ = false;
  }

  /// Async-signal-safe: one atomic add and one write(2).
  static void SignalHandler(int signo) {
    const int saved_errno = errno;
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) self->Post(signo);
    errno = saved_errno;
  }

  ShutdownFn callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_ = 0;
  uint32_t max_callbacks_;
  std::atomic<uint32_t> signal_count_{0};
  int pipe_fd_[2];
  struct sigaction previous_[kSignalCount] = {};
  bool installed_ = false;
  bool valid_ = false;
};

}  // namespace hive

#endif  // HIVE_SHUTDOWN_HPP_
