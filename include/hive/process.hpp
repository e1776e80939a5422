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
 * @file process.hpp
 * @brief Child process control for the process pool strategies.
 *
 * ChildProcess owns one pool child and the parent end of its control
 * socket (an AF_UNIX socketpair). Two ways to start one:
 *   - Fork():  duplicate the parent image and run a function in the child.
 *   - Spawn(): fork + exec a fresh executable. The child inherits only the
 *              control socket (announced in an environment variable) and
 *              default signal dispositions. Exec failures are reported
 *              back through a close-on-exec status pipe, so Spawn() fails
 *              synchronously instead of yielding a child that dies at once.
 *
 * Also: non-blocking reaping, bounded waits, /proc RSS sampling.
 * Linux and macOS; RSS sampling is Linux-only.
 */

#ifndef HIVE_PROCESS_HPP_
#define HIVE_PROCESS_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#if defined(HIVE_HAS_FORK)

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#if defined(HIVE_PLATFORM_LINUX)
#include <sys/prctl.h>
#endif

extern char** environ;  // NOLINT

namespace hive {

enum class ProcessError : uint8_t {
  kSocketFailed = 0,
  kForkFailed,
  kExecFailed,
  kNotRunning,
  kSignalFailed,
  kIoFailed,
  kPeerClosed
};

inline const char* ProcessErrorName(ProcessError e) noexcept {
  switch (e) {
    case ProcessError::kSocketFailed: return "SocketFailed";
    case ProcessError::kForkFailed:   return "ForkFailed";
    case ProcessError::kExecFailed:   return "ExecFailed";
    case ProcessError::kNotRunning:   return "NotRunning";
    case ProcessError::kSignalFailed: return "SignalFailed";
    case ProcessError::kIoFailed:     return "IoFailed";
    case ProcessError::kPeerClosed:   return "PeerClosed";
    default:                          return "Unknown";
  }
}

// ============================================================================
// ExitStatus
// ============================================================================

struct ExitStatus {
  bool exited = false;
  int exit_code = 0;
  bool signaled = false;
  int term_signal = 0;
  bool timed_out = false;

  /// @brief "exitcode 3", "signal 9 (SIGKILL)", "still running".
  std::string Describe() const;
};

namespace detail {

inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>((ms % 1000U) * 1000000L);
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

inline int ReadProcFile(const char* path, char* buf, size_t buf_size) {
  int fd = ::open(path, O_RDONLY | O_CLOEXEC);
  if (fd < 0) return -1;
  ssize_t n = ::read(fd, buf, buf_size - 1);
  ::close(fd);
  if (n < 0) return -1;
  buf[n] = '\0';
  return static_cast<int>(n);
}

inline bool SetCloexec(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFD, 0);
  if (flags < 0) return false;
  flags = on ? (flags | FD_CLOEXEC) : (flags & ~FD_CLOEXEC);
  return ::fcntl(fd, F_SETFD, flags) == 0;
}

inline bool SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

inline void FillExitStatus(int status, ExitStatus& es) {
  if (WIFEXITED(status)) {
    es.exited = true;
    es.exit_code = WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    es.signaled = true;
    es.term_signal = WTERMSIG(status);
  }
}

/// Upper bound for the close-all loop between fork and exec.
inline int MaxFdToClose() {
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd <= 0 || max_fd > 65536) max_fd = 65536;
  return static_cast<int>(max_fd);
}

/// Child side, between fork and exec/work: restore default signal state.
inline void ResetChildSignals() {
  struct sigaction sa_dfl;
  std::memset(&sa_dfl, 0, sizeof(sa_dfl));
  sa_dfl.sa_handler = SIG_DFL;
  for (int sig = 1; sig < 32; ++sig) {
    (void)::sigaction(sig, &sa_dfl, nullptr);  // fails for KILL/STOP only
  }
  sigset_t none;
  sigemptyset(&none);
  (void)::pthread_sigmask(SIG_SETMASK, &none, nullptr);
#if defined(HIVE_PLATFORM_LINUX)
  // Orphaned pool children must not outlive the worker.
  (void)::prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
}

}  // namespace detail

inline const char* SignalName(int sig) noexcept {
  switch (sig) {
    case SIGHUP:  return "SIGHUP";
    case SIGINT:  return "SIGINT";
    case SIGQUIT: return "SIGQUIT";
    case SIGILL:  return "SIGILL";
    case SIGABRT: return "SIGABRT";
    case SIGBUS:  return "SIGBUS";
    case SIGFPE:  return "SIGFPE";
    case SIGKILL: return "SIGKILL";
    case SIGUSR1: return "SIGUSR1";
    case SIGSEGV: return "SIGSEGV";
    case SIGUSR2: return "SIGUSR2";
    case SIGPIPE: return "SIGPIPE";
    case SIGALRM: return "SIGALRM";
    case SIGTERM: return "SIGTERM";
    default:      return "SIG?";
  }
}

inline std::string ExitStatus::Describe() const {
  char buf[64];
  if (signaled) {
    std::snprintf(buf, sizeof(buf), "signal %d (%s)", term_signal,
                  SignalName(term_signal));
  } else if (exited) {
    std::snprintf(buf, sizeof(buf), "exitcode %d", exit_code);
  } else {
    std::snprintf(buf, sizeof(buf), "still running");
  }
  return std::string(buf);
}

inline bool IsProcessAlive(pid_t pid) {
  if (pid <= 0) return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

/**
 * @brief Resident set size of @p pid, from VmRSS in /proc/<pid>/status.
 * @return Empty on non-Linux hosts or when the process is gone.
 */
inline optional<uint64_t> ReadRssBytes(pid_t pid) {
#if defined(HIVE_PLATFORM_LINUX)
  char path[64];
  std::snprintf(path, sizeof(path), "/proc/%d/status", static_cast<int>(pid));
  char buf[4096];
  if (detail::ReadProcFile(path, buf, sizeof(buf)) <= 0) return nullopt;
  const char* line = std::strstr(buf, "VmRSS:");
  if (line == nullptr) return nullopt;
  line += 6;
  char* end = nullptr;
  unsigned long long kb = std::strtoull(line, &end, 10);
  if (end == line) return nullopt;
  return static_cast<uint64_t>(kb) * 1024ULL;
#else
  (void)pid;
  return nullopt;
#endif
}

// ============================================================================
// Blocking socket I/O
// ============================================================================

/// @brief Write all of @p data; MSG_NOSIGNAL so a dead peer is an error.
inline expected<void, ProcessError> WriteAll(int fd, const char* data,
                                             size_t len) {
  size_t off = 0;
  while (off < len) {
    ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        detail::SleepMs(1);
        continue;
      }
      return expected<void, ProcessError>::error(
          (errno == EPIPE || errno == ECONNRESET) ? ProcessError::kPeerClosed
                                                  : ProcessError::kIoFailed);
    }
    off += static_cast<size_t>(n);
  }
  return expected<void, ProcessError>::success();
}

/**
 * @brief One read(2) into @p buf.
 * @return Bytes read (0 when a non-blocking fd has nothing), kPeerClosed
 *         on EOF.
 */
inline expected<size_t, ProcessError> ReadSome(int fd, char* buf, size_t len) {
  for (;;) {
    ssize_t n = ::read(fd, buf, len);
    if (n > 0) return expected<size_t, ProcessError>::success(
        static_cast<size_t>(n));
    if (n == 0) {
      return expected<size_t, ProcessError>::error(ProcessError::kPeerClosed);
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return expected<size_t, ProcessError>::success(0U);
    }
    return expected<size_t, ProcessError>::error(
        errno == ECONNRESET ? ProcessError::kPeerClosed
                            : ProcessError::kIoFailed);
  }
}

// ============================================================================
// ChildProcess
// ============================================================================

/// @brief How Spawn() starts a fresh child executable.
struct SpawnSpec {
  std::string executable;          ///< Path passed to execve (no PATH search).
  std::vector<std::string> args;   ///< argv[1..]; argv[0] is the executable.
  std::vector<std::pair<std::string, std::string>> env;  ///< Added/overridden.
  std::string fd_env_name = "HIVE_CHILD_FD";  ///< Carries the socket fd.
};

class ChildProcess {
 public:
  ChildProcess() noexcept = default;

  ~ChildProcess() { Reset(); }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  ChildProcess(ChildProcess&& other) noexcept
      : pid_(other.pid_), fd_(other.fd_), reaped_(other.reaped_),
        status_(other.status_) {
    other.pid_ = -1;
    other.fd_ = -1;
    other.reaped_ = true;
  }

  ChildProcess& operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
      Reset();
      pid_ = other.pid_;
      fd_ = other.fd_;
      reaped_ = other.reaped_;
      status_ = other.status_;
      other.pid_ = -1;
      other.fd_ = -1;
      other.reaped_ = true;
    }
    return *this;
  }

  /**
   * @brief Fork and run @p fn(child_fd) in the child, then _exit with its
   *        return value.
   *
   * @param close_in_child  Parent descriptors the child must not keep
   *                        (sibling sockets, poller fds).
   */
  template <typename Fn>
  static expected<ChildProcess, ProcessError> Fork(
      Fn&& fn, const std::vector<int>& close_in_child = {}) {
    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kSocketFailed);
    }
    pid_t pid = ::fork();
    if (pid < 0) {
      ::close(sv[0]);
      ::close(sv[1]);
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kForkFailed);
    }
    if (pid == 0) {
      // -- Child --
      ::close(sv[0]);
      for (int fd : close_in_child) {
        if (fd >= 0 && fd != sv[1]) ::close(fd);
      }
      detail::ResetChildSignals();
      int code = fn(sv[1]);
      ::_exit(code);
    }
    // -- Parent --
    ::close(sv[1]);
    ChildProcess cp;
    cp.pid_ = pid;
    cp.fd_ = sv[0];
    cp.reaped_ = false;
    return expected<ChildProcess, ProcessError>::success(std::move(cp));
  }

  /**
   * @brief Fork + exec a fresh child. Fails with kExecFailed when the
   *        executable could not be started.
   */
  static expected<ChildProcess, ProcessError> Spawn(const SpawnSpec& spec) {
    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) != 0) {
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kSocketFailed);
    }
    int status_pipe[2];
    if (::pipe(status_pipe) != 0) {
      ::close(sv[0]);
      ::close(sv[1]);
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kSocketFailed);
    }
    (void)detail::SetCloexec(status_pipe[0], true);
    (void)detail::SetCloexec(status_pipe[1], true);

    // Everything the child needs is built before fork: only
    // async-signal-safe calls happen between fork and exec.
    std::vector<std::string> argv_store;
    argv_store.push_back(spec.executable);
    for (const auto& a : spec.args) argv_store.push_back(a);
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    std::vector<std::string> env_store;
    auto overridden = [&spec](const char* entry) {
      const char* eq = std::strchr(entry, '=');
      size_t klen = (eq != nullptr) ? static_cast<size_t>(eq - entry)
                                    : std::strlen(entry);
      if (spec.fd_env_name.size() == klen &&
          std::strncmp(entry, spec.fd_env_name.c_str(), klen) == 0) {
        return true;
      }
      for (const auto& kv : spec.env) {
        if (kv.first.size() == klen &&
            std::strncmp(entry, kv.first.c_str(), klen) == 0) {
          return true;
        }
      }
      return false;
    };
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
      if (!overridden(*e)) env_store.emplace_back(*e);
    }
    for (const auto& kv : spec.env) {
      env_store.push_back(kv.first + "=" + kv.second);
    }
    env_store.push_back(spec.fd_env_name + "=" + std::to_string(sv[1]));
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    const int max_fd = detail::MaxFdToClose();

    pid_t pid = ::fork();
    if (pid < 0) {
      ::close(sv[0]);
      ::close(sv[1]);
      ::close(status_pipe[0]);
      ::close(status_pipe[1]);
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kForkFailed);
    }
    if (pid == 0) {
      // -- Child --
      for (int fd = 3; fd < max_fd; ++fd) {
        if (fd != sv[1] && fd != status_pipe[1]) (void)::close(fd);
      }
      (void)detail::SetCloexec(sv[1], false);
      detail::ResetChildSignals();
      ::execve(argv[0], argv.data(), envp.data());
      int err = errno;
      ssize_t w = ::write(status_pipe[1], &err, sizeof(err));
      (void)w;
      ::_exit(127);
    }

    // -- Parent --
    ::close(sv[1]);
    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
      n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    ChildProcess cp;
    cp.pid_ = pid;
    cp.fd_ = sv[0];
    cp.reaped_ = false;
    if (n > 0) {
      // exec failed; cp's destructor reaps the child.
      (void)cp.WaitFor(1000);
      return expected<ChildProcess, ProcessError>::error(
          ProcessError::kExecFailed);
    }
    return expected<ChildProcess, ProcessError>::success(std::move(cp));
  }

  pid_t Pid() const noexcept { return pid_; }
  int Fd() const noexcept { return fd_; }
  bool Valid() const noexcept { return pid_ > 0; }
  bool Reaped() const noexcept { return reaped_; }
  const ExitStatus& Status() const noexcept { return status_; }

  expected<void, ProcessError> Signal(int signo) {
    if (pid_ <= 0 || reaped_) {
      return expected<void, ProcessError>::error(ProcessError::kNotRunning);
    }
    if (::kill(pid_, signo) != 0) {
      return expected<void, ProcessError>::error(ProcessError::kSignalFailed);
    }
    return expected<void, ProcessError>::success();
  }

  /// @brief SIGKILL and reap.
  ExitStatus Kill() {
    if (pid_ > 0 && !reaped_) {
      (void)::kill(pid_, SIGKILL);
      return WaitFor(0);
    }
    return status_;
  }

  /// @brief Non-blocking reap. @return true once the child has exited.
  bool TryReap() {
    if (reaped_) return true;
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) {
      detail::FillExitStatus(status, status_);
      reaped_ = true;
    } else if (w < 0 && errno == ECHILD) {
      reaped_ = true;  // reaped elsewhere
    }
    return reaped_;
  }

  /**
   * @brief Wait for exit.
   * @param timeout_ms  0 blocks until exit.
   */
  ExitStatus WaitFor(uint32_t timeout_ms) {
    if (reaped_ || pid_ <= 0) return status_;
    if (timeout_ms == 0U) {
      int status = 0;
      pid_t w;
      do {
        w = ::waitpid(pid_, &status, 0);
      } while (w < 0 && errno == EINTR);
      if (w == pid_) detail::FillExitStatus(status, status_);
      reaped_ = true;
      return status_;
    }
    constexpr uint32_t kPollIntervalMs = 5;
    uint32_t elapsed = 0;
    while (elapsed < timeout_ms) {
      if (TryReap()) return status_;
      detail::SleepMs(kPollIntervalMs);
      elapsed += kPollIntervalMs;
    }
    ExitStatus pending = status_;
    pending.timed_out = true;
    return pending;
  }

  /// @brief Close the parent end of the control socket (child sees EOF).
  void CloseChannel() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  void Reset() {
    CloseChannel();
    if (pid_ > 0 && !reaped_) {
      (void)::kill(pid_, SIGKILL);
      int status;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
    pid_ = -1;
    reaped_ = true;
  }

  pid_t pid_ = -1;
  int fd_ = -1;
  bool reaped_ = true;
  ExitStatus status_{};
};

}  // namespace hive

#endif  // HIVE_HAS_FORK

#endif  // HIVE_PROCESS_HPP_
