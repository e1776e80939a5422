/**
 * @file io_poller.hpp
 * @brief Readiness poller (epoll on Linux, poll(2) elsewhere) and a Waker.
 *
 * The dispatcher loop and the process-pool supervisor both multiplex their
 * sources (broker fd, child sockets, cross-thread wakeups) through one
 * IoPoller so no event is missed while blocked. Level-triggered by default;
 * pass kEdgeTriggered to opt into edge semantics on Linux.
 */

#ifndef HIVE_IO_POLLER_HPP_
#define HIVE_IO_POLLER_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#if defined(HIVE_PLATFORM_LINUX)
#include <sys/epoll.h>
#include <sys/eventfd.h>
#else
#include <poll.h>
#endif

namespace hive {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kModifyFailed,
  kRemoveFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08,
  kEdgeTriggered = 0x80  // registration flag only, never reported
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t mask, IoEvent ev) {
  return (mask & static_cast<uint8_t>(ev)) != 0;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

#ifndef HIVE_IO_POLLER_MAX_EVENTS
#define HIVE_IO_POLLER_MAX_EVENTS 64U
#endif

class IoPoller {
 public:
  IoPoller() noexcept;
  ~IoPoller();

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept;

  /** @brief Add an fd to monitor with given events (kReadable, kWritable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events);

  /** @brief Modify monitored events for an fd. */
  expected<void, PollerError> Modify(int32_t fd, uint8_t events);

  /** @brief Remove an fd from monitoring. */
  expected<void, PollerError> Remove(int32_t fd);

  /**
   * @brief Wait for events.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready events, readable through Results(). A wait
   *         interrupted by a signal returns 0 events.
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1);

  const PollResult* Results() const noexcept { return results_.data(); }

 private:
#if defined(HIVE_PLATFORM_LINUX)
  int32_t epoll_fd_;
#else
  struct Watch {
    int32_t fd;
    uint8_t events;
  };
  std::vector<Watch> watches_;
#endif
  std::array<PollResult, HIVE_IO_POLLER_MAX_EVENTS> results_;
};

// ============================================================================
// Inline Implementation
// ============================================================================

#if defined(HIVE_PLATFORM_LINUX)

namespace detail {

inline uint32_t IoEventToEpoll(uint8_t events) {
  uint32_t ep = 0;
  if (HasEvent(events, IoEvent::kEdgeTriggered)) ep |= EPOLLET;
  if (HasEvent(events, IoEvent::kReadable)) ep |= EPOLLIN | EPOLLRDHUP;
  if (HasEvent(events, IoEvent::kWritable)) ep |= EPOLLOUT;
  return ep;
}

inline uint8_t EpollToIoEvent(uint32_t ep) {
  uint8_t ev = 0;
  if (ep & EPOLLIN) ev |= static_cast<uint8_t>(IoEvent::kReadable);
  if (ep & EPOLLOUT) ev |= static_cast<uint8_t>(IoEvent::kWritable);
  if (ep & EPOLLERR) ev |= static_cast<uint8_t>(IoEvent::kError);
  if (ep & (EPOLLHUP | EPOLLRDHUP)) ev |= static_cast<uint8_t>(IoEvent::kHangup);
  return ev;
}

}  // namespace detail

inline IoPoller::IoPoller() noexcept
    : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)), results_{} {}

inline IoPoller::~IoPoller() {
  if (epoll_fd_ >= 0) {
    ::close(epoll_fd_);
  }
}

inline bool IoPoller::IsValid() const noexcept { return epoll_fd_ >= 0; }

inline expected<void, PollerError> IoPoller::Add(int32_t fd, uint8_t events) {
  struct epoll_event ev {};
  ev.events = detail::IoEventToEpoll(events);
  ev.data.fd = fd;
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
    return expected<void, PollerError>::error(PollerError::kAddFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> IoPoller::Modify(int32_t fd,
                                                    uint8_t events) {
  struct epoll_event ev {};
  ev.events = detail::IoEventToEpoll(events);
  ev.data.fd = fd;
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
    return expected<void, PollerError>::error(PollerError::kModifyFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> IoPoller::Remove(int32_t fd) {
  if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
    return expected<void, PollerError>::error(PollerError::kRemoveFailed);
  }
  return expected<void, PollerError>::success();
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  struct epoll_event raw_events[HIVE_IO_POLLER_MAX_EVENTS];
  int32_t n = ::epoll_wait(epoll_fd_, raw_events,
                           static_cast<int>(HIVE_IO_POLLER_MAX_EVENTS),
                           timeout_ms);
  if (n < 0) {
    if (errno == EINTR) {
      return expected<uint32_t, PollerError>::success(0U);
    }
    return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
  }
  auto count = static_cast<uint32_t>(n);
  for (uint32_t i = 0; i < count; ++i) {
    results_[i].fd = raw_events[i].data.fd;
    results_[i].events = detail::EpollToIoEvent(raw_events[i].events);
  }
  return expected<uint32_t, PollerError>::success(count);
}

#else  // poll(2) fallback

inline IoPoller::IoPoller() noexcept : results_{} {}

inline IoPoller::~IoPoller() = default;

inline bool IoPoller::IsValid() const noexcept { return true; }

inline expected<void, PollerError> IoPoller::Add(int32_t fd, uint8_t events) {
  for (const auto& w : watches_) {
    if (w.fd == fd) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
  }
  watches_.push_back(Watch{fd, events});
  return expected<void, PollerError>::success();
}

inline expected<void, PollerError> IoPoller::Modify(int32_t fd,
                                                    uint8_t events) {
  for (auto& w : watches_) {
    if (w.fd == fd) {
      w.events = events;
      return expected<void, PollerError>::success();
    }
  }
  return expected<void, PollerError>::error(PollerError::kModifyFailed);
}

inline expected<void, PollerError> IoPoller::Remove(int32_t fd) {
  for (size_t i = 0; i < watches_.size(); ++i) {
    if (watches_[i].fd == fd) {
      watches_.erase(watches_.begin() + static_cast<std::ptrdiff_t>(i));
      return expected<void, PollerError>::success();
    }
  }
  return expected<void, PollerError>::error(PollerError::kRemoveFailed);
}

inline expected<uint32_t, PollerError> IoPoller::Wait(int32_t timeout_ms) {
  std::vector<struct pollfd> pfds(watches_.size());
  for (size_t i = 0; i < watches_.size(); ++i) {
    pfds[i].fd = watches_[i].fd;
    pfds[i].events = 0;
    if (HasEvent(watches_[i].events, IoEvent::kReadable)) pfds[i].events |= POLLIN;
    if (HasEvent(watches_[i].events, IoEvent::kWritable)) pfds[i].events |= POLLOUT;
    pfds[i].revents = 0;
  }
  int n = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()), timeout_ms);
  if (n < 0) {
    if (errno == EINTR) {
      return expected<uint32_t, PollerError>::success(0U);
    }
    return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
  }
  uint32_t count = 0;
  for (size_t i = 0; i < pfds.size() && count < HIVE_IO_POLLER_MAX_EVENTS; ++i) {
    if (pfds[i].revents == 0) continue;
    uint8_t ev = 0;
    if (pfds[i].revents & POLLIN) ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if (pfds[i].revents & POLLOUT) ev |= static_cast<uint8_t>(IoEvent::kWritable);
    if (pfds[i].revents & (POLLERR | POLLNVAL)) ev |= static_cast<uint8_t>(IoEvent::kError);
    if (pfds[i].revents & POLLHUP) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    results_[count].fd = pfds[i].fd;
    results_[count].events = ev;
    ++count;
  }
  return expected<uint32_t, PollerError>::success(count);
}

#endif

// ============================================================================
// Waker - cross-thread wakeup for a poller
// ============================================================================

/**
 * @brief Wakes a thread blocked in IoPoller::Wait from any thread.
 *
 * eventfd on Linux, a non-blocking self-pipe elsewhere. Notify() is
 * async-signal-safe. Register Fd() for kReadable and call Drain() when it
 * fires.
 */
class Waker {
 public:
  Waker() noexcept {
#if defined(HIVE_PLATFORM_LINUX)
    read_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    write_fd_ = read_fd_;
#else
    int fds[2] = {-1, -1};
    if (::pipe(fds) == 0) {
      for (int fd : fds) {
        (void)::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
        (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
      }
      read_fd_ = fds[0];
      write_fd_ = fds[1];
    }
#endif
  }

  ~Waker() {
    if (read_fd_ >= 0) ::close(read_fd_);
    if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
  }

  Waker(const Waker&) = delete;
  Waker& operator=(const Waker&) = delete;

  bool IsValid() const noexcept { return read_fd_ >= 0; }
  int32_t Fd() const noexcept { return read_fd_; }

  void Notify() noexcept {
#if defined(HIVE_PLATFORM_LINUX)
    uint64_t one = 1;
    ssize_t r = ::write(write_fd_, &one, sizeof(one));
#else
    char b = 1;
    ssize_t r = ::write(write_fd_, &b, 1);
#endif
    (void)r;  // EAGAIN means a wakeup is already pending
  }

  void Drain() noexcept {
    char buf[64];
    while (::read(read_fd_, buf, sizeof(buf)) > 0) {
    }
  }

 private:
  int32_t read_fd_ = -1;
  int32_t write_fd_ = -1;
};

}  // namespace hive

#endif  // HIVE_IO_POLLER_HPP_
