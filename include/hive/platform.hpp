/**
 * @file platform.hpp
 * @brief Platform detection, capability flags, clocks, and assertion macros.
 */

#ifndef HIVE_PLATFORM_HPP_
#define HIVE_PLATFORM_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace hive {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define HIVE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define HIVE_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define HIVE_PLATFORM_WINDOWS 1
#endif

#if defined(HIVE_PLATFORM_LINUX) || defined(HIVE_PLATFORM_MACOS)
#define HIVE_PLATFORM_POSIX 1
#endif

// ============================================================================
// Capability Flags
// ============================================================================

// fork(2) + socketpair(2): process-fork and process-spawn strategies.
#if defined(HIVE_PLATFORM_POSIX)
#define HIVE_HAS_FORK 1
#endif

// makecontext/swapcontext: green-thread strategy. Deprecated on macOS.
#if defined(HIVE_PLATFORM_LINUX) && !defined(HIVE_NO_UCONTEXT)
#define HIVE_HAS_UCONTEXT 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define HIVE_LIKELY(x) __builtin_expect(!!(x), 1)
#define HIVE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define HIVE_LIKELY(x) (x)
#define HIVE_UNLIKELY(x) (x)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "HIVE_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define HIVE_ASSERT(cond) ((void)0)
#else
#define HIVE_ASSERT(cond)                                                    \
  ((cond) ? ((void)0) : ::hive::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Clocks
// ============================================================================

/// @brief Monotonic clock in microseconds.
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Monotonic clock in nanoseconds.
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/**
 * @brief Wall clock in milliseconds since the Unix epoch.
 *
 * ETA and expiry fields of task messages are producer wall-clock values,
 * so they are compared against this clock, never the steady one.
 */
inline uint64_t WallNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

// ============================================================================
// ThreadHeartbeat
// ============================================================================

/**
 * @brief Single-writer liveness stamp for a monitored execution unit.
 *
 * The owner calls Beat() from its loop; a watchdog compares LastBeatUs()
 * against its timeout.
 */
struct alignas(kCacheLineSize) ThreadHeartbeat {
  std::atomic<uint64_t> last_beat_us{0};

  void Beat() noexcept {
    last_beat_us.store(SteadyNowUs(), std::memory_order_relaxed);
  }

  uint64_t LastBeatUs() const noexcept {
    return last_beat_us.load(std::memory_order_relaxed);
  }
};

// ============================================================================
// Macro Helpers
// ============================================================================

#define HIVE_CONCAT_IMPL(a, b) a##b
#define HIVE_CONCAT(a, b) HIVE_CONCAT_IMPL(a, b)

}  // namespace hive

#endif  // HIVE_PLATFORM_HPP_
