/**
 * @file log.hpp
 * @brief Synchronous printf-style logger with categories and levels.
 *
 * Output line format (stderr):
 *   [2026-01-01 12:00:00.123] [INFO] [Pool] [4242] message (file.hpp:42)
 *
 * The pid column tells pool child processes apart from the parent.
 * A compile-time floor (HIVE_LOG_MIN_LEVEL) removes calls entirely; the
 * runtime level filters the rest. Header-only, no allocation.
 */

#ifndef HIVE_LOG_HPP_
#define HIVE_LOG_HPP_

#include "hive/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <strings.h>
#include <sys/time.h>
#include <unistd.h>

// 0=debug 1=info 2=warn 3=error 4=fatal 5=off
#ifndef HIVE_LOG_MIN_LEVEL
#define HIVE_LOG_MIN_LEVEL 0
#endif

namespace hive {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

/// @brief Strip directories so log lines carry only the file name.
inline const char* BaseName(const char* path) noexcept {
  if (path == nullptr) {
    return "";
  }
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t size) noexcept {
  struct timeval tv;
  (void)gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  (void)localtime_r(&tv.tv_sec, &tm_buf);
  size_t n = std::strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_buf);
  if (n > 0 && n < size) {
    (void)std::snprintf(buf + n, size - n, ".%03d",
                        static_cast<int>(tv.tv_usec / 1000));
  }
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name (case-insensitive): debug, info, warn/warning,
 *        error, fatal, off.
 * @return true and sets @p out on success.
 */
inline bool ParseLevel(const char* name, Level* out) noexcept {
  if (name == nullptr || out == nullptr) {
    return false;
  }
  struct Entry {
    const char* name;
    Level level;
  };
  static constexpr Entry kTable[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& e : kTable) {
    if (strcasecmp(name, e.name) == 0) {
      *out = e.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Write path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (level < GetLevel() || level == Level::kOff) {
    return;
  }
  char msg[512];
  int n = std::vsnprintf(msg, sizeof(msg), fmt, args);
  if (n < 0) {
    msg[0] = '\0';
  }
  char ts[48];
  detail::FormatTimestamp(ts, sizeof(ts));

  // Single fprintf per line keeps lines from interleaving across threads.
  (void)std::fprintf(stderr, "[%s] [%s] [%s] [%d] %s (%s:%d)\n", ts,
                     detail::LevelTag(level),
                     (category != nullptr) ? category : "-",
                     static_cast<int>(::getpid()), msg, detail::BaseName(file),
                     line);
  if (level >= Level::kError) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace hive

// ============================================================================
// Macros
// ============================================================================

#define HIVE_LOG_DEBUG(cat, fmt, ...)                                        \
  do {                                                                       \
    if (HIVE_LOG_MIN_LEVEL <= 0) {                                           \
      ::hive::log::LogWrite(::hive::log::Level::kDebug, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define HIVE_LOG_INFO(cat, fmt, ...)                                         \
  do {                                                                       \
    if (HIVE_LOG_MIN_LEVEL <= 1) {                                           \
      ::hive::log::LogWrite(::hive::log::Level::kInfo, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define HIVE_LOG_WARN(cat, fmt, ...)                                         \
  do {                                                                       \
    if (HIVE_LOG_MIN_LEVEL <= 2) {                                           \
      ::hive::log::LogWrite(::hive::log::Level::kWarn, cat, __FILE__,        \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define HIVE_LOG_ERROR(cat, fmt, ...)                                        \
  do {                                                                       \
    if (HIVE_LOG_MIN_LEVEL <= 3) {                                           \
      ::hive::log::LogWrite(::hive::log::Level::kError, cat, __FILE__,       \
                            __LINE__, fmt, ##__VA_ARGS__);                   \
    }                                                                        \
  } while (0)

#define HIVE_LOG_FATAL(cat, fmt, ...)                                        \
  do {                                                                       \
    ::hive::log::LogWrite(::hive::log::Level::kFatal, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                     \
    std::abort();                                                            \
  } while (0)

#endif  // HIVE_LOG_HPP_
