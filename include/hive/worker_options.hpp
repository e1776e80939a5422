/**
 * @file worker_options.hpp
 * @brief Worker configuration schema on top of ConfigStore.
 *
 * Sections and keys (durations accept "250ms", "30s", "5m"; sizes "200MB"):
 *
 *   [worker]      hostname, name
 *   [pool]        strategy, concurrency, max_tasks_per_child,
 *                 max_memory_per_child, watchdog_interval, spawn_executable,
 *                 green_stack_size
 *   [dispatcher]  prefetch_multiplier, poll_interval, sweep_interval,
 *                 hard_limit_grace, shutdown_grace, retry_route,
 *                 revoked_capacity
 *   [limits]      soft_time_limit, time_limit
 *   [log]         level
 *
 * Every key can be overridden from the environment as HIVE_<SECTION>_<KEY>.
 */

#ifndef HIVE_WORKER_OPTIONS_HPP_
#define HIVE_WORKER_OPTIONS_HPP_

#include "hive/config.hpp"
#include "hive/dispatcher.hpp"
#include "hive/log.hpp"
#include "hive/pool.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <string>
#include <vector>

#include <unistd.h>

namespace hive {

static constexpr ConfigKey kWorkerConfigKeys[] = {
    {"worker", "hostname"},
    {"worker", "name"},
    {"pool", "strategy"},
    {"pool", "concurrency"},
    {"pool", "max_tasks_per_child"},
    {"pool", "max_memory_per_child"},
    {"pool", "watchdog_interval"},
    {"pool", "spawn_executable"},
    {"pool", "green_stack_size"},
    {"dispatcher", "prefetch_multiplier"},
    {"dispatcher", "poll_interval"},
    {"dispatcher", "sweep_interval"},
    {"dispatcher", "hard_limit_grace"},
    {"dispatcher", "shutdown_grace"},
    {"dispatcher", "retry_route"},
    {"dispatcher", "revoked_capacity"},
    {"limits", "soft_time_limit"},
    {"limits", "time_limit"},
    {"log", "level"},
};

static constexpr uint32_t kWorkerConfigKeyCount =
    static_cast<uint32_t>(sizeof(kWorkerConfigKeys) / sizeof(kWorkerConfigKeys[0]));

struct WorkerOptions {
  PoolConfig pool;
  DispatcherConfig dispatcher;
  log::Level log_level = log::Level::kInfo;
};

/// @brief Overlay HIVE_<SECTION>_<KEY> variables onto @p store.
inline expected<uint32_t, ConfigError> ApplyWorkerEnvironment(
    ConfigStore& store, const char* prefix = "HIVE") {
  return store.ApplyEnvironment(prefix, kWorkerConfigKeys, kWorkerConfigKeyCount);
}

inline std::string LocalHostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1U) != 0 || buf[0] == '\0') {
    return "localhost";
  }
  return std::string(buf);
}

namespace detail {

inline bool ReadUint32(const ConfigStore& store, const char* section,
                       const char* key, uint32_t* out) {
  auto r = store.GetUint64(section, key, *out);
  if (!r || r.value() > 0xFFFFFFFFULL) {
    HIVE_LOG_ERROR("Config", "[%s] %s: '%s' is not a count", section, key,
                   store.GetString(section, key));
    return false;
  }
  *out = static_cast<uint32_t>(r.value());
  return true;
}

inline bool ReadDurationMs(const ConfigStore& store, const char* section,
                           const char* key, uint64_t* out) {
  auto r = store.GetDurationMs(section, key, *out);
  if (!r) {
    HIVE_LOG_ERROR("Config", "[%s] %s: '%s' is not a duration", section, key,
                   store.GetString(section, key));
    return false;
  }
  *out = r.value();
  return true;
}

inline bool ReadDurationMs32(const ConfigStore& store, const char* section,
                             const char* key, uint32_t* out) {
  uint64_t ms = *out;
  if (!ReadDurationMs(store, section, key, &ms)) return false;
  if (ms > 0xFFFFFFFFULL) {
    HIVE_LOG_ERROR("Config", "[%s] %s: duration too large", section, key);
    return false;
  }
  *out = static_cast<uint32_t>(ms);
  return true;
}

inline bool ReadBytes(const ConfigStore& store, const char* section,
                      const char* key, uint64_t* out) {
  auto r = store.GetBytes(section, key, *out);
  if (!r) {
    HIVE_LOG_ERROR("Config", "[%s] %s: '%s' is not a size", section, key,
                   store.GetString(section, key));
    return false;
  }
  *out = r.value();
  return true;
}

}  // namespace detail

/// @brief Entries of @p store the worker does not read, as "section.key".
inline std::vector<std::string> UnknownWorkerKeys(const ConfigStore& store) {
  std::vector<std::string> unknown;
  store.ForEach([&unknown](const std::string& section, const std::string& key,
                           const std::string&) {
    for (const auto& k : kWorkerConfigKeys) {
      if (section == k.section && key == k.key) return;
    }
    unknown.push_back(section + "." + key);
  });
  return unknown;
}

/**
 * @brief Build and validate worker options from @p store.
 * @return kInvalidValue for an unknown strategy or retry route, zero or
 *         oversized concurrency, soft limit above hard limit, unknown log
 *         level, or an unparsable number, duration or size.
 */
inline expected<WorkerOptions, ConfigError> LoadWorkerOptions(
    const ConfigStore& store) {
  using R = expected<WorkerOptions, ConfigError>;
  WorkerOptions opt;
  PoolConfig& pool = opt.pool;
  DispatcherConfig& disp = opt.dispatcher;
  for (const auto& k : UnknownWorkerKeys(store)) {
    HIVE_LOG_WARN("Config", "%s: unknown option, ignored", k.c_str());
  }

  // [worker]
  const char* host = store.GetString("worker", "hostname", "");
  pool.hostname = (host[0] != '\0') ? std::string(host) : LocalHostname();
  pool.name = store.GetString("worker", "name", "hive");
  disp.hostname = pool.hostname;

  // [pool]
  const char* strategy = store.GetString("pool", "strategy", "threads");
  auto parsed = ParsePoolStrategy(strategy);
  if (!parsed.has_value()) {
    HIVE_LOG_ERROR("Config", "[pool] strategy: unknown '%s'", strategy);
    return R::error(ConfigError::kInvalidValue);
  }
  pool.strategy = *parsed;
  uint64_t stack = pool.green_stack_size;
  uint64_t interval = pool.watchdog_interval_ms;
  if (!detail::ReadUint32(store, "pool", "concurrency", &pool.concurrency) ||
      !detail::ReadUint32(store, "pool", "max_tasks_per_child",
                          &pool.max_tasks_per_child) ||
      !detail::ReadBytes(store, "pool", "max_memory_per_child",
                         &pool.max_memory_per_child) ||
      !detail::ReadDurationMs(store, "pool", "watchdog_interval", &interval) ||
      !detail::ReadBytes(store, "pool", "green_stack_size", &stack)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (pool.concurrency == 0U || pool.concurrency > kMaxPoolSlots) {
    HIVE_LOG_ERROR("Config", "[pool] concurrency: %u outside [1, %u]",
                   pool.concurrency, kMaxPoolSlots);
    return R::error(ConfigError::kInvalidValue);
  }
  if (interval == 0U || interval > 60000U) {
    HIVE_LOG_ERROR("Config", "[pool] watchdog_interval: out of range");
    return R::error(ConfigError::kInvalidValue);
  }
  pool.watchdog_interval_ms = static_cast<uint32_t>(interval);
  pool.green_stack_size = static_cast<size_t>(stack);
  pool.spawn_executable = store.GetString("pool", "spawn_executable", "");

  // [limits]
  uint64_t soft = 0U;
  uint64_t hard = 0U;
  if (!detail::ReadDurationMs(store, "limits", "soft_time_limit", &soft) ||
      !detail::ReadDurationMs(store, "limits", "time_limit", &hard)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (hard != 0U && soft > hard) {
    HIVE_LOG_ERROR("Config", "soft_time_limit exceeds time_limit");
    return R::error(ConfigError::kInvalidValue);
  }
  pool.default_soft_limit_ms = soft;
  pool.default_hard_limit_ms = hard;
  disp.default_soft_limit_ms = soft;
  disp.default_hard_limit_ms = hard;

  // [dispatcher]
  if (!detail::ReadUint32(store, "dispatcher", "prefetch_multiplier",
                          &disp.prefetch_multiplier) ||
      !detail::ReadDurationMs32(store, "dispatcher", "poll_interval",
                                &disp.poll_interval_ms) ||
      !detail::ReadDurationMs32(store, "dispatcher", "sweep_interval",
                                &disp.sweep_interval_ms) ||
      !detail::ReadDurationMs32(store, "dispatcher", "hard_limit_grace",
                                &disp.hard_limit_grace_ms) ||
      !detail::ReadDurationMs32(store, "dispatcher", "shutdown_grace",
                                &disp.shutdown_grace_ms) ||
      !detail::ReadUint32(store, "dispatcher", "revoked_capacity",
                          &disp.revoked_capacity)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (disp.poll_interval_ms == 0U || disp.sweep_interval_ms == 0U) {
    HIVE_LOG_ERROR("Config", "[dispatcher] intervals must be positive");
    return R::error(ConfigError::kInvalidValue);
  }
  const char* route = store.GetString("dispatcher", "retry_route", "internal");
  if (std::strcmp(route, "internal") == 0) {
    disp.retry_route = RetryRoute::kInternal;
  } else if (std::strcmp(route, "broker") == 0) {
    disp.retry_route = RetryRoute::kBroker;
  } else {
    HIVE_LOG_ERROR("Config", "[dispatcher] retry_route: unknown '%s'", route);
    return R::error(ConfigError::kInvalidValue);
  }

  // [log]
  opt.log_level = log::GetLevel();
  if (store.HasKey("log", "level") &&
      !log::ParseLevel(store.GetString("log", "level"), &opt.log_level)) {
    HIVE_LOG_ERROR("Config", "[log] level: unknown '%s'",
                   store.GetString("log", "level"));
    return R::error(ConfigError::kInvalidValue);
  }
  return R::success(opt);
}

}  // namespace hive

#endif  // HIVE_WORKER_OPTIONS_HPP_
