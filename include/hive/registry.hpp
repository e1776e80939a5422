/**
 * @file registry.hpp
 * @brief Task registry and the common handler invocation path.
 *
 * The registry is populated at startup and frozen when the dispatcher
 * starts; afterwards it is read-only and may be read concurrently from
 * every pool execution context without locking.
 */

#ifndef HIVE_REGISTRY_HPP_
#define HIVE_REGISTRY_HPP_

#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/rate_limit.hpp"
#include "hive/task.hpp"
#include "hive/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#if defined(__cpp_exceptions) && defined(__GLIBCXX__)
#include <cxxabi.h>
#endif

namespace hive {

enum class RegistryError : uint8_t {
  kDuplicateTask = 0,
  kUnknownTask,
  kInvalidName,
  kInvalidOptions,
  kFrozen
};

inline const char* RegistryErrorName(RegistryError e) noexcept {
  switch (e) {
    case RegistryError::kDuplicateTask:  return "DuplicateTaskError";
    case RegistryError::kUnknownTask:    return "UnknownTaskError";
    case RegistryError::kInvalidName:    return "InvalidName";
    case RegistryError::kInvalidOptions: return "InvalidOptions";
    case RegistryError::kFrozen:         return "RegistryFrozen";
    default:                             return "Unknown";
  }
}

// ============================================================================
// TaskRegistry
// ============================================================================

class TaskRegistry final {
 public:
  TaskRegistry() = default;

  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  /**
   * @brief Register @p handler under @p name.
   *
   * @return The stored definition, or:
   *         - kDuplicateTask   name already registered
   *         - kInvalidName     empty name or null handler
   *         - kInvalidOptions  soft limit above hard limit, serializer
   *                            other than "json", unparsable rate limit
   *         - kFrozen          called after Freeze()
   */
  expected<const TaskDefinition*, RegistryError> Register(
      const std::string& name, TaskHandler handler,
      TaskOptions options = TaskOptions()) {
    using R = expected<const TaskDefinition*, RegistryError>;
    if (frozen_) {
      HIVE_LOG_ERROR("Registry", "register '%s' after freeze", name.c_str());
      return R::error(RegistryError::kFrozen);
    }
    if (name.empty() || handler == nullptr) {
      return R::error(RegistryError::kInvalidName);
    }
    if (tasks_.find(name) != tasks_.end()) {
      HIVE_LOG_ERROR("Registry", "task '%s' already registered", name.c_str());
      return R::error(RegistryError::kDuplicateTask);
    }
    if (options.serializer != "json") {
      HIVE_LOG_ERROR("Registry", "task '%s': unsupported serializer '%s'",
                     name.c_str(), options.serializer.c_str());
      return R::error(RegistryError::kInvalidOptions);
    }
    if (options.hard_time_limit_ms != 0U &&
        options.soft_time_limit_ms > options.hard_time_limit_ms) {
      HIVE_LOG_ERROR("Registry",
                     "task '%s': soft limit %llums exceeds hard limit %llums",
                     name.c_str(),
                     static_cast<unsigned long long>(options.soft_time_limit_ms),
                     static_cast<unsigned long long>(options.hard_time_limit_ms));
      return R::error(RegistryError::kInvalidOptions);
    }
    if (!ParseRateLimit(options.rate_limit).has_value()) {
      HIVE_LOG_ERROR("Registry", "task '%s': bad rate limit '%s'",
                     name.c_str(), options.rate_limit.c_str());
      return R::error(RegistryError::kInvalidOptions);
    }

    auto def = std::make_unique<TaskDefinition>();
    def->name = name;
    def->handler = handler;
    def->options = std::move(options);
    const TaskDefinition* raw = def.get();
    tasks_.emplace(name, std::move(def));
    HIVE_LOG_DEBUG("Registry", "registered task '%s'", name.c_str());
    return R::success(raw);
  }

  expected<const TaskDefinition*, RegistryError> Lookup(
      const std::string& name) const {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
      return expected<const TaskDefinition*, RegistryError>::error(
          RegistryError::kUnknownTask);
    }
    return expected<const TaskDefinition*, RegistryError>::success(
        it->second.get());
  }

  bool Contains(const std::string& name) const {
    return tasks_.find(name) != tasks_.end();
  }

  /// @brief Make the registry read-only. Idempotent.
  void Freeze() noexcept { frozen_ = true; }
  bool IsFrozen() const noexcept { return frozen_; }

  size_t Size() const noexcept { return tasks_.size(); }

  /// @brief Registered names, sorted.
  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    out.reserve(tasks_.size());
    for (const auto& kv : tasks_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

  template <typename Fn>
  void ForEach(Fn&& fn) const {
    for (const auto& kv : tasks_) fn(*kv.second);
  }

 private:
  std::unordered_map<std::string, std::unique_ptr<TaskDefinition>> tasks_;
  bool frozen_ = false;
};

// ============================================================================
// Limits
// ============================================================================

struct EffectiveLimits {
  uint64_t soft_ms = 0;  ///< 0: none
  uint64_t hard_ms = 0;  ///< 0: none
};

/**
 * @brief Resolve limits: message override, then task definition, then
 *        worker default. A soft limit at or above the hard limit is dropped.
 */
inline EffectiveLimits ResolveLimits(const TaskRequest& req,
                                     const TaskDefinition* def,
                                     uint64_t default_soft_ms,
                                     uint64_t default_hard_ms) noexcept {
  EffectiveLimits l;
  l.soft_ms = req.soft_time_limit_ms;
  l.hard_ms = req.hard_time_limit_ms;
  if (l.soft_ms == 0U && def != nullptr) l.soft_ms = def->options.soft_time_limit_ms;
  if (l.hard_ms == 0U && def != nullptr) l.hard_ms = def->options.hard_time_limit_ms;
  if (l.soft_ms == 0U) l.soft_ms = default_soft_ms;
  if (l.hard_ms == 0U) l.hard_ms = default_hard_ms;
  if (l.hard_ms != 0U && l.soft_ms >= l.hard_ms) l.soft_ms = 0U;
  return l;
}

// ============================================================================
// Handler invocation
// ============================================================================

/**
 * @brief Call a handler, converting any escaping C++ exception into a
 *        failure result.
 *
 * Thread cancellation (abi::__forced_unwind from pthread_exit) is
 * rethrown so the hosting thread can still exit.
 */
inline TaskResult InvokeHandler(TaskHandler handler, const TaskArgs& args,
                                TaskContext& ctx) {
#if defined(__cpp_exceptions)
  try {
    return handler(args, ctx);
  }
#if defined(__GLIBCXX__)
  catch (abi::__forced_unwind&) {
    throw;
  }
#endif
  catch (const std::exception& e) {
    return TaskResult::Failure(error_type::kException, e.what());
  } catch (...) {
    return TaskResult::Failure(error_type::kException,
                               "non-standard exception");
  }
#else
  return handler(args, ctx);
#endif
}

/// @brief Execution environment a pool provides to RunTask.
struct ExecEnv {
  const char* hostname = "";
  const std::atomic<bool>* cancel_flag = nullptr;
  uint64_t soft_limit_ms = 0;
  YieldFn yield = nullptr;
  void* yield_ctx = nullptr;
  uint32_t slot = kNoSlot;
};

/**
 * @brief Look up and run one request; the body every strategy shares.
 *
 * Unknown task names produce an UnknownTaskError failure (not retryable).
 */
inline Outcome RunTask(const TaskRegistry& registry, const TaskRequest& req,
                       const ExecEnv& env) {
  const uint64_t start_us = SteadyNowUs();
  auto def = registry.Lookup(req.task);
  if (!def.has_value()) {
    HIVE_LOG_ERROR("Registry", "received unregistered task '%s' (id=%s)",
                   req.task.c_str(), req.id.c_str());
    return Outcome::FromResult(
        req.id,
        TaskResult::Failure(error_type::kUnknownTask,
                            "Task '" + req.task + "' is not registered",
                            false),
        0U, env.slot);
  }
  const uint64_t soft_deadline_us =
      (env.soft_limit_ms != 0U) ? start_us + env.soft_limit_ms * 1000U : 0U;
  TaskArgs args(req.args_json, req.kwargs_json);
  TaskContext ctx(req, env.hostname, env.cancel_flag, soft_deadline_us,
                  env.yield, env.yield_ctx);
  TaskResult result = InvokeHandler(def.value()->handler, args, ctx);
  return Outcome::FromResult(req.id, std::move(result),
                             SteadyNowUs() - start_us, env.slot);
}

}  // namespace hive

#endif  // HIVE_REGISTRY_HPP_
