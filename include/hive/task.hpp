/**
 * @file task.hpp
 * @brief Task model: definitions, requests, handler contract, outcomes.
 *
 * A handler is a plain function pointer
 *
 *   hive::TaskResult Add(const hive::TaskArgs& args, hive::TaskContext& ctx);
 *
 * It receives lazily decoded JSON arguments and a context carrying request
 * metadata plus a cooperative cancellation token, and returns a
 * TaskResult. It must not assume which pool strategy hosts it: the same
 * handler runs in a forked child, a spawned executable, a green thread, a
 * native thread, or inline.
 */

#ifndef HIVE_TASK_HPP_
#define HIVE_TASK_HPP_

#include "hive/platform.hpp"
#include "hive/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace hive {

using json = nlohmann::json;

// ============================================================================
// Options
// ============================================================================

enum class AckMode : uint8_t {
  kLate = 0,  ///< Ack after the terminal outcome (at-least-once).
  kEarly,     ///< Ack when handed to the pool (at-most-once under crash).
};

struct RetryPolicy {
  bool enabled = true;
  optional<uint32_t> max_retries{3U};  ///< Empty: retry forever.
  uint64_t backoff_base_ms = 1000;
  uint64_t backoff_max_ms = 600000;
  bool jitter = true;
  /// Error types that are retried automatically. Empty: any failure.
  std::vector<std::string> retry_for;
};

struct TaskOptions {
  std::string queue = "default";
  std::string routing_key;
  std::string serializer = "json";
  RetryPolicy retry;
  uint64_t soft_time_limit_ms = 0;  ///< 0: worker default
  uint64_t hard_time_limit_ms = 0;  ///< 0: worker default
  AckMode ack_mode = AckMode::kLate;
  std::string rate_limit;  ///< "10/s", "30/m", "100/h"; empty: unlimited
  bool ignore_result = false;
};

// ============================================================================
// Errors and results
// ============================================================================

namespace error_type {
constexpr const char* kException = "Exception";
constexpr const char* kTimeLimitExceeded = "TimeLimitExceeded";
constexpr const char* kSoftTimeLimitExceeded = "SoftTimeLimitExceeded";
constexpr const char* kWorkerLost = "WorkerLostError";
constexpr const char* kUnknownTask = "UnknownTaskError";
constexpr const char* kTerminated = "Terminated";
constexpr const char* kRevoked = "TaskRevokedError";
constexpr const char* kExpired = "TaskExpired";
constexpr const char* kDecodeError = "DecodeError";
}  // namespace error_type

struct TaskError {
  std::string type;
  std::string message;
  bool retryable = true;
};

/// @brief What a handler returns.
struct TaskResult {
  enum class Kind : uint8_t { kSuccess = 0, kFailure, kRetry };

  Kind kind = Kind::kSuccess;
  json value;               ///< kSuccess
  TaskError error;          ///< kFailure / kRetry
  uint64_t countdown_ms = 0;  ///< kRetry: 0 uses the policy's backoff

  static TaskResult Success(json v = nullptr) {
    TaskResult r;
    r.kind = Kind::kSuccess;
    r.value = std::move(v);
    return r;
  }

  static TaskResult Failure(TaskError err) {
    TaskResult r;
    r.kind = Kind::kFailure;
    r.error = std::move(err);
    return r;
  }

  static TaskResult Failure(std::string type, std::string message,
                            bool retryable = true) {
    return Failure(TaskError{std::move(type), std::move(message), retryable});
  }

  /// @brief Ask for another attempt; still bounded by max_retries.
  static TaskResult Retry(uint64_t countdown_ms, TaskError reason) {
    TaskResult r;
    r.kind = Kind::kRetry;
    r.error = std::move(reason);
    r.countdown_ms = countdown_ms;
    return r;
  }
};

// ============================================================================
// TaskRequest
// ============================================================================

/// @brief One dequeued message, decoded.
struct TaskRequest {
  std::string id;
  std::string task;
  std::string args_json = "[]";    ///< opaque until a handler reads it
  std::string kwargs_json = "{}";
  uint64_t delivery_tag = 0;
  uint32_t retries = 0;
  uint64_t eta_ms = 0;      ///< epoch ms; 0: run now
  uint64_t expires_ms = 0;  ///< epoch ms; 0: never
  std::string origin;
  uint8_t priority = 0;
  std::string routing_key;
  std::string queue;
  uint64_t soft_time_limit_ms = 0;  ///< per-message override; 0: none
  uint64_t hard_time_limit_ms = 0;
};

// ============================================================================
// TaskArgs
// ============================================================================

/**
 * @brief Positional and keyword arguments, parsed on first access.
 *
 * Invalid JSON reads as an empty array/object. Typed accessors return
 * empty when the index/key is missing or the type does not match.
 */
class TaskArgs {
 public:
  TaskArgs(std::string args_json, std::string kwargs_json)
      : args_text_(std::move(args_json)), kwargs_text_(std::move(kwargs_json)) {}

  const json& Positional() const {
    if (!args_parsed_) {
      args_ = json::parse(args_text_, nullptr, false);
      if (args_.is_discarded() || !args_.is_array()) args_ = json::array();
      args_parsed_ = true;
    }
    return args_;
  }

  const json& Keywords() const {
    if (!kwargs_parsed_) {
      kwargs_ = json::parse(kwargs_text_, nullptr, false);
      if (kwargs_.is_discarded() || !kwargs_.is_object()) {
        kwargs_ = json::object();
      }
      kwargs_parsed_ = true;
    }
    return kwargs_;
  }

  size_t Size() const { return Positional().size(); }

  optional<int64_t> IntAt(size_t i) const { return AsInt(At(i)); }
  optional<double> DoubleAt(size_t i) const { return AsDouble(At(i)); }
  optional<std::string> StringAt(size_t i) const { return AsString(At(i)); }

  optional<int64_t> IntKw(const char* key) const { return AsInt(Kw(key)); }
  optional<double> DoubleKw(const char* key) const { return AsDouble(Kw(key)); }
  optional<std::string> StringKw(const char* key) const {
    return AsString(Kw(key));
  }
  optional<bool> BoolKw(const char* key) const {
    const json* v = Kw(key);
    if (v == nullptr || !v->is_boolean()) return nullopt;
    return v->get<bool>();
  }

 private:
  const json* At(size_t i) const {
    const json& a = Positional();
    return (i < a.size()) ? &a[i] : nullptr;
  }

  const json* Kw(const char* key) const {
    const json& k = Keywords();
    auto it = k.find(key);
    return (it != k.end()) ? &(*it) : nullptr;
  }

  static optional<int64_t> AsInt(const json* v) {
    if (v == nullptr || !v->is_number_integer()) return nullopt;
    return v->get<int64_t>();
  }

  static optional<double> AsDouble(const json* v) {
    if (v == nullptr || !v->is_number()) return nullopt;
    return v->get<double>();
  }

  static optional<std::string> AsString(const json* v) {
    if (v == nullptr || !v->is_string()) return nullopt;
    return v->get<std::string>();
  }

  std::string args_text_;
  std::string kwargs_text_;
  mutable json args_;
  mutable json kwargs_;
  mutable bool args_parsed_ = false;
  mutable bool kwargs_parsed_ = false;
};

// ============================================================================
// TaskContext
// ============================================================================

/// Green-thread switch hook; null for strategies with real preemption.
using YieldFn = void (*)(void* ctx);

/**
 * @brief Per-execution view handed to the handler.
 *
 * SoftLimitExceeded() is the cooperative cancellation token: it turns true
 * once the soft time limit has passed or the pool asked the run to stop
 * (soft-limit signal, termination). Handlers doing long work should poll
 * it and return early, usually with a kSoftTimeLimitExceeded failure.
 */
class TaskContext {
 public:
  TaskContext(const TaskRequest& req, const char* hostname,
              const std::atomic<bool>* cancel_flag, uint64_t soft_deadline_us,
              YieldFn yield = nullptr, void* yield_ctx = nullptr)
      : req_(req),
        hostname_(hostname != nullptr ? hostname : ""),
        cancel_flag_(cancel_flag),
        soft_deadline_us_(soft_deadline_us),
        yield_(yield),
        yield_ctx_(yield_ctx) {}

  const std::string& Id() const noexcept { return req_.id; }
  const std::string& TaskName() const noexcept { return req_.task; }
  uint32_t Retries() const noexcept { return req_.retries; }
  const char* Hostname() const noexcept { return hostname_; }
  uint8_t Priority() const noexcept { return req_.priority; }
  const std::string& RoutingKey() const noexcept { return req_.routing_key; }
  const std::string& Origin() const noexcept { return req_.origin; }

  bool SoftLimitExceeded() const noexcept {
    if (cancel_flag_ != nullptr &&
        cancel_flag_->load(std::memory_order_acquire)) {
      return true;
    }
    return soft_deadline_us_ != 0U && SteadyNowUs() >= soft_deadline_us_;
  }

  /// @brief Let other green threads run. No-op outside the green pool.
  void Yield() {
    if (yield_ != nullptr) yield_(yield_ctx_);
  }

 private:
  const TaskRequest& req_;
  const char* hostname_;
  const std::atomic<bool>* cancel_flag_;
  uint64_t soft_deadline_us_;
  YieldFn yield_;
  void* yield_ctx_;
};

using TaskHandler = TaskResult (*)(const TaskArgs& args, TaskContext& ctx);

// ============================================================================
// TaskDefinition
// ============================================================================

/// @brief Immutable once registered.
struct TaskDefinition {
  std::string name;
  TaskHandler handler = nullptr;
  TaskOptions options;
};

// ============================================================================
// Outcome
// ============================================================================

enum class OutcomeKind : uint8_t {
  kSuccess = 0,
  kFailure,
  kTimeout,
  kWorkerLost
};

inline const char* OutcomeKindName(OutcomeKind k) noexcept {
  switch (k) {
    case OutcomeKind::kSuccess:    return "success";
    case OutcomeKind::kFailure:    return "failure";
    case OutcomeKind::kTimeout:    return "timeout";
    case OutcomeKind::kWorkerLost: return "worker_lost";
    default:                       return "unknown";
  }
}

static constexpr uint32_t kNoSlot = 0xFFFFFFFFU;

/// @brief Terminal result of one pool submission.
struct Outcome {
  std::string request_id;
  OutcomeKind kind = OutcomeKind::kSuccess;
  json result;
  TaskError error;
  bool retry_requested = false;  ///< handler returned TaskResult::Retry
  uint64_t retry_countdown_ms = 0;
  uint64_t runtime_us = 0;
  uint32_t slot = kNoSlot;

  static Outcome FromResult(const std::string& id, TaskResult&& r,
                            uint64_t runtime_us, uint32_t slot) {
    Outcome o;
    o.request_id = id;
    o.runtime_us = runtime_us;
    o.slot = slot;
    switch (r.kind) {
      case TaskResult::Kind::kSuccess:
        o.kind = OutcomeKind::kSuccess;
        o.result = std::move(r.value);
        break;
      case TaskResult::Kind::kRetry:
        o.kind = OutcomeKind::kFailure;
        o.error = std::move(r.error);
        o.retry_requested = true;
        o.retry_countdown_ms = r.countdown_ms;
        break;
      case TaskResult::Kind::kFailure:
      default:
        o.kind = OutcomeKind::kFailure;
        o.error = std::move(r.error);
        break;
    }
    return o;
  }

  static Outcome Timeout(const std::string& id, uint64_t limit_ms,
                         uint64_t runtime_us, uint32_t slot) {
    Outcome o;
    o.request_id = id;
    o.kind = OutcomeKind::kTimeout;
    o.error.type = error_type::kTimeLimitExceeded;
    o.error.message = "Time limit (" + std::to_string(limit_ms) +
                      "ms) exceeded";
    o.error.retryable = false;
    o.runtime_us = runtime_us;
    o.slot = slot;
    return o;
  }

  static Outcome WorkerLost(const std::string& id, std::string why,
                            uint32_t slot,
                            const char* type = error_type::kWorkerLost) {
    Outcome o;
    o.request_id = id;
    o.kind = OutcomeKind::kWorkerLost;
    o.error.type = type;
    o.error.message = std::move(why);
    o.slot = slot;
    return o;
  }
};

}  // namespace hive

#endif  // HIVE_TASK_HPP_
