/**
 * @file codec.hpp
 * @brief JSON codecs: broker task messages and the pool child protocol.
 *
 * Task message body (what producers publish):
 * @code
 *   {"id": "3f2c...", "task": "tasks.add", "args": [2, 3], "kwargs": {},
 *    "retries": 0, "eta": 1735689600000, "expires": 0, "origin": "host-a",
 *    "priority": 0, "routing_key": "default",
 *    "soft_time_limit_ms": 0, "time_limit_ms": 0}
 * @endcode
 * Only "id" and "task" are required; eta/expires are epoch milliseconds.
 *
 * Parent <-> pool child frames: a 4-byte big-endian length followed by a
 * JSON document. Parsing never throws (nlohmann parse with
 * allow_exceptions = false), so malformed input maps to CodecError.
 */

#ifndef HIVE_CODEC_HPP_
#define HIVE_CODEC_HPP_

#include "hive/platform.hpp"
#include "hive/task.hpp"
#include "hive/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>

namespace hive {

enum class CodecError : uint8_t {
  kMalformed = 0,   ///< not JSON, or not an object
  kMissingField,    ///< "id" or "task" absent
  kInvalidField,    ///< a field has the wrong type
  kFrameTooLarge
};

inline const char* CodecErrorName(CodecError e) noexcept {
  switch (e) {
    case CodecError::kMalformed:     return "Malformed";
    case CodecError::kMissingField:  return "MissingField";
    case CodecError::kInvalidField:  return "InvalidField";
    case CodecError::kFrameTooLarge: return "FrameTooLarge";
    default:                         return "Unknown";
  }
}

namespace detail {

inline bool ReadU64(const json& obj, const char* key, uint64_t* out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (it->is_number_unsigned()) {
    *out = it->get<uint64_t>();
    return true;
  }
  if (it->is_number_integer()) {
    int64_t v = it->get<int64_t>();
    if (v < 0) return false;
    *out = static_cast<uint64_t>(v);
    return true;
  }
  if (it->is_number_float()) {
    // Whole numbers only, and inside uint64_t range (2^64 is exact).
    double v = it->get<double>();
    if (!std::isfinite(v) || v < 0.0 || v >= 18446744073709551616.0 ||
        std::floor(v) != v) {
      return false;
    }
    *out = static_cast<uint64_t>(v);
    return true;
  }
  return false;
}

inline bool ReadString(const json& obj, const char* key, std::string* out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_string()) return false;
  *out = it->get<std::string>();
  return true;
}

inline expected<TaskRequest, CodecError> RequestFromJson(const json& j) {
  using R = expected<TaskRequest, CodecError>;
  if (!j.is_object()) return R::error(CodecError::kMalformed);
  auto id = j.find("id");
  auto task = j.find("task");
  if (id == j.end() || task == j.end()) return R::error(CodecError::kMissingField);
  if (!id->is_string() || !task->is_string()) {
    return R::error(CodecError::kInvalidField);
  }

  TaskRequest req;
  req.id = id->get<std::string>();
  req.task = task->get<std::string>();
  if (req.id.empty() || req.task.empty()) {
    return R::error(CodecError::kMissingField);
  }

  auto args = j.find("args");
  if (args != j.end() && !args->is_null()) {
    if (!args->is_array()) return R::error(CodecError::kInvalidField);
    req.args_json = args->dump();
  }
  auto kwargs = j.find("kwargs");
  if (kwargs != j.end() && !kwargs->is_null()) {
    if (!kwargs->is_object()) return R::error(CodecError::kInvalidField);
    req.kwargs_json = kwargs->dump();
  }

  uint64_t retries = 0;
  uint64_t priority = 0;
  if (!ReadU64(j, "retries", &retries) || retries > UINT32_MAX ||
      !ReadU64(j, "eta", &req.eta_ms) ||
      !ReadU64(j, "expires", &req.expires_ms) ||
      !ReadU64(j, "priority", &priority) || priority > 255U ||
      !ReadU64(j, "soft_time_limit_ms", &req.soft_time_limit_ms) ||
      !ReadU64(j, "time_limit_ms", &req.hard_time_limit_ms) ||
      !ReadString(j, "origin", &req.origin) ||
      !ReadString(j, "routing_key", &req.routing_key) ||
      !ReadString(j, "queue", &req.queue)) {
    return R::error(CodecError::kInvalidField);
  }
  req.retries = static_cast<uint32_t>(retries);
  req.priority = static_cast<uint8_t>(priority);
  return R::success(std::move(req));
}

inline json RequestToJson(const TaskRequest& req) {
  json j;
  j["id"] = req.id;
  j["task"] = req.task;
  json args = json::parse(req.args_json, nullptr, false);
  j["args"] = (args.is_discarded() || !args.is_array()) ? json::array() : args;
  json kwargs = json::parse(req.kwargs_json, nullptr, false);
  j["kwargs"] = (kwargs.is_discarded() || !kwargs.is_object()) ? json::object()
                                                               : kwargs;
  j["retries"] = req.retries;
  j["eta"] = req.eta_ms;
  j["expires"] = req.expires_ms;
  j["origin"] = req.origin;
  j["priority"] = req.priority;
  j["routing_key"] = req.routing_key;
  if (!req.queue.empty()) j["queue"] = req.queue;
  j["soft_time_limit_ms"] = req.soft_time_limit_ms;
  j["time_limit_ms"] = req.hard_time_limit_ms;
  return j;
}

inline json ErrorToJson(const TaskError& e) {
  return json{{"type", e.type}, {"message", e.message},
              {"retryable", e.retryable}};
}

inline bool ErrorFromJson(const json& j, TaskError* out) {
  if (!j.is_object()) return false;
  if (!ReadString(j, "type", &out->type) ||
      !ReadString(j, "message", &out->message)) {
    return false;
  }
  auto r = j.find("retryable");
  if (r != j.end() && r->is_boolean()) out->retryable = r->get<bool>();
  return true;
}

}  // namespace detail

// ============================================================================
// Broker task messages
// ============================================================================

/// @brief Decode a broker message body. Delivery fields are left zero.
inline expected<TaskRequest, CodecError> DecodeTaskMessage(
    const std::string& body) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    return expected<TaskRequest, CodecError>::error(CodecError::kMalformed);
  }
  return detail::RequestFromJson(j);
}

/// @brief Encode a request as a broker message body (used to republish).
inline std::string EncodeTaskMessage(const TaskRequest& req) {
  return detail::RequestToJson(req).dump();
}

// ============================================================================
// Pool child protocol
// ============================================================================

/// @brief A completed run as reported by a pool child.
struct ChildReply {
  std::string id;
  TaskResult result;
  uint64_t runtime_us = 0;
};

/// @brief Parent -> child: the request plus its effective soft limit.
inline std::string EncodeChildRequest(const TaskRequest& req,
                                      uint64_t soft_limit_ms) {
  json j = detail::RequestToJson(req);
  j["soft_limit_ms"] = soft_limit_ms;
  return j.dump();
}

inline expected<TaskRequest, CodecError> DecodeChildRequest(
    const std::string& payload, uint64_t* soft_limit_ms) {
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    return expected<TaskRequest, CodecError>::error(CodecError::kMalformed);
  }
  if (soft_limit_ms != nullptr) {
    *soft_limit_ms = 0;
    if (j.is_object() && !detail::ReadU64(j, "soft_limit_ms", soft_limit_ms)) {
      return expected<TaskRequest, CodecError>::error(
          CodecError::kInvalidField);
    }
  }
  return detail::RequestFromJson(j);
}

/// @brief Child -> parent. Non-serializable values are replaced by a failure.
inline std::string EncodeChildReply(const std::string& id,
                                    const TaskResult& result,
                                    uint64_t runtime_us) {
  json j;
  j["id"] = id;
  j["runtime_us"] = runtime_us;
  switch (result.kind) {
    case TaskResult::Kind::kSuccess:
      j["kind"] = "success";
      j["value"] = result.value;
      break;
    case TaskResult::Kind::kRetry:
      j["kind"] = "retry";
      j["error"] = detail::ErrorToJson(result.error);
      j["countdown_ms"] = result.countdown_ms;
      break;
    case TaskResult::Kind::kFailure:
    default:
      j["kind"] = "failure";
      j["error"] = detail::ErrorToJson(result.error);
      break;
  }
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline expected<ChildReply, CodecError> DecodeChildReply(
    const std::string& payload) {
  using R = expected<ChildReply, CodecError>;
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return R::error(CodecError::kMalformed);
  ChildReply reply;
  std::string kind;
  if (!detail::ReadString(j, "id", &reply.id) ||
      !detail::ReadString(j, "kind", &kind) ||
      !detail::ReadU64(j, "runtime_us", &reply.runtime_us)) {
    return R::error(CodecError::kInvalidField);
  }
  if (reply.id.empty() || kind.empty()) return R::error(CodecError::kMissingField);

  if (kind == "success") {
    auto v = j.find("value");
    reply.result = TaskResult::Success(v != j.end() ? *v : json());
  } else if (kind == "failure" || kind == "retry") {
    auto e = j.find("error");
    TaskError err;
    if (e == j.end() || !detail::ErrorFromJson(*e, &err)) {
      return R::error(CodecError::kInvalidField);
    }
    if (kind == "retry") {
      uint64_t countdown = 0;
      if (!detail::ReadU64(j, "countdown_ms", &countdown)) {
        return R::error(CodecError::kInvalidField);
      }
      reply.result = TaskResult::Retry(countdown, std::move(err));
    } else {
      reply.result = TaskResult::Failure(std::move(err));
    }
  } else {
    return R::error(CodecError::kInvalidField);
  }
  return R::success(std::move(reply));
}

// ============================================================================
// Length-prefixed framing
// ============================================================================

static constexpr uint32_t kMaxFrameSize = 16U * 1024U * 1024U;

/// @brief Append one frame (4-byte big-endian length + payload) to @p out.
inline void AppendFrame(std::string& out, const std::string& payload) {
  const uint32_t n = static_cast<uint32_t>(payload.size());
  const char hdr[4] = {static_cast<char>((n >> 24) & 0xFF),
                       static_cast<char>((n >> 16) & 0xFF),
                       static_cast<char>((n >> 8) & 0xFF),
                       static_cast<char>(n & 0xFF)};
  out.append(hdr, 4);
  out.append(payload);
}

/**
 * @brief Reassembles frames from arbitrary read(2) chunks.
 *
 * @code
 *   reader.Feed(buf, n);
 *   std::string frame;
 *   while (reader.Next(&frame)) Handle(frame);
 *   if (reader.Failed()) ...  // oversized frame: drop the connection
 * @endcode
 */
class FrameReader {
 public:
  void Feed(const char* data, size_t len) { buf_.append(data, len); }

  /// @return true and sets @p out when a complete frame is buffered.
  bool Next(std::string* out) {
    if (failed_ || buf_.size() - pos_ < 4U) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(buf_.data() + pos_);
    const uint32_t n = (static_cast<uint32_t>(p[0]) << 24) |
                       (static_cast<uint32_t>(p[1]) << 16) |
                       (static_cast<uint32_t>(p[2]) << 8) |
                       static_cast<uint32_t>(p[3]);
    if (n > kMaxFrameSize) {
      failed_ = true;
      return false;
    }
    if (buf_.size() - pos_ - 4U < n) return false;
    out->assign(buf_, pos_ + 4U, n);
    pos_ += 4U + n;
    if (pos_ == buf_.size()) {
      buf_.clear();
      pos_ = 0;
    } else if (pos_ > 65536U) {
      buf_.erase(0, pos_);
      pos_ = 0;
    }
    return true;
  }

  bool Failed() const noexcept { return failed_; }
  size_t Buffered() const noexcept { return buf_.size() - pos_; }

  void Reset() {
    buf_.clear();
    pos_ = 0;
    failed_ = false;
  }

 private:
  std::string buf_;
  size_t pos_ = 0;
  bool failed_ = false;
};

}  // namespace hive

#endif  // HIVE_CODEC_HPP_
