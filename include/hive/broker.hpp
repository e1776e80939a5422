/**
 * @file broker.hpp
 * @brief Broker and result-backend collaborator interfaces, plus in-memory
 *        implementations used by tests and the example worker.
 *
 * Real transports (AMQP, Redis, SQS, ...) implement Broker and
 * ResultBackend outside this library. The dispatcher only needs:
 *   Receive(timeout) -> message | none
 *   Ack(tag) / Reject(tag, requeue)
 *   Publish(body, eta)           optional, for broker-routed retries
 *   ReadyFd()                    optional, readable while messages wait
 */

#ifndef HIVE_BROKER_HPP_
#define HIVE_BROKER_HPP_

#include "hive/io_poller.hpp"
#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/task.hpp"
#include "hive/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hive {

// ============================================================================
// Broker
// ============================================================================

enum class BrokerError : uint8_t {
  kUnavailable = 0,  ///< transport down; caller should reconnect / back off
  kUnknownTag,       ///< tag never delivered or already settled
  kNotSupported
};

inline const char* BrokerErrorName(BrokerError e) noexcept {
  switch (e) {
    case BrokerError::kUnavailable:  return "BrokerUnavailable";
    case BrokerError::kUnknownTag:   return "UnknownDeliveryTag";
    case BrokerError::kNotSupported: return "NotSupported";
    default:                         return "Unknown";
  }
}

struct BrokerMessage {
  uint64_t delivery_tag = 0U;
  std::string body;
  std::string queue;
  bool redelivered = false;
};

class Broker {
 public:
  virtual ~Broker() = default;

  /// @return A message, empty when none arrived within @p timeout_ms.
  virtual expected<optional<BrokerMessage>, BrokerError> Receive(
      uint32_t timeout_ms) = 0;

  virtual expected<void, BrokerError> Ack(uint64_t delivery_tag) = 0;

  /// @param reason  Attached to dead-lettered messages; may be null.
  virtual expected<void, BrokerError> Reject(uint64_t delivery_tag,
                                             bool requeue,
                                             const TaskError* reason) = 0;

  virtual bool SupportsPublish() const noexcept { return false; }

  /// @brief Enqueue a new message, invisible until @p eta_ms (epoch ms).
  virtual expected<void, BrokerError> Publish(const std::string& /*body*/,
                                              uint64_t /*eta_ms*/) {
    return expected<void, BrokerError>::error(BrokerError::kNotSupported);
  }

  /// @brief Descriptor readable while messages are waiting; -1 if none.
  virtual int32_t ReadyFd() const noexcept { return -1; }
};

// ============================================================================
// Result backend
// ============================================================================

enum class ResultStatus : uint8_t { kSuccess = 0, kFailure, kRevoked };

inline const char* ResultStatusName(ResultStatus s) noexcept {
  switch (s) {
    case ResultStatus::kSuccess: return "SUCCESS";
    case ResultStatus::kFailure: return "FAILURE";
    case ResultStatus::kRevoked: return "REVOKED";
    default:                     return "UNKNOWN";
  }
}

struct ResultRecord {
  std::string task_id;
  std::string task_name;
  ResultStatus status = ResultStatus::kSuccess;
  json result;       ///< kSuccess
  TaskError error;   ///< kFailure / kRevoked
  uint32_t retries = 0U;
  uint64_t runtime_us = 0U;
  std::string hostname;
  uint64_t date_done_ms = 0U;

  json ToJson() const {
    json j;
    j["task_id"] = task_id;
    j["task"] = task_name;
    j["status"] = ResultStatusName(status);
    if (status == ResultStatus::kSuccess) {
      j["result"] = result;
    } else {
      j["result"] = json{{"exc_type", error.type}, {"exc_message", error.message}};
    }
    j["retries"] = retries;
    j["runtime_us"] = runtime_us;
    j["hostname"] = hostname;
    j["date_done"] = date_done_ms;
    return j;
  }
};

enum class BackendError : uint8_t { kUnavailable = 0, kRejected };

class ResultBackend {
 public:
  virtual ~ResultBackend() = default;
  virtual expected<void, BackendError> StoreResult(
      const std::string& request_id, const ResultRecord& record) = 0;
};

// ============================================================================
// MemoryBroker
// ============================================================================

/**
 * @brief Thread-safe in-process broker.
 *
 * Delayed delivery: a message published with an ETA stays invisible until
 * the wall clock reaches it. Rejected-without-requeue messages are kept in
 * a dead-letter list. SetUnavailable() makes every call fail with
 * kUnavailable until cleared.
 */
class MemoryBroker final : public Broker {
 public:
  struct DeadLetter {
    uint64_t delivery_tag;
    std::string body;
    TaskError reason;
  };

  MemoryBroker() = default;

  MemoryBroker(const MemoryBroker&) = delete;
  MemoryBroker& operator=(const MemoryBroker&) = delete;

  // -- Producer side --

  /// @return The delivery tag the message will carry.
  uint64_t Enqueue(const std::string& body, uint64_t eta_ms = 0U,
                   const std::string& queue = "default") {
    uint64_t tag = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      tag = ++next_tag_;
      Stored m{BrokerMessage{tag, body, queue, false}, eta_ms};
      if (eta_ms != 0U && eta_ms > WallNowMs()) {
        delayed_.push_back(std::move(m));
      } else {
        ready_.push_back(std::move(m.msg));
      }
      ++published_;
    }
    cv_.notify_one();
    waker_.Notify();
    return tag;
  }

  // -- Broker --

  expected<optional<BrokerMessage>, BrokerError> Receive(
      uint32_t timeout_ms) override {
    using R = expected<optional<BrokerMessage>, BrokerError>;
    std::unique_lock<std::mutex> lock(mutex_);
    if (unavailable_) return R::error(BrokerError::kUnavailable);
    PromoteDueLocked();
    if (ready_.empty() && timeout_ms != 0U) {
      cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
        PromoteDueLocked();
        return !ready_.empty() || unavailable_;
      });
      if (unavailable_) return R::error(BrokerError::kUnavailable);
    }
    if (ready_.empty()) {
      waker_.Drain();
      return R::success(optional<BrokerMessage>());
    }
    BrokerMessage m = std::move(ready_.front());
    ready_.pop_front();
    unacked_.emplace(m.delivery_tag, m);
    if (ready_.empty()) waker_.Drain();
    return R::success(optional<BrokerMessage>(std::move(m)));
  }

  expected<void, BrokerError> Ack(uint64_t delivery_tag) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable_) {
      return expected<void, BrokerError>::error(BrokerError::kUnavailable);
    }
    if (unacked_.erase(delivery_tag) == 0U) {
      HIVE_LOG_WARN("Broker", "ack of unknown tag %llu",
                    static_cast<unsigned long long>(delivery_tag));
      return expected<void, BrokerError>::error(BrokerError::kUnknownTag);
    }
    acked_.push_back(delivery_tag);
    return expected<void, BrokerError>::success();
  }

  expected<void, BrokerError> Reject(uint64_t delivery_tag, bool requeue,
                                     const TaskError* reason) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (unavailable_) {
        return expected<void, BrokerError>::error(BrokerError::kUnavailable);
      }
      auto it = unacked_.find(delivery_tag);
      if (it == unacked_.end()) {
        HIVE_LOG_WARN("Broker", "reject of unknown tag %llu",
                      static_cast<unsigned long long>(delivery_tag));
        return expected<void, BrokerError>::error(BrokerError::kUnknownTag);
      }
      BrokerMessage m = std::move(it->second);
      unacked_.erase(it);
      rejected_.push_back(delivery_tag);
      if (requeue) {
        // Redelivered under a fresh tag, like a broker-side requeue.
        m.delivery_tag = ++next_tag_;
        m.redelivered = true;
        ready_.push_back(std::move(m));
        ++requeued_;
      } else {
        dead_letters_.push_back(DeadLetter{
            delivery_tag, std::move(m.body),
            (reason != nullptr) ? *reason : TaskError()});
      }
    }
    if (requeue) {
      cv_.notify_one();
      waker_.Notify();
    }
    return expected<void, BrokerError>::success();
  }

  bool SupportsPublish() const noexcept override { return true; }

  expected<void, BrokerError> Publish(const std::string& body,
                                      uint64_t eta_ms) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (unavailable_) {
        return expected<void, BrokerError>::error(BrokerError::kUnavailable);
      }
    }
    (void)Enqueue(body, eta_ms);
    return expected<void, BrokerError>::success();
  }

  int32_t ReadyFd() const noexcept override { return waker_.Fd(); }

  // -- Failure injection / inspection --

  void SetUnavailable(bool unavailable) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      unavailable_ = unavailable;
    }
    cv_.notify_all();
    if (!unavailable) waker_.Notify();
  }

  /// @brief Messages not yet delivered (ready plus delayed).
  size_t Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
  }

  size_t Unacked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unacked_.size();
  }

  std::vector<uint64_t> AckedTags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acked_;
  }

  std::vector<uint64_t> RejectedTags() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
  }

  std::vector<DeadLetter> DeadLetters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dead_letters_;
  }

  uint64_t PublishedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
  }

  uint64_t RequeuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requeued_;
  }

  /// @brief Bodies of messages waiting (ready first, then delayed).
  std::vector<std::string> PendingBodies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& m : ready_) out.push_back(m.body);
    for (const auto& d : delayed_) out.push_back(d.msg.body);
    return out;
  }

 private:
  struct Stored {
    BrokerMessage msg;
    uint64_t eta_ms;
  };

  void PromoteDueLocked() {
    if (delayed_.empty()) return;
    const uint64_t now = WallNowMs();
    for (auto it = delayed_.begin(); it != delayed_.end();) {
      if (it->eta_ms <= now) {
        ready_.push_back(std::move(it->msg));
        it = delayed_.erase(it);
      } else {
        ++it;
      }
    }
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Waker waker_;
  std::deque<BrokerMessage> ready_;
  std::vector<Stored> delayed_;
  std::unordered_map<uint64_t, BrokerMessage> unacked_;
  std::vector<uint64_t> acked_;
  std::vector<uint64_t> rejected_;
  std::vector<DeadLetter> dead_letters_;
  uint64_t next_tag_ = 0U;
  uint64_t published_ = 0U;
  uint64_t requeued_ = 0U;
  bool unavailable_ = false;
};

// ============================================================================
// MemoryResultBackend
// ============================================================================

class MemoryResultBackend final : public ResultBackend {
 public:
  expected<void, BackendError> StoreResult(
      const std::string& request_id, const ResultRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unavailable_) {
      return expected<void, BackendError>::error(BackendError::kUnavailable);
    }
    records_[request_id] = record;
    ++stores_;
    return expected<void, BackendError>::success();
  }

  optional<ResultRecord> Get(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(request_id);
    if (it == records_.end()) return nullopt;
    return it->second;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
  }

  uint64_t StoreCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_;
  }

  void SetUnavailable(bool unavailable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_ = unavailable;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, ResultRecord> records_;
  uint64_t stores_ = 0U;
  bool unavailable_ = false;
};

}  // namespace hive

#endif  // HIVE_BROKER_HPP_
