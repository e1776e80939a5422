/**
 * @file test_retry.cpp
 * @brief Tests for retry.hpp
 */

#include "hive/retry.hpp"

#include <catch2/catch.hpp>

#include <random>
#include <string>

namespace {

hive::Outcome FailureOutcome(const char* type = "ValueError",
                             bool retryable = true) {
  hive::Outcome o;
  o.kind = hive::OutcomeKind::kFailure;
  o.error.type = type;
  o.error.retryable = retryable;
  return o;
}

hive::RetryPolicy NoJitter() {
  hive::RetryPolicy p;
  p.backoff_base_ms = 100;
  p.backoff_max_ms = 1000;
  p.jitter = false;
  return p;
}

}  // namespace

TEST_CASE("Backoff doubles and saturates", "[retry]") {
  REQUIRE(hive::BackoffDelayMs(0, 100, 1000) == 100U);
  REQUIRE(hive::BackoffDelayMs(1, 100, 1000) == 200U);
  REQUIRE(hive::BackoffDelayMs(3, 100, 1000) == 800U);
  REQUIRE(hive::BackoffDelayMs(4, 100, 1000) == 1000U);
  REQUIRE(hive::BackoffDelayMs(200, 100, 1000) == 1000U);
  REQUIRE(hive::BackoffDelayMs(5, 0, 1000) == 0U);
}

TEST_CASE("Jittered delay stays within the backoff", "[retry]") {
  std::mt19937_64 rng(42);
  for (uint32_t n = 0; n < 8U; ++n) {
    const uint64_t cap = hive::BackoffDelayMs(n, 100, 1000);
    for (int i = 0; i < 50; ++i) {
      REQUIRE(hive::NextRetryDelayMs(n, 100, 1000, true, rng) <= cap);
    }
  }
  REQUIRE(hive::NextRetryDelayMs(2, 100, 1000, false, rng) == 400U);
}

TEST_CASE("Failures retry until max_retries", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();
  p.max_retries = 2U;

  auto d0 = hive::DecideRetry(p, FailureOutcome(), 0, rng);
  REQUIRE(d0.retry);
  REQUIRE(d0.delay_ms == 100U);
  auto d1 = hive::DecideRetry(p, FailureOutcome(), 1, rng);
  REQUIRE(d1.retry);
  REQUIRE(d1.delay_ms == 200U);
  auto d2 = hive::DecideRetry(p, FailureOutcome(), 2, rng);
  REQUIRE(!d2.retry);
}

TEST_CASE("Unlimited retries", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();
  p.max_retries = hive::nullopt;
  REQUIRE(hive::DecideRetry(p, FailureOutcome(), 100000, rng).retry);
}

TEST_CASE("Outcomes that are never retried", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();

  hive::Outcome ok;
  ok.kind = hive::OutcomeKind::kSuccess;
  REQUIRE(!hive::DecideRetry(p, ok, 0, rng).retry);

  auto timeout = hive::Outcome::Timeout("id", 100, 0, 0);
  REQUIRE(!hive::DecideRetry(p, timeout, 0, rng).retry);

  REQUIRE(!hive::DecideRetry(p, FailureOutcome("ValueError", false), 0, rng)
               .retry);

  p.enabled = false;
  REQUIRE(!hive::DecideRetry(p, FailureOutcome(), 0, rng).retry);
}

TEST_CASE("retry_for filters error types", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();
  p.retry_for = {"ConnectionError"};
  REQUIRE(!hive::DecideRetry(p, FailureOutcome("ValueError"), 0, rng).retry);
  REQUIRE(hive::DecideRetry(p, FailureOutcome("ConnectionError"), 0, rng).retry);
}

TEST_CASE("Worker loss is retried while the count permits", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();
  p.max_retries = 1U;
  p.retry_for = {"ConnectionError"};
  auto lost = hive::Outcome::WorkerLost("id", "exitcode 3", 0);
  auto d = hive::DecideRetry(p, lost, 0, rng);
  REQUIRE(d.retry);
  REQUIRE(std::string(d.reason) == "worker lost");
  REQUIRE(!hive::DecideRetry(p, lost, 1, rng).retry);
}

TEST_CASE("Explicit retry uses the handler's countdown", "[retry]") {
  std::mt19937_64 rng(1);
  hive::RetryPolicy p = NoJitter();
  p.retry_for = {"ConnectionError"};
  hive::TaskResult asked =
      hive::TaskResult::Retry(750, hive::TaskError{"RetryMe", "again", false});
  auto o = hive::Outcome::FromResult("id", std::move(asked), 0, 0);
  auto d = hive::DecideRetry(p, o, 0, rng);
  REQUIRE(d.retry);
  REQUIRE(d.delay_ms == 750U);

  p.max_retries = 0U;
  REQUIRE(!hive::DecideRetry(p, o, 0, rng).retry);
}
