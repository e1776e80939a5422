/**
 * @file test_rate_limit.cpp
 * @brief Tests for rate_limit.hpp
 */

#include "hive/rate_limit.hpp"

#include <catch2/catch.hpp>

using Catch::Matchers::WithinRel;

TEST_CASE("ParseRateLimit", "[rate_limit]") {
  REQUIRE(hive::ParseRateLimit("").value() == 0.0);
  REQUIRE(hive::ParseRateLimit("10").value() == 10.0);
  REQUIRE(hive::ParseRateLimit("10/s").value() == 10.0);
  REQUIRE_THAT(hive::ParseRateLimit("30/m").value(), WithinRel(0.5, 1e-9));
  REQUIRE_THAT(hive::ParseRateLimit("7200/h").value(), WithinRel(2.0, 1e-9));
  REQUIRE(!hive::ParseRateLimit("10/d").has_value());
  REQUIRE(!hive::ParseRateLimit("/s").has_value());
  REQUIRE(!hive::ParseRateLimit("-1/s").has_value());
  REQUIRE(!hive::ParseRateLimit("10/sec").has_value());
}

TEST_CASE("TokenBucket spaces dispatches evenly", "[rate_limit]") {
  hive::TokenBucket bucket(10.0);  // one every 100ms
  const uint64_t t0 = 1000000;
  REQUIRE(bucket.TryConsume(t0));
  REQUIRE(!bucket.TryConsume(t0));
  REQUIRE(!bucket.TryConsume(t0 + 50000));
  const uint64_t wait = bucket.ExpectedWaitUs(t0 + 50000);
  REQUIRE(wait >= 49999U);
  REQUIRE(wait <= 50001U);
  REQUIRE(bucket.TryConsume(t0 + 100010));
  // Idle time does not bank more than one token.
  REQUIRE(bucket.TryConsume(t0 + 10000000));
  REQUIRE(!bucket.TryConsume(t0 + 10000000));
}

TEST_CASE("RateLimiter per task", "[rate_limit]") {
  hive::RateLimiter limiter;
  limiter.Configure("slow", 2.0);
  REQUIRE(limiter.IsLimited("slow"));
  REQUIRE(!limiter.IsLimited("fast"));

  const uint64_t t0 = 5000000;
  REQUIRE(limiter.TryAcquire("slow", t0));
  REQUIRE(!limiter.TryAcquire("slow", t0 + 1000));
  const uint64_t wait = limiter.WaitUs("slow", t0 + 1000);
  REQUIRE(wait >= 498999U);
  REQUIRE(wait <= 499001U);
  for (int i = 0; i < 100; ++i) REQUIRE(limiter.TryAcquire("fast", t0));
  REQUIRE(limiter.WaitUs("fast", t0) == 0U);

  limiter.Configure("slow", 0.0);
  REQUIRE(!limiter.IsLimited("slow"));
  REQUIRE(limiter.TryAcquire("slow", t0 + 1000));
}
