/**
 * @file test_platform.cpp
 * @brief Tests for platform.hpp
 */

#include "hive/platform.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

TEST_CASE("HIVE_ASSERT passes on true condition", "[platform]") {
  HIVE_ASSERT(1 == 1);
  HIVE_ASSERT(true);
  REQUIRE(true);
}

TEST_CASE("Process capabilities follow the platform", "[platform]") {
#if defined(HIVE_PLATFORM_LINUX)
  bool has_fork = false;
#if defined(HIVE_HAS_FORK)
  has_fork = true;
#endif
  REQUIRE(has_fork);
#endif
  REQUIRE(hive::kCacheLineSize == 64);
}

TEST_CASE("HIVE_LIKELY and HIVE_UNLIKELY compile", "[platform]") {
  int x = 1;
  if (HIVE_LIKELY(x == 1)) {
    REQUIRE(true);
  }
  if (HIVE_UNLIKELY(x == 0)) {
    REQUIRE(false);
  }
}

TEST_CASE("Steady clocks advance together", "[platform]") {
  const uint64_t us0 = hive::SteadyNowUs();
  const uint64_t ns0 = hive::SteadyNowNs();
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  REQUIRE(hive::SteadyNowUs() - us0 >= 5000U);
  REQUIRE(hive::SteadyNowNs() - ns0 >= 5000000U);
}

TEST_CASE("Wall clock is in epoch milliseconds", "[platform]") {
  // 2020-01-01T00:00:00Z
  REQUIRE(hive::WallNowMs() > 1577836800000ULL);
}

TEST_CASE("ThreadHeartbeat records the last beat", "[platform]") {
  hive::ThreadHeartbeat hb;
  REQUIRE(hb.LastBeatUs() == 0U);
  const uint64_t before = hive::SteadyNowUs();
  hb.Beat();
  REQUIRE(hb.LastBeatUs() >= before);
  REQUIRE(hb.LastBeatUs() <= hive::SteadyNowUs());
}
