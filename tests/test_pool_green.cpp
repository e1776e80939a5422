/**
 * @file test_pool_green.cpp
 * @brief Tests for pool_green.hpp
 */

#include "hive/pool_green.hpp"

#if defined(HIVE_HAS_UCONTEXT)

#include "test_tasks.hpp"

#include <catch2/catch.hpp>

#include <string>

using hive_test::MakeRequest;
using hive_test::OutcomeSink;
using hive_test::WaitUntil;

namespace {

hive::PoolConfig GreenConfig(uint32_t concurrency) {
  hive::PoolConfig cfg;
  cfg.strategy = hive::PoolStrategy::kGreenThread;
  cfg.concurrency = concurrency;
  cfg.watchdog_interval_ms = 10;
  cfg.hostname = "green-host";
  return cfg;
}

}  // namespace

TEST_CASE("Green pool runs tasks", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::GreenPool pool(GreenConfig(2), reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("a", "test.add", "[3, 4]"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("f", "test.fail"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("t", "test.throw"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Size() == 3U; }));
  REQUIRE(sink.Get("a").result == 7);
  REQUIRE(sink.Get("f").error.type == "ValueError");
  REQUIRE(sink.Get("t").error.type == hive::error_type::kException);
}

TEST_CASE("Green threads interleave at Yield", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::GreenPool pool(GreenConfig(4), reg);
  REQUIRE(pool.Start().has_value());

  const uint64_t start = hive::SteadyNowUs();
  for (int i = 0; i < 4; ++i) {
    REQUIRE(pool.Submit(MakeRequest("s" + std::to_string(i), "test.sleep",
                                    "[200]"),
                        sink.Callback())
                .has_value());
  }
  REQUIRE(WaitUntil([&] { return sink.Size() == 4U; }));
  for (int i = 0; i < 4; ++i) {
    REQUIRE(sink.Get("s" + std::to_string(i)).result == "slept");
  }
  REQUIRE(hive::SteadyNowUs() - start < 700000U);
}

TEST_CASE("Green pool kills at the hard limit", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::PoolConfig cfg = GreenConfig(1);
  cfg.default_hard_limit_ms = 40;
  hive::GreenPool pool(cfg, reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("h", "test.sleep", "[5000]"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("h"); }, 2000));
  REQUIRE(sink.Get("h").kind == hive::OutcomeKind::kTimeout);

  REQUIRE(pool.Submit(MakeRequest("n", "test.add", "[1, 2]"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("n"); }));
  REQUIRE(sink.Get("n").result == 3);
  REQUIRE(sink.Deliveries("h") == 1U);
}

TEST_CASE("Green pool Terminate", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::GreenPool pool(GreenConfig(1), reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("r", "test.sleep", "[5000]"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("q", "test.add"), sink.Callback())
              .has_value());
  REQUIRE(pool.Terminate("q", hive::TerminateReason::kRevoked).has_value());
  REQUIRE(sink.Get("q").error.type == hive::error_type::kTerminated);

  REQUIRE(pool.Terminate("r", hive::TerminateReason::kRevoked).has_value());
  REQUIRE(sink.Get("r").kind == hive::OutcomeKind::kWorkerLost);
  REQUIRE(sink.Get("r").error.type == hive::error_type::kTerminated);
  REQUIRE(pool.Outstanding() == 0U);
}

TEST_CASE("Green pool shutdown drains within grace", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::GreenPool pool(GreenConfig(2), reg);
  REQUIRE(pool.Start().has_value());
  REQUIRE(pool.Submit(MakeRequest("g", "test.sleep", "[30]"), sink.Callback())
              .has_value());
  pool.Shutdown(2000);
  REQUIRE(sink.Get("g").kind == hive::OutcomeKind::kSuccess);
  REQUIRE(!pool.IsRunning());
}

TEST_CASE("Green pool refuses work after shutdown", "[pool_green]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::GreenPool pool(GreenConfig(1), reg);
  REQUIRE(pool.Start().has_value());
  pool.Shutdown(1000);
  REQUIRE(!pool.IsRunning());
  REQUIRE(pool.Submit(MakeRequest("b", "test.add"), sink.Callback())
              .get_error() == hive::PoolError::kShuttingDown);
  REQUIRE(!sink.Has("b"));
}

#endif  // HIVE_HAS_UCONTEXT
