/**
 * @file test_pool_thread.cpp
 * @brief Tests for pool_thread.hpp
 */

#include "hive/pool_thread.hpp"

#include "test_tasks.hpp"

#include <catch2/catch.hpp>

#include <string>

using hive_test::MakeRequest;
using hive_test::OutcomeSink;
using hive_test::WaitUntil;

namespace {

hive::PoolConfig ThreadConfig(uint32_t concurrency) {
  hive::PoolConfig cfg;
  cfg.strategy = hive::PoolStrategy::kNativeThread;
  cfg.concurrency = concurrency;
  cfg.watchdog_interval_ms = 10;
  cfg.hostname = "thread-host";
  return cfg;
}

}  // namespace

TEST_CASE("Thread pool runs tasks", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(2), reg);
  REQUIRE(pool.Start().has_value());
  REQUIRE(pool.Start().get_error() == hive::PoolError::kAlreadyStarted);

  REQUIRE(pool.Submit(MakeRequest("a", "test.add", "[20, 22]"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("h", "test.hostname"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("t", "test.throw"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Size() == 3U; }));
  REQUIRE(sink.Get("a").result == 42);
  REQUIRE(sink.Get("h").result == "thread-host");
  REQUIRE(sink.Get("t").kind == hive::OutcomeKind::kFailure);
  REQUIRE(sink.Get("t").error.type == hive::error_type::kException);

  auto stats = pool.GetStats();
  REQUIRE(stats.submitted == 3U);
  REQUIRE(stats.succeeded == 2U);
  REQUIRE(stats.failed == 1U);
}

TEST_CASE("Thread pool runs slots in parallel", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(4), reg);
  REQUIRE(pool.Start().has_value());

  const uint64_t start = hive::SteadyNowUs();
  for (int i = 0; i < 4; ++i) {
    REQUIRE(pool.Submit(MakeRequest("b" + std::to_string(i), "test.block",
                                    "[200]"),
                        sink.Callback())
                .has_value());
  }
  REQUIRE(WaitUntil([&] { return sink.Size() == 4U; }));
  REQUIRE(hive::SteadyNowUs() - start < 700000U);
}

TEST_CASE("Thread pool bounds its pending queue", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(1), reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("1", "test.block", "[100]"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("2", "test.block", "[10]"), sink.Callback())
              .has_value());
  REQUIRE(pool.Submit(MakeRequest("3", "test.add"), sink.Callback())
              .get_error() == hive::PoolError::kQueueFull);
  REQUIRE(pool.Submit(MakeRequest("1", "test.add"), sink.Callback())
              .get_error() == hive::PoolError::kDuplicateRequest);
  REQUIRE(WaitUntil([&] { return sink.Size() == 2U; }));
  REQUIRE(sink.Get("2").kind == hive::OutcomeKind::kSuccess);
}

TEST_CASE("Thread pool enforces time limits", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;

  SECTION("soft limit cancels cooperatively") {
    hive::PoolConfig cfg = ThreadConfig(1);
    cfg.default_soft_limit_ms = 30;
    hive::ThreadPool pool(cfg, reg);
    REQUIRE(pool.Start().has_value());
    REQUIRE(pool.Submit(MakeRequest("s", "test.sleep", "[5000]"),
                        sink.Callback())
                .has_value());
    REQUIRE(WaitUntil([&] { return sink.Has("s"); }, 2000));
    REQUIRE(sink.Get("s").error.type ==
            hive::error_type::kSoftTimeLimitExceeded);
  }

  SECTION("hard limit abandons the thread and keeps the slot") {
    hive::PoolConfig cfg = ThreadConfig(1);
    cfg.default_hard_limit_ms = 50;
    hive::ThreadPool pool(cfg, reg);
    REQUIRE(pool.Start().has_value());
    REQUIRE(pool.Submit(MakeRequest("h", "test.block", "[400]"),
                        sink.Callback())
                .has_value());
    REQUIRE(WaitUntil([&] { return sink.Has("h"); }, 2000));
    REQUIRE(sink.Get("h").kind == hive::OutcomeKind::kTimeout);

    REQUIRE(pool.Submit(MakeRequest("next", "test.add", "[1, 1]"),
                        sink.Callback())
                .has_value());
    REQUIRE(WaitUntil([&] { return sink.Has("next"); }));
    REQUIRE(sink.Get("next").result == 2);

    // The abandoned thread finishing later must not deliver again.
    std::this_thread::sleep_for(std::chrono::milliseconds(450));
    REQUIRE(sink.Deliveries("h") == 1U);
    REQUIRE(pool.GetStats().restarts >= 1U);
  }
}

TEST_CASE("Thread pool Terminate reports Terminated", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(1), reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("r", "test.sleep", "[5000]"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return pool.Slots()[0].state == hive::SlotState::kBusy; }));
  REQUIRE(pool.Terminate("r", hive::TerminateReason::kRevoked).has_value());
  REQUIRE(sink.Get("r").kind == hive::OutcomeKind::kWorkerLost);
  REQUIRE(sink.Get("r").error.type == hive::error_type::kTerminated);

  REQUIRE(pool.Submit(MakeRequest("t", "test.sleep", "[5000]"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return pool.Slots()[0].request_id == "t"; }));
  REQUIRE(pool.Terminate("t", hive::TerminateReason::kTimeLimit).has_value());
  REQUIRE(sink.Get("t").kind == hive::OutcomeKind::kTimeout);
}

TEST_CASE("Thread pool replaces a thread that exits", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(1), reg);
  REQUIRE(pool.Start().has_value());

  REQUIRE(pool.Submit(MakeRequest("x1", "test.exit_thread"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("x1"); }));
  REQUIRE(sink.Get("x1").kind == hive::OutcomeKind::kWorkerLost);

  REQUIRE(pool.Submit(MakeRequest("x2", "test.exit_thread"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("x2"); }));
  REQUIRE(sink.Get("x2").kind == hive::OutcomeKind::kWorkerLost);

  REQUIRE(pool.Submit(MakeRequest("ok", "test.add", "[2, 2]"), sink.Callback())
              .has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("ok"); }));
  REQUIRE(sink.Get("ok").result == 4);
}

TEST_CASE("Thread pool recycles after max_tasks_per_child", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::PoolConfig cfg = ThreadConfig(1);
  cfg.max_tasks_per_child = 2;
  hive::ThreadPool pool(cfg, reg);
  REQUIRE(pool.Start().has_value());
  const uint64_t first_generation = pool.Slots()[0].generation;

  for (int i = 0; i < 4; ++i) {
    const std::string id = "m" + std::to_string(i);
    REQUIRE(pool.Submit(MakeRequest(id, "test.add"), sink.Callback())
                .has_value());
    REQUIRE(WaitUntil([&] { return sink.Has(id); }));
  }
  REQUIRE(WaitUntil([&] { return pool.GetStats().restarts == 2U; }));
  REQUIRE(pool.Slots()[0].generation == first_generation + 2U);
}

TEST_CASE("Thread pool shutdown", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;

  SECTION("grace lets in-flight work finish") {
    hive::ThreadPool pool(ThreadConfig(1), reg);
    REQUIRE(pool.Start().has_value());
    REQUIRE(pool.Submit(MakeRequest("g", "test.block", "[50]"), sink.Callback())
                .has_value());
    pool.Shutdown(2000);
    REQUIRE(sink.Get("g").kind == hive::OutcomeKind::kSuccess);
  }
  SECTION("no grace reports in-flight and queued work as lost") {
    hive::ThreadPool pool(ThreadConfig(1), reg);
    REQUIRE(pool.Start().has_value());
    REQUIRE(pool.Submit(MakeRequest("run", "test.sleep", "[5000]"),
                        sink.Callback())
                .has_value());
    REQUIRE(pool.Submit(MakeRequest("queued", "test.add"), sink.Callback())
                .has_value());
    pool.Shutdown(0);
    REQUIRE(sink.Get("run").kind == hive::OutcomeKind::kWorkerLost);
    REQUIRE(sink.Get("queued").kind == hive::OutcomeKind::kWorkerLost);
    REQUIRE(!pool.IsRunning());
  }
}

TEST_CASE("Thread pool refuses work after shutdown", "[pool_thread]") {
  hive::TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  OutcomeSink sink;
  hive::ThreadPool pool(ThreadConfig(1), reg);
  REQUIRE(pool.Start().has_value());
  REQUIRE(pool.Submit(MakeRequest("a", "test.add"), sink.Callback()).has_value());
  REQUIRE(WaitUntil([&] { return sink.Has("a"); }));
  pool.Shutdown(1000);
  REQUIRE(!pool.IsRunning());
  REQUIRE(pool.Submit(MakeRequest("b", "test.add"), sink.Callback())
              .get_error() == hive::PoolError::kShuttingDown);
  REQUIRE(!sink.Has("b"));
}
