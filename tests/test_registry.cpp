/**
 * @file test_registry.cpp
 * @brief Tests for registry.hpp and task.hpp
 */

#include "hive/registry.hpp"

#include "test_tasks.hpp"

#include <catch2/catch.hpp>

#include <string>

using hive::RegistryError;
using hive::TaskOptions;
using hive::TaskRegistry;

TEST_CASE("Register and lookup", "[registry]") {
  TaskRegistry reg;
  auto r = reg.Register("math.add", &hive_test::Add);
  REQUIRE(r.has_value());
  REQUIRE(r.value()->name == "math.add");
  REQUIRE(reg.Contains("math.add"));
  REQUIRE(reg.Size() == 1U);

  auto found = reg.Lookup("math.add");
  REQUIRE(found.has_value());
  REQUIRE(found.value() == r.value());
  REQUIRE(found.value()->options.queue == "default");

  auto missing = reg.Lookup("math.sub");
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == RegistryError::kUnknownTask);
}

TEST_CASE("Duplicate names are rejected", "[registry]") {
  TaskRegistry reg;
  REQUIRE(reg.Register("t", &hive_test::Add).has_value());
  auto again = reg.Register("t", &hive_test::Echo);
  REQUIRE(again.get_error() == RegistryError::kDuplicateTask);
  REQUIRE(reg.Lookup("t").value()->handler == &hive_test::Add);
}

TEST_CASE("Invalid registrations", "[registry]") {
  TaskRegistry reg;
  REQUIRE(reg.Register("", &hive_test::Add).get_error() ==
          RegistryError::kInvalidName);
  REQUIRE(reg.Register("t", nullptr).get_error() == RegistryError::kInvalidName);

  TaskOptions limits;
  limits.soft_time_limit_ms = 2000;
  limits.hard_time_limit_ms = 1000;
  REQUIRE(reg.Register("t", &hive_test::Add, limits).get_error() ==
          RegistryError::kInvalidOptions);

  TaskOptions serializer;
  serializer.serializer = "pickle";
  REQUIRE(reg.Register("t", &hive_test::Add, serializer).get_error() ==
          RegistryError::kInvalidOptions);

  TaskOptions rate;
  rate.rate_limit = "ten per second";
  REQUIRE(reg.Register("t", &hive_test::Add, rate).get_error() ==
          RegistryError::kInvalidOptions);
  REQUIRE(reg.Size() == 0U);
}

TEST_CASE("Frozen registry refuses registration", "[registry]") {
  TaskRegistry reg;
  REQUIRE(reg.Register("b", &hive_test::Add).has_value());
  REQUIRE(reg.Register("a", &hive_test::Add).has_value());
  reg.Freeze();
  REQUIRE(reg.IsFrozen());
  REQUIRE(reg.Register("c", &hive_test::Add).get_error() ==
          RegistryError::kFrozen);
  REQUIRE(reg.Names() == (std::vector<std::string>{"a", "b"}));

  size_t seen = 0;
  reg.ForEach([&seen](const hive::TaskDefinition&) { ++seen; });
  REQUIRE(seen == 2U);
}

TEST_CASE("ResolveLimits precedence", "[registry]") {
  hive::TaskDefinition def;
  def.options.soft_time_limit_ms = 300;
  def.options.hard_time_limit_ms = 600;
  hive::TaskRequest req;

  SECTION("task definition over worker default") {
    auto l = hive::ResolveLimits(req, &def, 100, 200);
    REQUIRE(l.soft_ms == 300U);
    REQUIRE(l.hard_ms == 600U);
  }
  SECTION("message override over task definition") {
    req.soft_time_limit_ms = 50;
    req.hard_time_limit_ms = 80;
    auto l = hive::ResolveLimits(req, &def, 100, 200);
    REQUIRE(l.soft_ms == 50U);
    REQUIRE(l.hard_ms == 80U);
  }
  SECTION("worker default when nothing else is set") {
    auto l = hive::ResolveLimits(req, nullptr, 100, 200);
    REQUIRE(l.soft_ms == 100U);
    REQUIRE(l.hard_ms == 200U);
  }
  SECTION("soft at or above hard is dropped") {
    req.soft_time_limit_ms = 700;
    auto l = hive::ResolveLimits(req, &def, 0, 0);
    REQUIRE(l.soft_ms == 0U);
    REQUIRE(l.hard_ms == 600U);
  }
}

TEST_CASE("RunTask converts handler results", "[registry]") {
  TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  hive::ExecEnv env;
  env.hostname = "node-1";
  env.slot = 4;

  SECTION("success") {
    auto o = hive::RunTask(reg, hive_test::MakeRequest("1", "test.add", "[2, 3]"),
                           env);
    REQUIRE(o.kind == hive::OutcomeKind::kSuccess);
    REQUIRE(o.result == 5);
    REQUIRE(o.request_id == "1");
    REQUIRE(o.slot == 4U);
  }
  SECTION("failure") {
    auto o = hive::RunTask(reg, hive_test::MakeRequest("2", "test.fail"), env);
    REQUIRE(o.kind == hive::OutcomeKind::kFailure);
    REQUIRE(o.error.type == "ValueError");
    REQUIRE(o.error.message == "boom");
    REQUIRE(!o.retry_requested);
  }
  SECTION("thrown exception becomes a failure") {
    auto o = hive::RunTask(reg, hive_test::MakeRequest("3", "test.throw"), env);
    REQUIRE(o.kind == hive::OutcomeKind::kFailure);
    REQUIRE(o.error.type == hive::error_type::kException);
    REQUIRE(o.error.message == "thrown from handler");
  }
  SECTION("explicit retry") {
    hive::TaskRequest req = hive_test::MakeRequest("4", "test.retry");
    req.kwargs_json = R"({"countdown_ms": 250})";
    auto o = hive::RunTask(reg, req, env);
    REQUIRE(o.kind == hive::OutcomeKind::kFailure);
    REQUIRE(o.retry_requested);
    REQUIRE(o.retry_countdown_ms == 250U);
  }
  SECTION("unknown task") {
    auto o = hive::RunTask(reg, hive_test::MakeRequest("5", "nope"), env);
    REQUIRE(o.kind == hive::OutcomeKind::kFailure);
    REQUIRE(o.error.type == hive::error_type::kUnknownTask);
    REQUIRE(!o.error.retryable);
  }
  SECTION("context carries hostname") {
    auto o =
        hive::RunTask(reg, hive_test::MakeRequest("6", "test.hostname"), env);
    REQUIRE(o.result == "node-1");
  }
}

TEST_CASE("Soft limit turns the cancellation token on", "[registry]") {
  TaskRegistry reg;
  hive_test::RegisterTestTasks(reg);
  hive::ExecEnv env;
  env.soft_limit_ms = 20;
  auto o = hive::RunTask(reg, hive_test::MakeRequest("1", "test.sleep", "[5000]"),
                         env);
  REQUIRE(o.kind == hive::OutcomeKind::kFailure);
  REQUIRE(o.error.type == hive::error_type::kSoftTimeLimitExceeded);
  REQUIRE(o.runtime_us < 2000000U);
}

TEST_CASE("TaskArgs typed access", "[registry]") {
  hive::TaskArgs args(R"([1, 2.5, "x"])", R"({"flag": true, "n": 7})");
  REQUIRE(args.Size() == 3U);
  REQUIRE(args.IntAt(0).value() == 1);
  REQUIRE(args.DoubleAt(1).value() == 2.5);
  REQUIRE(args.StringAt(2).value() == "x");
  REQUIRE(!args.IntAt(2).has_value());
  REQUIRE(!args.IntAt(9).has_value());
  REQUIRE(args.BoolKw("flag").value());
  REQUIRE(args.IntKw("n").value() == 7);
  REQUIRE(!args.StringKw("missing").has_value());

  hive::TaskArgs bad("{not json", "[]");
  REQUIRE(bad.Size() == 0U);
  REQUIRE(bad.Keywords().is_object());
}
