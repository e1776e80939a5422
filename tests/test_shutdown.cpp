/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "hive/shutdown.hpp"
#include "hive/worker.hpp"

#include <catch2/catch.hpp>

#include <csignal>
#include <vector>

namespace {

std::vector<int>& Order() {
  static std::vector<int> v;
  return v;
}

void First(int) { Order().push_back(1); }
void Second(int) { Order().push_back(2); }

}  // namespace

TEST_CASE("Quit wakes WaitForSignal with zero", "[shutdown]") {
  hive::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());
  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit();
  REQUIRE(mgr.WaitForSignal(1000) == 0);
  REQUIRE(mgr.IsShutdownRequested());
  REQUIRE(mgr.SignalCount() == 1U);
}

TEST_CASE("WaitForSignal times out", "[shutdown]") {
  hive::ShutdownManager mgr;
  REQUIRE(mgr.WaitForSignal(10) == hive::ShutdownManager::kTimedOut);
}

TEST_CASE("Only one manager per process", "[shutdown]") {
  hive::ShutdownManager a;
  hive::ShutdownManager b;
  REQUIRE(a.IsValid());
  REQUIRE(!b.IsValid());
  REQUIRE(b.Register(&First).get_error() ==
          hive::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("Callbacks run in reverse registration order", "[shutdown]") {
  Order().clear();
  hive::ShutdownManager mgr;
  REQUIRE(mgr.Register(&First).has_value());
  REQUIRE(mgr.Register(&Second).has_value());
  mgr.Quit(SIGTERM);
  mgr.WaitForShutdown();
  REQUIRE(Order() == (std::vector<int>{2, 1}));
}

TEST_CASE("Delivered signals arrive in order", "[shutdown]") {
  hive::ShutdownManager mgr;
  REQUIRE(mgr.InstallSignalHandlers().has_value());
  REQUIRE(::raise(SIGTERM) == 0);
  REQUIRE(::raise(SIGINT) == 0);
  REQUIRE(mgr.WaitForSignal(1000) == SIGTERM);
  REQUIRE(mgr.WaitForSignal(1000) == SIGINT);
  REQUIRE(mgr.SignalCount() == 2U);
}

TEST_CASE("Stop mode per signal", "[shutdown]") {
  REQUIRE(hive::StopModeForSignal(SIGTERM, 1U) == hive::StopMode::kWarm);
  REQUIRE(hive::StopModeForSignal(SIGINT, 1U) == hive::StopMode::kWarm);
  REQUIRE(hive::StopModeForSignal(SIGTERM, 2U) == hive::StopMode::kCold);
  REQUIRE(hive::StopModeForSignal(SIGQUIT, 1U) == hive::StopMode::kCold);
}
