/**
 * @file test_watchdog.cpp
 * @brief Tests for watchdog.hpp
 */

#include "hive/watchdog.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

struct Events {
  uint32_t lost = 0;
  uint32_t recovered = 0;
  uint32_t last_slot = 0xFFFFFFFFU;
};

void OnLost(uint32_t slot, const char*, void* ctx) {
  auto* e = static_cast<Events*>(ctx);
  ++e->lost;
  e->last_slot = slot;
}

void OnRecovered(uint32_t slot, const char*, void* ctx) {
  auto* e = static_cast<Events*>(ctx);
  ++e->recovered;
  e->last_slot = slot;
}

bool ProbeFlag(uint32_t, void* ctx) {
  return static_cast<std::atomic<bool>*>(ctx)->load();
}

}  // namespace

TEST_CASE("Watchdog probe loss and recovery fire once per edge",
          "[watchdog]") {
  hive::SlotWatchdog<4> wd;
  Events ev;
  wd.SetOnLost(&OnLost, &ev);
  wd.SetOnRecovered(&OnRecovered, &ev);
  std::atomic<bool> alive{true};
  auto reg = wd.RegisterProbe("slot-0", &ProbeFlag, &alive);
  REQUIRE(reg.has_value());
  REQUIRE(reg.value().heartbeat == nullptr);
  const uint32_t id = reg.value().id.value();

  REQUIRE(wd.Check() == 0U);
  alive = false;
  REQUIRE(wd.Check() == 1U);
  REQUIRE(wd.Check() == 1U);
  REQUIRE(ev.lost == 1U);
  REQUIRE(ev.last_slot == id);
  REQUIRE(wd.IsUnhealthy(reg.value().id));

  alive = true;
  REQUIRE(wd.Check() == 0U);
  REQUIRE(ev.recovered == 1U);
}

TEST_CASE("Watchdog heartbeat timeout", "[watchdog]") {
  hive::SlotWatchdog<2> wd;
  Events ev;
  wd.SetOnLost(&OnLost, &ev);
  auto reg = wd.Register("hub", 20);
  REQUIRE(reg.has_value());
  hive::ThreadHeartbeat* hb = reg.value().heartbeat;
  REQUIRE(hb != nullptr);

  hb->Beat();
  REQUIRE(wd.Check() == 0U);
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  REQUIRE(wd.Check() == 1U);
  REQUIRE(ev.lost == 1U);

  wd.Feed(reg.value().id);
  REQUIRE(wd.Check() == 0U);
}

TEST_CASE("Watchdog registration errors", "[watchdog]") {
  hive::SlotWatchdog<1> wd;
  auto zero = wd.Register("x", 0);
  REQUIRE(!zero.has_value());
  REQUIRE(zero.get_error() == hive::WatchdogError::kInvalidTimeout);

  auto null_probe = wd.RegisterProbe("x", nullptr, nullptr);
  REQUIRE(null_probe.get_error() == hive::WatchdogError::kInvalidProbe);

  auto first = wd.Register("a", 100);
  REQUIRE(first.has_value());
  auto full = wd.Register("b", 100);
  REQUIRE(full.get_error() == hive::WatchdogError::kSlotsFull);

  REQUIRE(wd.Unregister(first.value().id).has_value());
  REQUIRE(wd.Unregister(first.value().id).get_error() ==
          hive::WatchdogError::kNotRegistered);
  REQUIRE(wd.Register("b", 100).has_value());
}

TEST_CASE("Watchdog slot ids follow registration order", "[watchdog]") {
  hive::SlotWatchdog<8> wd;
  std::atomic<bool> alive{true};
  for (uint32_t i = 0; i < 8U; ++i) {
    auto r = wd.RegisterProbe("slot", &ProbeFlag, &alive);
    REQUIRE(r.has_value());
    REQUIRE(r.value().id.value() == i);
  }
  REQUIRE(wd.ActiveCount() == 8U);
}

TEST_CASE("Watchdog auto check thread", "[watchdog]") {
  hive::SlotWatchdog<2> wd;
  std::atomic<uint32_t> lost{0};
  wd.SetOnLost(
      [](uint32_t, const char*, void* ctx) {
        static_cast<std::atomic<uint32_t>*>(ctx)->fetch_add(1);
      },
      &lost);
  std::atomic<bool> alive{false};
  REQUIRE(wd.RegisterProbe("dead", &ProbeFlag, &alive).has_value());
  wd.StartAutoCheck(5);
  const auto end = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (lost.load() == 0U && std::chrono::steady_clock::now() < end) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  wd.StopAutoCheck();
  REQUIRE(lost.load() == 1U);
}
