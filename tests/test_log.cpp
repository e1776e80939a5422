/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "hive/log.hpp"

#include <catch2/catch.hpp>

#include <cstring>

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = hive::log::GetLevel();
  hive::log::SetLevel(hive::log::Level::kError);
  REQUIRE(hive::log::GetLevel() == hive::log::Level::kError);
  hive::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  hive::log::Init();
  REQUIRE(hive::log::IsInitialized());
  hive::log::Shutdown();
  REQUIRE(!hive::log::IsInitialized());
}

TEST_CASE("Log ParseLevel is case-insensitive", "[log]") {
  hive::log::Level lv = hive::log::Level::kInfo;
  REQUIRE(hive::log::ParseLevel("DEBUG", &lv));
  REQUIRE(lv == hive::log::Level::kDebug);
  REQUIRE(hive::log::ParseLevel("Warning", &lv));
  REQUIRE(lv == hive::log::Level::kWarn);
  REQUIRE(hive::log::ParseLevel("off", &lv));
  REQUIRE(lv == hive::log::Level::kOff);
  REQUIRE(!hive::log::ParseLevel("verbose", &lv));
  REQUIRE(!hive::log::ParseLevel(nullptr, &lv));
}

TEST_CASE("Log level tags", "[log]") {
  REQUIRE(std::strcmp(hive::log::detail::LevelTag(hive::log::Level::kWarn),
                      "WARN") == 0);
  REQUIRE(std::strcmp(hive::log::detail::LevelTag(hive::log::Level::kError),
                      "ERROR") == 0);
}

TEST_CASE("Log macros run at every level", "[log]") {
  auto prev = hive::log::GetLevel();
  hive::log::SetLevel(hive::log::Level::kDebug);
  HIVE_LOG_DEBUG("Test", "debug %d", 1);
  HIVE_LOG_INFO("Test", "info %s", "msg");
  HIVE_LOG_WARN("Test", "warn");
  HIVE_LOG_ERROR("Test", "error %d %d", 1, 2);
  hive::log::SetLevel(hive::log::Level::kOff);
  HIVE_LOG_ERROR("Test", "suppressed");
  hive::log::SetLevel(prev);
  REQUIRE(true);
}

TEST_CASE("Log truncates long messages", "[log]") {
  char big[2048];
  std::memset(big, 'x', sizeof(big) - 1);
  big[sizeof(big) - 1] = '\0';
  HIVE_LOG_INFO("Test", "%s", big);
  REQUIRE(true);
}
