/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp
 */

#include "hive/vocabulary.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <string>

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = hive::expected<int, hive::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = hive::expected<int, hive::ConfigError>::error(
      hive::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hive::ConfigError::kFileNotFound);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = hive::expected<void, hive::ConfigError>::success();
  REQUIRE(ok.has_value());
  auto err = hive::expected<void, hive::ConfigError>::error(
      hive::ConfigError::kInvalidValue);
  REQUIRE(!err);
  REQUIRE(err.get_error() == hive::ConfigError::kInvalidValue);
}

TEST_CASE("expected holds move-only values", "[vocabulary][expected]") {
  auto r = hive::expected<std::unique_ptr<int>, hive::ConfigError>::success(
      std::unique_ptr<int>(new int(5)));
  REQUIRE(r.has_value());
  std::unique_ptr<int> p = std::move(r.value());
  REQUIRE(*p == 5);
}

TEST_CASE("expected copy keeps string payload", "[vocabulary][expected]") {
  auto a = hive::expected<std::string, hive::ConfigError>::success("abc");
  auto b = a;
  REQUIRE(b.value() == "abc");
  REQUIRE(a.value() == "abc");
}

// ============================================================================
// FixedString / NewType / ScopeGuard
// ============================================================================

TEST_CASE("FixedString truncates to capacity", "[vocabulary][fixed_string]") {
  hive::FixedString<4> s(hive::TruncateToCapacity, "worker-1");
  REQUIRE(s.size() == 4U);
  REQUIRE(s == "work");
  s.clear();
  REQUIRE(s.empty());
}

namespace {
struct SlotTag {};
using SlotId = hive::NewType<uint32_t, SlotTag>;
}  // namespace

TEST_CASE("NewType compares by value", "[vocabulary][newtype]") {
  SlotId a(3U);
  SlotId b(3U);
  SlotId c(4U);
  REQUIRE(a == b);
  REQUIRE(a != c);
  REQUIRE(a < c);
  REQUIRE(c.value() == 4U);
}

TEST_CASE("HIVE_SCOPE_EXIT runs at scope end", "[vocabulary][scope]") {
  int n = 0;
  {
    HIVE_SCOPE_EXIT(++n);
    REQUIRE(n == 0);
  }
  REQUIRE(n == 1);
}

TEST_CASE("ScopeGuard release cancels", "[vocabulary][scope]") {
  int n = 0;
  {
    auto g = hive::MakeScopeGuard([&n] { ++n; });
    g.release();
  }
  REQUIRE(n == 0);
}

// ============================================================================
// Error names
// ============================================================================

TEST_CASE("ConfigErrorName covers every code", "[vocabulary]") {
  REQUIRE(std::string(hive::ConfigErrorName(hive::ConfigError::kFileNotFound)) ==
          "FileNotFound");
  REQUIRE(std::string(hive::ConfigErrorName(hive::ConfigError::kInvalidValue)) ==
          "InvalidValue");
}
