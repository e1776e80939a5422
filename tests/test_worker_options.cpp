/**
 * @file test_worker_options.cpp
 * @brief Tests for worker_options.hpp
 */

#include "hive/worker_options.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <vector>

TEST_CASE("LoadWorkerOptions defaults", "[worker_options]") {
  hive::ConfigStore store;
  auto r = hive::LoadWorkerOptions(store);
  REQUIRE(r.has_value());
  const hive::WorkerOptions& o = r.value();
  REQUIRE(o.pool.strategy == hive::PoolStrategy::kNativeThread);
  REQUIRE(o.pool.concurrency == 4U);
  REQUIRE(o.pool.watchdog_interval_ms == 100U);
  REQUIRE(o.dispatcher.prefetch_multiplier == 4U);
  REQUIRE(o.dispatcher.retry_route == hive::RetryRoute::kInternal);
  REQUIRE(!o.pool.hostname.empty());
  REQUIRE(o.dispatcher.hostname == o.pool.hostname);
}

TEST_CASE("LoadWorkerOptions maps every section", "[worker_options]") {
  hive::ConfigStore store;
  store.Set("worker", "hostname", "node-a");
  store.Set("worker", "name", "billing");
  store.Set("pool", "strategy", "solo");
  store.Set("pool", "concurrency", "2");
  store.Set("pool", "max_tasks_per_child", "50");
  store.Set("pool", "max_memory_per_child", "200MB");
  store.Set("pool", "watchdog_interval", "50ms");
  store.Set("pool", "green_stack_size", "128KB");
  store.Set("dispatcher", "prefetch_multiplier", "1");
  store.Set("dispatcher", "poll_interval", "20ms");
  store.Set("dispatcher", "hard_limit_grace", "2s");
  store.Set("dispatcher", "shutdown_grace", "1m");
  store.Set("dispatcher", "retry_route", "broker");
  store.Set("limits", "soft_time_limit", "10s");
  store.Set("limits", "time_limit", "15s");
  store.Set("log", "level", "warn");

  auto r = hive::LoadWorkerOptions(store);
  REQUIRE(r.has_value());
  const hive::WorkerOptions& o = r.value();
  REQUIRE(o.pool.hostname == "node-a");
  REQUIRE(o.pool.name == "billing");
  REQUIRE(o.pool.strategy == hive::PoolStrategy::kSolo);
  REQUIRE(o.pool.concurrency == 2U);
  REQUIRE(o.pool.max_tasks_per_child == 50U);
  REQUIRE(o.pool.max_memory_per_child == 200ULL << 20);
  REQUIRE(o.pool.watchdog_interval_ms == 50U);
  REQUIRE(o.pool.green_stack_size == 128U * 1024U);
  REQUIRE(o.dispatcher.prefetch_multiplier == 1U);
  REQUIRE(o.dispatcher.poll_interval_ms == 20U);
  REQUIRE(o.dispatcher.hard_limit_grace_ms == 2000U);
  REQUIRE(o.dispatcher.shutdown_grace_ms == 60000U);
  REQUIRE(o.dispatcher.retry_route == hive::RetryRoute::kBroker);
  REQUIRE(o.pool.default_soft_limit_ms == 10000U);
  REQUIRE(o.pool.default_hard_limit_ms == 15000U);
  REQUIRE(o.dispatcher.default_hard_limit_ms == 15000U);
  REQUIRE(o.log_level == hive::log::Level::kWarn);
}

TEST_CASE("LoadWorkerOptions rejects invalid values", "[worker_options]") {
  struct Case {
    const char* section;
    const char* key;
    const char* value;
  };
  const Case cases[] = {
      {"pool", "strategy", "eventlet"},
      {"pool", "concurrency", "0"},
      {"pool", "concurrency", "-3"},
      {"pool", "concurrency", "lots"},
      {"pool", "max_memory_per_child", "much"},
      {"limits", "time_limit", "soon"},
      {"dispatcher", "retry_route", "carrier-pigeon"},
      {"dispatcher", "poll_interval", "0ms"},
      {"log", "level", "chatty"},
  };
  for (const Case& c : cases) {
    hive::ConfigStore store;
    store.Set(c.section, c.key, c.value);
    auto r = hive::LoadWorkerOptions(store);
    INFO(c.section << "." << c.key << " = " << c.value);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == hive::ConfigError::kInvalidValue);
  }
}

TEST_CASE("LoadWorkerOptions rejects soft limit above hard limit",
          "[worker_options]") {
  hive::ConfigStore store;
  store.Set("limits", "soft_time_limit", "20s");
  store.Set("limits", "time_limit", "10s");
  auto r = hive::LoadWorkerOptions(store);
  REQUIRE(!r.has_value());
}

TEST_CASE("LoadWorkerOptions accepts strategy aliases", "[worker_options]") {
  hive::ConfigStore store;
  store.Set("pool", "strategy", "native-thread");
  REQUIRE(hive::LoadWorkerOptions(store).value().pool.strategy ==
          hive::PoolStrategy::kNativeThread);
  store.Set("pool", "strategy", "fork");
  REQUIRE(hive::LoadWorkerOptions(store).value().pool.strategy ==
          hive::PoolStrategy::kProcessFork);
  store.Set("pool", "strategy", "green-thread");
  REQUIRE(hive::LoadWorkerOptions(store).value().pool.strategy ==
          hive::PoolStrategy::kGreenThread);
}

TEST_CASE("ApplyWorkerEnvironment uses HIVE_ prefix", "[worker_options]") {
  ::setenv("HIVE_POOL_CONCURRENCY", "9", 1);
  ::setenv("HIVE_DISPATCHER_RETRY_ROUTE", "broker", 1);
  hive::ConfigStore store;
  store.Set("pool", "concurrency", "2");
  auto n = hive::ApplyWorkerEnvironment(store);
  ::unsetenv("HIVE_POOL_CONCURRENCY");
  ::unsetenv("HIVE_DISPATCHER_RETRY_ROUTE");
  REQUIRE(n.has_value());
  REQUIRE(n.value() >= 2U);

  auto r = hive::LoadWorkerOptions(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().pool.concurrency == 9U);
  REQUIRE(r.value().dispatcher.retry_route == hive::RetryRoute::kBroker);
}

TEST_CASE("UnknownWorkerKeys lists options the worker ignores",
          "[worker_options]") {
  hive::ConfigStore store;
  store.Set("pool", "concurrency", "2");
  store.Set("pool", "concurency", "4");
  store.Set("broker", "url", "amqp://localhost");
  REQUIRE(hive::UnknownWorkerKeys(store) ==
          (std::vector<std::string>{"broker.url", "pool.concurency"}));

  auto r = hive::LoadWorkerOptions(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().pool.concurrency == 2U);
}
