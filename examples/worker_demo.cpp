// Copyright (c) 2024 liudegui. MIT License.
//
// worker_demo.cpp -- hive worker end to end.
//
// Demonstrates:
//   1. Task registration with per-task options (retry, time limit, rate)
//   2. Worker options from a config file plus HIVE_* environment overlay
//   3. Spawn-strategy children re-executing this binary
//   4. Retries, soft time limit and rate limiting in the stats
//   5. Warm stop on SIGINT/SIGTERM, or once every result is stored
//
// Usage:
//   worker_demo [config.json]
//   HIVE_POOL_STRATEGY=prefork HIVE_POOL_CONCURRENCY=4 worker_demo

#include "hive/broker.hpp"
#include "hive/codec.hpp"
#include "hive/config.hpp"
#include "hive/log.hpp"
#include "hive/registry.hpp"
#include "hive/worker.hpp"
#include "hive/worker_options.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <thread>

// ============================================================================
// Tasks
// ============================================================================

static hive::TaskResult MathAdd(const hive::TaskArgs& args, hive::TaskContext&) {
  return hive::TaskResult::Success(args.IntAt(0).value_or(0) +
                                   args.IntAt(1).value_or(0));
}

static hive::TaskResult TextUpper(const hive::TaskArgs& args,
                                  hive::TaskContext&) {
  std::string s = args.StringAt(0).value_or("");
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return hive::TaskResult::Success(s);
}

// Fails on the first two attempts, like a flaky upstream.
static hive::TaskResult FetchFlaky(const hive::TaskArgs& args,
                                   hive::TaskContext& ctx) {
  if (ctx.Retries() < 2U) {
    return hive::TaskResult::Failure("ConnectionError",
                                     "upstream refused " +
                                         args.StringAt(0).value_or("?"));
  }
  return hive::TaskResult::Success(
      hive::json{{"url", args.StringAt(0).value_or("?")},
                 {"attempts", ctx.Retries() + 1U}});
}

// Runs until the soft time limit asks it to stop.
static hive::TaskResult ReportLong(const hive::TaskArgs&,
                                   hive::TaskContext& ctx) {
  uint32_t pages = 0U;
  while (!ctx.SoftLimitExceeded()) {
    ++pages;
    ctx.Yield();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return hive::TaskResult::Success(hive::json{{"pages", pages},
                                              {"partial", true}});
}

static void RegisterDemoTasks(hive::TaskRegistry& registry) {
  (void)registry.Register("math.add", &MathAdd);

  hive::TaskOptions upper;
  upper.rate_limit = "20/s";
  (void)registry.Register("text.upper", &TextUpper, upper);

  hive::TaskOptions fetch;
  fetch.retry.max_retries = 5U;
  fetch.retry.backoff_base_ms = 100U;
  fetch.retry.backoff_max_ms = 1000U;
  fetch.retry.retry_for = {"ConnectionError"};
  (void)registry.Register("net.fetch", &FetchFlaky, fetch);

  hive::TaskOptions report;
  report.soft_time_limit_ms = 300U;
  report.hard_time_limit_ms = 2000U;
  (void)registry.Register("report.long", &ReportLong, report);
}

// ============================================================================
// Producer
// ============================================================================

static uint32_t PublishBatch(hive::MemoryBroker& broker) {
  uint32_t n = 0U;
  auto send = [&broker, &n](const char* task, const std::string& args) {
    hive::TaskRequest req;
    req.id = "demo-" + std::to_string(++n);
    req.task = task;
    req.args_json = args;
    req.origin = "worker_demo";
    (void)broker.Enqueue(hive::EncodeTaskMessage(req));
  };
  for (int i = 0; i < 10; ++i) {
    send("math.add", "[" + std::to_string(i) + ", " + std::to_string(i * i) + "]");
  }
  for (const char* w : {"alpha", "beta", "gamma", "delta", "epsilon"}) {
    send("text.upper", std::string("[\"") + w + "\"]");
  }
  send("net.fetch", "[\"http://example.invalid/a\"]");
  send("report.long", "[]");
  send("no.such.task", "[]");
  return n;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char** argv) {
  hive::TaskRegistry registry;
  RegisterDemoTasks(registry);
  // Spawn-strategy children come back here and never return.
  if (hive::RunChildIfRequested(registry)) return 0;

  hive::MultiConfig cfg;
  if (argc > 1) {
    auto loaded = cfg.LoadFile(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "cannot load %s: %s\n", argv[1],
                   hive::ConfigErrorName(loaded.get_error()));
      return 1;
    }
  }
  (void)hive::ApplyWorkerEnvironment(cfg);
  auto options = hive::LoadWorkerOptions(cfg);
  if (!options) {
    std::fprintf(stderr, "invalid worker options: %s\n",
                 hive::ConfigErrorName(options.get_error()));
    return 1;
  }

  hive::MemoryBroker broker;
  hive::MemoryResultBackend backend;
  const uint32_t expected = PublishBatch(broker);

  hive::Worker worker(options.value(), registry, broker, &backend);
  std::atomic<bool> finished{false};
  std::thread monitor([&] {
    while (!finished.load(std::memory_order_acquire)) {
      // The unknown task is rejected before the pool and stored as FAILURE.
      if (backend.Size() >= expected) {
        worker.RequestStop(hive::StopMode::kWarm);
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  });

  auto r = worker.RunUntilSignal();
  finished.store(true, std::memory_order_release);
  monitor.join();
  if (!r) {
    std::fprintf(stderr, "worker failed: %s\n", hive::WorkerErrorName(r.get_error()));
    return 1;
  }

  for (uint32_t i = 1U; i <= expected; ++i) {
    const std::string id = "demo-" + std::to_string(i);
    auto rec = backend.Get(id);
    if (!rec) continue;
    std::printf("%-8s %-12s %-8s %s\n", id.c_str(), rec->task_name.c_str(),
                hive::ResultStatusName(rec->status), rec->ToJson()["result"].dump().c_str());
  }

  const hive::DispatcherStats s = worker.Stats();
  std::printf("\nreceived=%llu succeeded=%llu failed=%llu retried=%llu "
              "unknown=%llu\n",
              static_cast<unsigned long long>(s.received),
              static_cast<unsigned long long>(s.succeeded),
              static_cast<unsigned long long>(s.failed),
              static_cast<unsigned long long>(s.retried),
              static_cast<unsigned long long>(s.unknown_tasks));
  for (const auto& kv : s.per_task) {
    std::printf("  %-12s received=%llu ok=%llu failed=%llu avg=%.1fms\n",
                kv.first.c_str(),
                static_cast<unsigned long long>(kv.second.received),
                static_cast<unsigned long long>(kv.second.succeeded),
                static_cast<unsigned long long>(kv.second.failed),
                kv.second.received == 0U
                    ? 0.0
                    : static_cast<double>(kv.second.total_runtime_us) /
                          1000.0 / static_cast<double>(kv.second.received));
  }
  return 0;
}
