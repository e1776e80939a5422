/**
 * @file pool_factory.hpp
 * @brief Select and construct an ExecutionPool from a PoolConfig.
 */

#ifndef HIVE_POOL_FACTORY_HPP_
#define HIVE_POOL_FACTORY_HPP_

#include "hive/log.hpp"
#include "hive/platform.hpp"
#include "hive/pool.hpp"
#include "hive/pool_green.hpp"
#include "hive/pool_process.hpp"
#include "hive/pool_solo.hpp"
#include "hive/pool_thread.hpp"
#include "hive/registry.hpp"

#include <memory>

namespace hive {

/**
 * @brief Build (but do not start) the pool for @p cfg.strategy.
 *
 * @return kUnsupportedStrategy when the strategy is unavailable on this
 *         host, kInvalidConfig for an out-of-range concurrency.
 */
inline expected<std::unique_ptr<ExecutionPool>, PoolError> CreatePool(
    const PoolConfig& cfg, const TaskRegistry& registry) {
  using R = expected<std::unique_ptr<ExecutionPool>, PoolError>;
  PoolConfig effective = cfg;
  if (effective.strategy == PoolStrategy::kSolo) effective.concurrency = 1U;
  auto valid = detail::ValidatePoolConfig(effective);
  if (!valid) return R::error(valid.get_error());

  std::unique_ptr<ExecutionPool> pool;
  switch (effective.strategy) {
#if defined(HIVE_HAS_FORK)
    case PoolStrategy::kProcessFork:
      pool.reset(new ProcessPool(effective, registry, false));
      break;
    case PoolStrategy::kProcessSpawn:
      pool.reset(new ProcessPool(effective, registry, true));
      break;
#endif
#if defined(HIVE_HAS_UCONTEXT)
    case PoolStrategy::kGreenThread:
      pool.reset(new GreenPool(effective, registry));
      break;
#endif
    case PoolStrategy::kNativeThread:
      pool.reset(new ThreadPool(effective, registry));
      break;
    case PoolStrategy::kSolo:
      pool.reset(new SoloPool(effective, registry));
      break;
    default:
      return R::error(PoolError::kUnsupportedStrategy);
  }
  HIVE_LOG_DEBUG("Pool", "created %s pool '%s' (concurrency %u)",
                 PoolStrategyName(effective.strategy), effective.name.c_str(),
                 effective.concurrency);
  return R::success(std::move(pool));
}

}  // namespace hive

#endif  // HIVE_POOL_FACTORY_HPP_
