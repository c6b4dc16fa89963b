#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace pricing::db {
class Repository;
}
namespace pricing::cache {
class KeyedCache;
class ProductsCache;
class CategoriesCache;
class TiersCache;
class PricingCache;
class CacheSweeper;
} // namespace pricing::cache
namespace pricing::invalidation {
class InvalidationCoordinator;
}
namespace pricing::engine {
class PriceSource;
class PricingResolver;
class BulkPricingResolver;
} // namespace pricing::engine
namespace pricing::service {
class AdminService;
class PricingService;
} // namespace pricing::service

namespace pricing::factory {

/*
  Application

  Owns all long-lived singletons. Everything here lives until the
  Application is destroyed; the sweeper thread stops with it.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<cache::KeyedCache>      cache;
  std::shared_ptr<cache::ProductsCache>   products_cache;
  std::shared_ptr<cache::CategoriesCache> categories_cache;
  std::shared_ptr<cache::TiersCache>      tiers_cache;
  std::shared_ptr<cache::PricingCache>    pricing_cache;
  std::shared_ptr<cache::CacheSweeper>    sweeper;

  std::shared_ptr<invalidation::InvalidationCoordinator> invalidation;

  std::shared_ptr<engine::PriceSource>         price_source;
  std::shared_ptr<engine::PricingResolver>     resolver;
  std::shared_ptr<engine::BulkPricingResolver> bulk_resolver;

  std::shared_ptr<service::AdminService>   admin_service;
  std::shared_ptr<service::PricingService> pricing_service;

  // Stops background work. Safe to call more than once.
  void Shutdown();
};

struct BuildOptions {
  bool        start_sweeper = true;
  util::NowFn now           = util::Now;
};

/*
  Build

  Composition root. The only place that knows concrete store and
  repository types. Expects a config that already went through
  ConfigLoader::ApplyDefaults.
*/
Application Build(const pricing::runtime::config::RuntimeConfig& config, BuildOptions options = {});

} // namespace pricing::factory
