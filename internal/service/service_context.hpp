#pragma once

#include <memory>

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

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<cache::KeyedCache>      cache;
  std::shared_ptr<cache::ProductsCache>   products;
  std::shared_ptr<cache::CategoriesCache> categories;
  std::shared_ptr<cache::TiersCache>      tiers;
  std::shared_ptr<cache::PricingCache>    pricing;

  std::shared_ptr<invalidation::InvalidationCoordinator> invalidation;

  std::shared_ptr<engine::PriceSource>         price_source;
  std::shared_ptr<engine::PricingResolver>     resolver;
  std::shared_ptr<engine::BulkPricingResolver> bulk_resolver;

  util::NowFn now = util::Now;
};

} // namespace pricing::service
