#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include "internal/cache/cache_sweeper.hpp"
#include "internal/cache/categories_cache.hpp"
#include "internal/cache/keyed_cache.hpp"
#include "internal/cache/memory_cache_store.hpp"
#include "internal/cache/pricing_cache.hpp"
#include "internal/cache/products_cache.hpp"
#include "internal/cache/tiers_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/invalidation/invalidation_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pricing/bulk_pricing_resolver.hpp"
#include "internal/pricing/price_source.hpp"
#include "internal/pricing/pricing_resolver.hpp"
#include "internal/pricing/snapshot_loader.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/pricing_service.hpp"
#include "internal/service/service_context.hpp"
#if PRICING_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace pricing::factory {

using pricing::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PRICING_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->BootstrapSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

engine::SelectionPolicy ToSelectionPolicy(pricing::runtime::config::SelectionPolicy policy) {
  switch (policy) {
    case pricing::runtime::config::SELECTION_POLICY_PRIORITY_EXCLUSIVE:
      return engine::SelectionPolicy::kPriorityExclusive;
    case pricing::runtime::config::SELECTION_POLICY_BEST_DISCOUNT:
    default:
      return engine::SelectionPolicy::kBestDiscount;
  }
}

std::chrono::seconds Seconds(uint32_t value) {
  return std::chrono::seconds(value);
}

} // namespace

void Application::Shutdown() {
  if (sweeper) sweeper->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, BuildOptions options) {
  Application app;
  if (!options.now) options.now = util::Now;

  const auto& cache_config = config.cache();
  const auto& ttl          = cache_config.ttl();
  const auto& prefixes     = cache_config.prefixes();

  // ------------------------------------------------------------------
  // Cache
  // ------------------------------------------------------------------
  const std::size_t max_bytes = static_cast<std::size_t>(cache_config.max_size_mb()) * 1024 * 1024;
  auto              store     = std::make_shared<cache::MemoryCacheStore>(max_bytes);

  cache::KeyedCacheOptions cache_options;
  cache_options.default_ttl    = Seconds(cache_config.default_ttl_seconds());
  cache_options.max_key_length = cache_config.max_key_length();
  app.cache                    = std::make_shared<cache::KeyedCache>(store, cache_options, options.now);

  app.products_cache   = std::make_shared<cache::ProductsCache>(app.cache, prefixes.products(), Seconds(ttl.products_seconds()));
  app.categories_cache = std::make_shared<cache::CategoriesCache>(app.cache, prefixes.categories(), Seconds(ttl.categories_seconds()));
  app.tiers_cache      = std::make_shared<cache::TiersCache>(app.cache, prefixes.customer_tiers(), Seconds(ttl.customer_tiers_seconds()));

  cache::PricingCacheTtls pricing_ttls;
  pricing_ttls.product_pricing  = Seconds(ttl.product_pricing_seconds());
  pricing_ttls.bulk_pricing     = Seconds(ttl.bulk_pricing_seconds());
  pricing_ttls.price_lists      = Seconds(ttl.price_lists_seconds());
  pricing_ttls.price_list_lines = Seconds(ttl.price_list_lines_seconds());
  app.pricing_cache             = std::make_shared<cache::PricingCache>(app.cache, prefixes.pricing(), pricing_ttls);

  // ------------------------------------------------------------------
  // Invalidation
  // ------------------------------------------------------------------
  app.invalidation = std::make_shared<invalidation::InvalidationCoordinator>();
  app.invalidation->Register(app.products_cache);
  app.invalidation->Register(app.categories_cache);
  app.invalidation->Register(app.tiers_cache);
  app.invalidation->Register(app.pricing_cache);

  // ------------------------------------------------------------------
  // Persistence + resolvers
  // ------------------------------------------------------------------
  app.repository   = BuildRepository(config);
  app.price_source = std::make_shared<engine::RepositoryPriceSource>(app.repository);

  engine::ResolverOptions resolver_options;
  resolver_options.default_tier = config.pricing().default_tier();
  resolver_options.policy       = ToSelectionPolicy(config.pricing().selection_policy());

  auto loader       = std::make_shared<engine::SnapshotLoader>(app.price_source, app.pricing_cache, config.pricing().sequential_line_fetch());
  app.resolver      = std::make_shared<engine::PricingResolver>(loader, app.pricing_cache, resolver_options, options.now);
  app.bulk_resolver = std::make_shared<engine::BulkPricingResolver>(loader, app.pricing_cache, resolver_options, options.now);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository    = app.repository;
  ctx.cache         = app.cache;
  ctx.products      = app.products_cache;
  ctx.categories    = app.categories_cache;
  ctx.tiers         = app.tiers_cache;
  ctx.pricing       = app.pricing_cache;
  ctx.invalidation  = app.invalidation;
  ctx.price_source  = app.price_source;
  ctx.resolver      = app.resolver;
  ctx.bulk_resolver = app.bulk_resolver;
  ctx.now           = options.now;

  app.admin_service   = std::make_shared<service::AdminService>(ctx);
  app.pricing_service = std::make_shared<service::PricingService>(ctx);

  // ------------------------------------------------------------------
  // Background sweep
  // ------------------------------------------------------------------
  if (options.start_sweeper && cache_config.cleanup_interval_seconds() > 0) {
    app.sweeper = std::make_shared<cache::CacheSweeper>(app.cache, std::chrono::seconds(cache_config.cleanup_interval_seconds()));
    app.sweeper->Start();
  }

  PRICING_LOG_INFO("pricing engine built", {observability::StringField("database", config.database().has_sqlite() ? "sqlite" : "memory"),
                                            observability::StringField("selection_policy", engine::ToString(resolver_options.policy)),
                                            observability::StringField("default_tier", resolver_options.default_tier),
                                            observability::IntField("max_cache_bytes", static_cast<int64_t>(max_bytes))});
  return app;
}

} // namespace pricing::factory
