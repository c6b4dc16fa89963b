#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/cache_store.hpp"
#include "internal/cache/categories_cache.hpp"
#include "internal/cache/keyed_cache.hpp"
#include "internal/cache/memory_cache_store.hpp"
#include "internal/cache/pricing_cache.hpp"
#include "internal/cache/products_cache.hpp"
#include "internal/cache/tiers_cache.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/invalidation/invalidation_coordinator.hpp"
#include "internal/pricing/bulk_pricing_resolver.hpp"
#include "internal/pricing/price_source.hpp"
#include "internal/pricing/pricing_resolver.hpp"
#include "internal/pricing/snapshot_loader.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/pricing_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pricing::testing {

// Manually advanced clock. Copies share the same time; safe to read
// from other threads (the sweeper).
class FakeClock {
 public:
  explicit FakeClock(util::TimePoint start = util::FromUnixMillis(1'700'000'000'000))
      : now_ms_(std::make_shared<std::atomic<int64_t>>(util::ToUnixMillis(start))) {
  }

  util::NowFn Fn() const {
    auto now_ms = now_ms_;
    return [now_ms] { return util::FromUnixMillis(now_ms->load()); };
  }

  util::TimePoint Now() const {
    return util::FromUnixMillis(now_ms_->load());
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_->fetch_add(delta.count());
  }

 private:
  std::shared_ptr<std::atomic<int64_t>> now_ms_;
};

/*
  PriceSource decorator that counts backing-store reads and can be told
  to fail for specific price lists.
*/
class CountingPriceSource final : public engine::PriceSource {
 public:
  explicit CountingPriceSource(std::shared_ptr<engine::PriceSource> inner) : inner_(std::move(inner)) {
  }

  std::vector<db::model::PriceListRecord> ListActivePriceLists(util::TimePoint now) override {
    list_calls.fetch_add(1);
    if (fail_lists) throw std::runtime_error("price list store offline");
    return inner_->ListActivePriceLists(now);
  }

  std::vector<db::model::PriceListLineRecord> ListPriceListLines(const std::string& price_list_id) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++line_calls_[price_list_id];
      if (failing_lines_.contains(price_list_id)) throw std::runtime_error("line store offline for " + price_list_id);
    }
    auto lines = inner_->ListPriceListLines(price_list_id);
    if (after_line_fetch) after_line_fetch(price_list_id);
    return lines;
  }

  std::optional<db::model::ProductRecord> GetProduct(const std::string& product_id) override {
    product_calls.fetch_add(1);
    return inner_->GetProduct(product_id);
  }

  int LineCalls(const std::string& price_list_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = line_calls_.find(price_list_id);
    return it == line_calls_.end() ? 0 : it->second;
  }

  int TotalLineCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int                         total = 0;
    for (const auto& [_, calls] : line_calls_) total += calls;
    return total;
  }

  void FailLinesFor(const std::string& price_list_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_lines_.insert(price_list_id);
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    line_calls_.clear();
    list_calls    = 0;
    product_calls = 0;
  }

  std::atomic<int>  list_calls{0};
  std::atomic<int>  product_calls{0};
  std::atomic<bool> fail_lists{false};

  // Runs after the lines were read, before they are returned.
  std::function<void(const std::string&)> after_line_fetch;

 private:
  std::shared_ptr<engine::PriceSource> inner_;

  mutable std::mutex         mutex_;
  std::map<std::string, int> line_calls_;
  std::set<std::string>      failing_lines_;
};

// A cache store whose backend is always unreachable.
class FailingCacheStore final : public cache::CacheStore {
 public:
  cache::LookupResult Get(const std::string&, util::TimePoint) override {
    throw util::CacheBackendError("cache backend unreachable");
  }
  bool Put(const std::string&, std::string, util::TimePoint) override {
    throw util::CacheBackendError("cache backend unreachable");
  }
  bool Erase(const std::string&) override {
    throw util::CacheBackendError("cache backend unreachable");
  }
  std::size_t ErasePrefix(const std::string&) override {
    throw util::CacheBackendError("cache backend unreachable");
  }
  std::size_t Sweep(util::TimePoint) override {
    throw util::CacheBackendError("cache backend unreachable");
  }
  std::size_t Size() const override {
    return 0;
  }
  std::size_t Bytes() const override {
    return 0;
  }
  cache::CacheStoreStats Stats(util::TimePoint) const override {
    throw util::CacheBackendError("cache backend unreachable");
  }
};

// ------------------------------------------------------------
// Record builders
// ------------------------------------------------------------

inline db::model::PriceListRecord MakePriceList(const std::string& id, const std::string& name, uint32_t priority, util::TimePoint valid_from,
                                                std::optional<util::TimePoint> valid_until = std::nullopt, bool active = true) {
  db::model::PriceListRecord list;
  list.id          = id;
  list.name        = name;
  list.priority    = priority;
  list.active      = active;
  list.valid_from  = valid_from;
  list.valid_until = valid_until;
  return list;
}

inline db::model::PriceListLineRecord MakeAllLine(const std::string& id, const std::string& price_list_id, model::DiscountType discount_type,
                                                  double amount, uint32_t min_quantity = 1, std::optional<uint32_t> max_quantity = std::nullopt) {
  db::model::PriceListLineRecord line;
  line.id            = id;
  line.price_list_id = price_list_id;
  line.type          = model::LineType::kAll;
  line.discount_type = discount_type;
  line.amount        = amount;
  line.min_quantity  = min_quantity;
  line.max_quantity  = max_quantity;
  return line;
}

inline db::model::PriceListLineRecord MakeProductLine(const std::string& id, const std::string& price_list_id, const std::string& product_id,
                                                      model::DiscountType discount_type, double amount) {
  auto line       = MakeAllLine(id, price_list_id, discount_type, amount);
  line.type       = model::LineType::kProduct;
  line.product_id = product_id;
  return line;
}

inline db::model::PriceListLineRecord MakeCategoryLine(const std::string& id, const std::string& price_list_id, const std::string& category_id,
                                                       model::DiscountType discount_type, double amount) {
  auto line        = MakeAllLine(id, price_list_id, discount_type, amount);
  line.type        = model::LineType::kCategory;
  line.category_id = category_id;
  return line;
}

inline engine::PricingInput MakeInput(std::optional<std::string> product_id, double base_price, std::optional<std::string> category_id = std::nullopt,
                                      std::string tier = "gold", uint32_t quantity = 1) {
  engine::PricingInput input;
  input.product_id    = std::move(product_id);
  input.base_price    = base_price;
  input.category_id   = std::move(category_id);
  input.customer_tier = std::move(tier);
  input.quantity      = quantity;
  return input;
}

/*
  The whole engine over a MemoryRepository, wired like factory::Build
  but with a fake clock and a CountingPriceSource.
*/
struct EngineHarness {
  explicit EngineHarness(engine::SelectionPolicy policy = engine::SelectionPolicy::kBestDiscount,
                         std::shared_ptr<cache::CacheStore> cache_store = std::make_shared<cache::MemoryCacheStore>(64 * 1024 * 1024)) {
    store = std::move(cache_store);
    keyed_cache = std::make_shared<cache::KeyedCache>(store, cache::KeyedCacheOptions{}, clock.Fn());

    products      = std::make_shared<cache::ProductsCache>(keyed_cache, "products", std::chrono::seconds(600));
    categories    = std::make_shared<cache::CategoriesCache>(keyed_cache, "categories", std::chrono::seconds(1800));
    tiers         = std::make_shared<cache::TiersCache>(keyed_cache, "customer_tiers", std::chrono::seconds(900));
    pricing_cache = std::make_shared<cache::PricingCache>(keyed_cache, "pricing", cache::PricingCacheTtls{});

    coordinator = std::make_shared<invalidation::InvalidationCoordinator>();
    coordinator->Register(products);
    coordinator->Register(categories);
    coordinator->Register(tiers);
    coordinator->Register(pricing_cache);

    repository = std::make_shared<db::memory::MemoryRepository>();
    source     = std::make_shared<CountingPriceSource>(std::make_shared<engine::RepositoryPriceSource>(repository));

    engine::ResolverOptions options;
    options.default_tier = "bronze";
    options.policy       = policy;

    auto loader   = std::make_shared<engine::SnapshotLoader>(source, pricing_cache);
    resolver      = std::make_shared<engine::PricingResolver>(loader, pricing_cache, options, clock.Fn());
    bulk_resolver = std::make_shared<engine::BulkPricingResolver>(loader, pricing_cache, options, clock.Fn());

    service::ServiceContext ctx;
    ctx.repository    = repository;
    ctx.cache         = keyed_cache;
    ctx.products      = products;
    ctx.categories    = categories;
    ctx.tiers         = tiers;
    ctx.pricing       = pricing_cache;
    ctx.invalidation  = coordinator;
    ctx.price_source  = source;
    ctx.resolver      = resolver;
    ctx.bulk_resolver = bulk_resolver;
    ctx.now           = clock.Fn();

    admin         = std::make_shared<service::AdminService>(ctx);
    pricing_front = std::make_shared<service::PricingService>(ctx);
  }

  // A list valid from an hour ago with no expiry.
  db::model::PriceListRecord AddList(const std::string& id, const std::string& name, uint32_t priority = 1) {
    return admin->CreatePriceList(MakePriceList(id, name, priority, clock.Now() - std::chrono::hours(1)));
  }

  FakeClock clock;

  std::shared_ptr<cache::CacheStore>      store;
  std::shared_ptr<cache::KeyedCache>      keyed_cache;
  std::shared_ptr<cache::ProductsCache>   products;
  std::shared_ptr<cache::CategoriesCache> categories;
  std::shared_ptr<cache::TiersCache>      tiers;
  std::shared_ptr<cache::PricingCache>    pricing_cache;

  std::shared_ptr<invalidation::InvalidationCoordinator> coordinator;

  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<CountingPriceSource>          source;

  std::shared_ptr<engine::PricingResolver>     resolver;
  std::shared_ptr<engine::BulkPricingResolver> bulk_resolver;

  std::shared_ptr<service::AdminService>   admin;
  std::shared_ptr<service::PricingService> pricing_front;
};

} // namespace pricing::testing
