#include "internal/invalidation/invalidation_coordinator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cache/categories_cache.hpp"
#include "internal/cache/keyed_cache.hpp"
#include "internal/cache/memory_cache_store.hpp"
#include "internal/cache/pricing_cache.hpp"
#include "internal/cache/products_cache.hpp"
#include "internal/cache/tiers_cache.hpp"
#include "test_fixtures.hpp"

namespace {

using namespace std::chrono_literals;

using pricing::cache::CategoriesCache;
using pricing::cache::DomainCache;
using pricing::cache::DomainKey;
using pricing::cache::KeyedCache;
using pricing::cache::KeyedCacheOptions;
using pricing::cache::MemoryCacheStore;
using pricing::cache::PricingCache;
using pricing::cache::PricingCacheTtls;
using pricing::cache::ProductsCache;
using pricing::cache::TiersCache;
using pricing::db::model::CategoryRecord;
using pricing::db::model::ProductRecord;
using pricing::db::model::TierRecord;
using pricing::invalidation::DependencyGraph;
using pricing::invalidation::EntityType;
using pricing::invalidation::InvalidationCoordinator;
using pricing::invalidation::InvalidationEvent;
using pricing::invalidation::InvalidationScope;
using pricing::model::PricingResult;
using pricing::testing::FakeClock;

// A categories cache whose invalidation always fails.
class BrokenCategoriesCache final : public DomainCache {
 public:
  explicit BrokenCategoriesCache(std::shared_ptr<KeyedCache> cache) : DomainCache(std::move(cache), "categories") {
  }

  DomainKey Domain() const override {
    return DomainKey::kCategories;
  }

  std::size_t Invalidate(const std::optional<std::string>&) override {
    throw std::runtime_error("categories backend offline");
  }
};

// A tiers cache whose backend reports failure with a non-std exception.
class LegacyTiersCache final : public DomainCache {
 public:
  explicit LegacyTiersCache(std::shared_ptr<KeyedCache> cache) : DomainCache(std::move(cache), "customer_tiers") {
  }

  DomainKey Domain() const override {
    return DomainKey::kCustomerTiers;
  }

  std::size_t Invalidate(const std::optional<std::string>&) override {
    throw 42;
  }
};

struct Caches {
  FakeClock                        clock;
  std::shared_ptr<KeyedCache>      keyed      = std::make_shared<KeyedCache>(std::make_shared<MemoryCacheStore>(1024 * 1024), KeyedCacheOptions{}, clock.Fn());
  std::shared_ptr<ProductsCache>   products   = std::make_shared<ProductsCache>(keyed, "products", 600s);
  std::shared_ptr<CategoriesCache> categories = std::make_shared<CategoriesCache>(keyed, "categories", 1800s);
  std::shared_ptr<TiersCache>      tiers      = std::make_shared<TiersCache>(keyed, "customer_tiers", 900s);
  std::shared_ptr<PricingCache>    pricing    = std::make_shared<PricingCache>(keyed, "pricing", PricingCacheTtls{});

  std::string product_key = pricing->ProductPricingKey(std::string("p1"), 100.0, std::nullopt, "gold", 1);

  void RegisterAll(InvalidationCoordinator& coordinator) const {
    coordinator.Register(products);
    coordinator.Register(categories);
    coordinator.Register(tiers);
    coordinator.Register(pricing);
  }

  void Populate() const {
    products->SetProduct(ProductRecord{"p1", "Widget", 100.0, std::string("c1")});
    products->SetProduct(ProductRecord{"p2", "Gadget", 50.0, std::nullopt});
    categories->SetCategory(CategoryRecord{"c1", "Tools", std::nullopt});

    TierRecord gold;
    gold.id   = "t1";
    gold.code = "gold";
    gold.name = "Gold";
    tiers->SetTier(gold);
    tiers->SetTierByCode(gold);

    PricingResult result;
    result.base_price  = 100.0;
    result.final_price = 100.0;
    pricing->SetProductPricing(product_key, result);
    pricing->SetPriceListLines("l1", {});
  }
};

void TestSpecificScopeTouchesOnlyThePrimaryDomain() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  assert(coordinator.Invalidate(EntityType::kProduct, std::string("p1"), InvalidationScope::kSpecific) == 1);
  assert(!caches.products->GetProduct("p1").has_value());
  assert(caches.products->GetProduct("p2").has_value());
  assert(caches.pricing->GetProductPricing(caches.product_key).has_value());
}

void TestCrossDomainFlushesDependents() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  // product -> price lists
  const auto report = coordinator.InvalidateWithReport(EntityType::kProduct, std::string("p1"), InvalidationScope::kCrossDomain);
  assert(report.Complete());
  assert(report.keys_removed == 3);
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
  assert(!caches.pricing->GetPriceListLines("l1").has_value());
  assert(caches.products->GetProduct("p2").has_value());
  assert(caches.categories->GetCategory("c1").has_value());

  // tier -> price lists + products
  caches.Populate();
  coordinator.Invalidate(EntityType::kCustomerTier, std::string("t1"), InvalidationScope::kCrossDomain);
  assert(!caches.tiers->GetTier("t1").has_value());
  assert(!caches.tiers->GetTierByCode("gold").has_value());
  assert(!caches.products->GetProduct("p2").has_value());
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
  assert(caches.categories->GetCategory("c1").has_value());
}

void TestGlobalScopeFlushesEverything() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  coordinator.Invalidate(EntityType::kPriceListLine, std::nullopt, InvalidationScope::kGlobal);
  assert(!caches.products->GetProduct("p1").has_value());
  assert(!caches.categories->GetCategory("c1").has_value());
  assert(!caches.tiers->GetTier("t1").has_value());
  assert(!caches.pricing->GetPriceListLines("l1").has_value());
  assert(caches.keyed->Stats().total_keys == 0);
}

void TestRepeatedInvalidationIsHarmless() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  assert(coordinator.Invalidate(EntityType::kPriceList, std::string("l1"), InvalidationScope::kCrossDomain) > 0);
  assert(coordinator.Invalidate(EntityType::kPriceList, std::string("l1"), InvalidationScope::kCrossDomain) == 0);

  const auto stats = coordinator.Stats();
  assert(stats.calls == 2);
  assert(stats.partial_failures == 0);
}

void TestFailingHookDoesNotStopTheRest() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  std::vector<std::string> seen;
  coordinator.RegisterHook(DomainKey::kProducts, "boom", [](const InvalidationEvent&) -> std::size_t {
    throw std::runtime_error("search index offline");
  });
  coordinator.RegisterHook(DomainKey::kProducts, "recorder", [&seen](const InvalidationEvent& event) -> std::size_t {
    seen.push_back(event.entity_id.value_or("*"));
    return 7;
  });

  const auto report = coordinator.InvalidateWithReport(EntityType::kProduct, std::string("p1"), InvalidationScope::kCrossDomain);
  assert(!report.Complete());
  assert(report.failures.size() == 1);
  assert(report.failures[0].stage == "hook:boom");
  assert(report.failures[0].domain == DomainKey::kProducts);
  assert(seen == std::vector<std::string>{"p1"});
  // products:p1 + hook + two pricing keys
  assert(report.keys_removed == 1 + 7 + 2);
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
  assert(coordinator.Stats().partial_failures == 1);

  bool threw = false;
  try {
    coordinator.RegisterHook(DomainKey::kProducts, "empty", nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFailingDomainIsIsolated() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  // replaces the working categories cache
  coordinator.Register(std::make_shared<BrokenCategoriesCache>(caches.keyed));
  caches.Populate();

  const auto report = coordinator.InvalidateWithReport(EntityType::kCategory, std::string("c1"), InvalidationScope::kCrossDomain);
  assert(report.failures.size() == 1);
  assert(report.failures[0].stage == "primary");
  assert(report.failures[0].domain == DomainKey::kCategories);
  assert(!caches.products->GetProduct("p1").has_value());
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
}

void TestNonStandardThrowsAreRecorded() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  coordinator.Register(std::make_shared<LegacyTiersCache>(caches.keyed));
  caches.Populate();

  coordinator.RegisterHook(DomainKey::kCustomerTiers, "legacy", [](const InvalidationEvent&) -> std::size_t {
    throw std::string("ldap sync refused");
  });

  // returns normally; nothing escapes
  const auto report = coordinator.InvalidateWithReport(EntityType::kCustomerTier, std::string("t1"), InvalidationScope::kCrossDomain);

  assert(report.failures.size() == 2);
  assert(report.failures[0].stage == "primary");
  assert(report.failures[0].domain == DomainKey::kCustomerTiers);
  assert(report.failures[0].error == "non-standard exception");
  assert(report.failures[1].stage == "hook:legacy");
  assert(report.failures[1].error == "non-standard exception");

  // dependents still flushed
  assert(!caches.products->GetProduct("p1").has_value());
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
  assert(coordinator.Stats().partial_failures == 2);

  // the by-count entry point does not throw either
  assert(coordinator.Invalidate(EntityType::kCustomerTier, std::nullopt, InvalidationScope::kSpecific) == 0);
}

void TestUnregisteredDomainsAreSkipped() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  coordinator.Register(caches.pricing);
  caches.Populate();

  assert(!coordinator.IsRegistered(DomainKey::kCategories));
  coordinator.Invalidate(EntityType::kCategory, std::string("c1"), InvalidationScope::kCrossDomain);
  assert(!caches.pricing->GetProductPricing(caches.product_key).has_value());
  assert(caches.categories->GetCategory("c1").has_value());
  // categories (primary) + products (dependent)
  assert(coordinator.Stats().unregistered_skips == 2);

  // late registration takes effect on the next call
  coordinator.Register(caches.categories);
  coordinator.Invalidate(EntityType::kCategory, std::string("c1"), InvalidationScope::kSpecific);
  assert(!caches.categories->GetCategory("c1").has_value());

  bool threw = false;
  try {
    coordinator.Register(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestEntityTypeByName() {
  Caches                  caches;
  InvalidationCoordinator coordinator;
  caches.RegisterAll(coordinator);
  caches.Populate();

  assert(coordinator.Invalidate("price-list", std::nullopt, InvalidationScope::kSpecific) == 2);
  assert(!caches.pricing->GetPriceListLines("l1").has_value());

  assert(coordinator.Invalidate("widget", std::string("x"), InvalidationScope::kGlobal) == 0);
  assert(caches.products->GetProduct("p1").has_value());
  assert(coordinator.Stats().calls == 1);
}

void TestCustomGraph() {
  std::map<EntityType, std::vector<DomainKey>> edges;
  edges[EntityType::kProduct] = {DomainKey::kCategories};

  Caches                  caches;
  InvalidationCoordinator coordinator{DependencyGraph(std::move(edges))};
  caches.RegisterAll(coordinator);
  caches.Populate();

  assert(coordinator.Graph().Dependents(EntityType::kPriceList).empty());
  coordinator.Invalidate(EntityType::kProduct, std::string("p1"), InvalidationScope::kCrossDomain);
  assert(!caches.categories->GetCategory("c1").has_value());
  assert(caches.pricing->GetProductPricing(caches.product_key).has_value());
}

} // namespace

int main() {
  TestSpecificScopeTouchesOnlyThePrimaryDomain();
  TestCrossDomainFlushesDependents();
  TestGlobalScopeFlushesEverything();
  TestRepeatedInvalidationIsHarmless();
  TestFailingHookDoesNotStopTheRest();
  TestFailingDomainIsIsolated();
  TestNonStandardThrowsAreRecorded();
  TestUnregisteredDomainsAreSkipped();
  TestEntityTypeByName();
  TestCustomGraph();

  std::cout << "pricing_engine_unit_invalidation_coordinator: pass\n";
  return 0;
}
