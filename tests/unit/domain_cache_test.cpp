#include "internal/cache/domain_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
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
using pricing::cache::DomainKey;
using pricing::cache::KeyedCache;
using pricing::cache::KeyedCacheOptions;
using pricing::cache::MemoryCacheStore;
using pricing::cache::PricingCache;
using pricing::cache::PricingCacheTtls;
using pricing::cache::PricingScope;
using pricing::cache::ProductsCache;
using pricing::cache::TiersCache;
using pricing::db::model::CategoryRecord;
using pricing::db::model::ProductRecord;
using pricing::db::model::TierRecord;
using pricing::model::DiscountType;
using pricing::model::PricingResult;
using pricing::testing::FakeClock;
using pricing::testing::MakeAllLine;
using pricing::testing::MakePriceList;

std::shared_ptr<KeyedCache> MakeCache(const FakeClock& clock) {
  return std::make_shared<KeyedCache>(std::make_shared<MemoryCacheStore>(1024 * 1024), KeyedCacheOptions{}, clock.Fn());
}

PricingResult MakeResult(double base, double discount, const std::string& list_name) {
  PricingResult result;
  result.base_price          = base;
  result.discount_applied    = discount;
  result.final_price         = base - discount;
  result.discount_percentage = discount / base * 100.0;
  result.applied_price_lists = {list_name};
  result.customer_tier       = "gold";
  result.product_id          = "p1";
  return result;
}

void TestProductsCacheRoundTripAndInvalidate() {
  FakeClock     clock;
  auto          cache = MakeCache(clock);
  ProductsCache products(cache, "products", 600s);
  assert(products.Domain() == DomainKey::kProducts);

  ProductRecord product{"p1", "Widget", 25.5, std::string("c1")};
  assert(products.SetProduct(product));
  assert(products.SetProduct(ProductRecord{"p2", "Gadget", 10.0, std::nullopt}));
  assert(cache->Get("products:p1").has_value());

  auto cached = products.GetProduct("p1");
  assert(cached.has_value());
  assert(cached->name == "Widget");
  assert(cached->price == 25.5);
  assert(cached->category_id == std::optional<std::string>("c1"));
  assert(!products.GetProduct("p2")->category_id.has_value());

  assert(products.Invalidate(std::string("p1")) == 1);
  assert(!products.GetProduct("p1").has_value());
  assert(products.GetProduct("p2").has_value());

  assert(products.Invalidate(std::nullopt) == 1);
  assert(!products.GetProduct("p2").has_value());
}

void TestProductsCacheTtl() {
  FakeClock     clock;
  ProductsCache products(MakeCache(clock), "products", 30s);

  products.SetProduct(ProductRecord{"p1", "Widget", 1.0, std::nullopt});
  clock.Advance(29s);
  assert(products.GetProduct("p1").has_value());
  clock.Advance(1s);
  assert(!products.GetProduct("p1").has_value());
}

void TestUndecodableEntryIsDroppedAsMiss() {
  FakeClock     clock;
  auto          cache = MakeCache(clock);
  ProductsCache products(cache, "products", 600s);

  cache->Set("products:broken", std::string("\x0a\x05" "ab", 4));
  assert(!products.GetProduct("broken").has_value());
  assert(!cache->Get("products:broken").has_value());
}

void TestCategoriesInvalidateDropsEntryAndListing() {
  FakeClock       clock;
  CategoriesCache categories(MakeCache(clock), "categories", 1800s);

  categories.SetCategory(CategoryRecord{"c1", "Tools", std::nullopt});
  categories.SetCategory(CategoryRecord{"c2", "Drills", std::string("c1")});
  categories.SetAllCategories({CategoryRecord{"c1", "Tools", std::nullopt}, CategoryRecord{"c2", "Drills", std::string("c1")}});

  auto all = categories.GetAllCategories();
  assert(all.has_value() && all->size() == 2);
  assert((*all)[1].parent_id == std::optional<std::string>("c1"));

  assert(categories.Invalidate(std::string("c1")) == 2);
  assert(!categories.GetCategory("c1").has_value());
  assert(!categories.GetAllCategories().has_value());
  assert(categories.GetCategory("c2").has_value());

  // repeat: nothing left to remove
  assert(categories.Invalidate(std::string("c1")) == 0);
}

void TestTiersInvalidateDropsEveryCodeKey() {
  FakeClock  clock;
  TiersCache tiers(MakeCache(clock), "customer_tiers", 900s);

  TierRecord gold;
  gold.id             = "t-gold";
  gold.code           = "gold";
  gold.name           = "Gold";
  gold.level          = 3;
  gold.price_list_ids = {"vip10", "summer"};
  gold.requirements.min_lifetime_spend = 1000.0;

  TierRecord silver = gold;
  silver.id         = "t-silver";
  silver.code       = "silver";
  silver.level      = 2;

  tiers.SetTier(gold);
  tiers.SetTierByCode(gold);
  tiers.SetTier(silver);
  tiers.SetTierByCode(silver);
  tiers.SetAllTiers({silver, gold});

  auto by_code = tiers.GetTierByCode("gold");
  assert(by_code.has_value());
  assert(by_code->id == "t-gold");
  assert(by_code->price_list_ids == (std::vector<std::string>{"vip10", "summer"}));
  assert(by_code->requirements.min_lifetime_spend == 1000.0);

  // id key + both code keys + listing
  assert(tiers.Invalidate(std::string("t-gold")) == 4);
  assert(!tiers.GetTier("t-gold").has_value());
  assert(!tiers.GetTierByCode("silver").has_value());
  assert(!tiers.GetAllTiers().has_value());
  assert(tiers.GetTier("t-silver").has_value());
}

void TestPricingFamiliesAreIndependent() {
  FakeClock    clock;
  auto         cache = MakeCache(clock);
  PricingCache pricing(cache, "pricing", PricingCacheTtls{});
  assert(pricing.Domain() == DomainKey::kPriceLists);

  const auto product_key = pricing.ProductPricingKey(std::string("p1"), 100.0, std::nullopt, "gold", 1);
  assert(product_key == "pricing_product:p1:100::gold:1");
  const auto bulk_key = pricing.BulkPricingKey("gold", "abc");
  assert(bulk_key == "pricing_bulk:gold:abc");

  const auto now = clock.Now();
  pricing.SetProductPricing(product_key, MakeResult(100.0, 10.0, "VIP10"));
  pricing.SetBulkPricing(bulk_key, {MakeResult(100.0, 10.0, "VIP10"), MakeResult(50.0, 5.0, "VIP10")});
  pricing.SetPriceLists(true, {MakePriceList("l1", "VIP10", 1, now)});
  pricing.SetPriceListLines("l1", {MakeAllLine("ln1", "l1", DiscountType::kPercentage, 10.0)});
  pricing.SetPriceListLines("l2", {});

  auto result = pricing.GetProductPricing(product_key);
  assert(result.has_value());
  assert(result->final_price == 90.0);
  assert(result->applied_price_lists == std::vector<std::string>{"VIP10"});
  assert(result->product_id == std::optional<std::string>("p1"));
  assert(pricing.GetBulkPricing(bulk_key)->size() == 2);

  // an empty line set is a hit, not a miss
  auto empty_lines = pricing.GetPriceListLines("l2");
  assert(empty_lines.has_value() && empty_lines->empty());

  assert(pricing.InvalidateFamilies(PricingScope::kComputed) == 2);
  assert(!pricing.GetProductPricing(product_key).has_value());
  assert(pricing.GetPriceLists(true).has_value());
  assert(pricing.GetPriceListLines("l1").has_value());

  assert(pricing.InvalidateFamilies(PricingScope::kPriceListLines) == 2);
  assert(pricing.GetPriceLists(true).has_value());
}

void TestPricingInvalidateByListId() {
  FakeClock    clock;
  PricingCache pricing(MakeCache(clock), "pricing", PricingCacheTtls{});
  const auto   now = clock.Now();

  const auto key = pricing.ProductPricingKey(std::nullopt, 100.0, std::string("c1"), "gold", 2);
  pricing.SetProductPricing(key, MakeResult(100.0, 10.0, "VIP10"));
  pricing.SetPriceLists(true, {MakePriceList("l1", "VIP10", 1, now)});
  pricing.SetPriceLists(false, {MakePriceList("l1", "VIP10", 1, now)});
  pricing.SetPriceListLines("l1", {});
  pricing.SetPriceListLines("l2", {});

  // l1 lines + both listings + the computed entry; l2 lines survive
  assert(pricing.Invalidate(std::string("l1")) == 4);
  assert(!pricing.GetPriceListLines("l1").has_value());
  assert(pricing.GetPriceListLines("l2").has_value());
  assert(!pricing.GetPriceLists(true).has_value());
  assert(!pricing.GetProductPricing(key).has_value());

  assert(pricing.Invalidate(std::nullopt) == 1);
  assert(!pricing.GetPriceListLines("l2").has_value());
}

void TestWritesReadBeforeAnInvalidationAreDropped() {
  FakeClock     clock;
  auto          cache = MakeCache(clock);
  ProductsCache products(cache, "products", 600s);
  PricingCache  pricing(cache, "pricing", PricingCacheTtls{});

  const ProductRecord widget{"p1", "Widget", 100.0, std::nullopt};

  const auto loaded_at = products.Generation();
  products.Invalidate(std::string("p1"));
  assert(products.Generation() != loaded_at);

  assert(!products.SetProduct(widget, loaded_at));
  assert(!products.GetProduct("p1").has_value());

  assert(products.SetProduct(widget, products.Generation()));
  assert(products.GetProduct("p1").has_value());

  // each domain keeps its own generation; every family flush advances it
  const auto pricing_at = pricing.Generation();
  pricing.InvalidateFamilies(PricingScope::kComputed);
  assert(!pricing.SetPriceListLines("l1", {}, pricing_at));
  assert(!pricing.GetPriceListLines("l1").has_value());
  assert(pricing.SetPriceListLines("l1", {}, pricing.Generation()));

  // without a generation the write is unconditional
  products.Invalidate(std::nullopt);
  assert(products.SetProduct(widget));
  assert(products.GetProduct("p1").has_value());
}

} // namespace

int main() {
  TestProductsCacheRoundTripAndInvalidate();
  TestProductsCacheTtl();
  TestUndecodableEntryIsDroppedAsMiss();
  TestCategoriesInvalidateDropsEntryAndListing();
  TestTiersInvalidateDropsEveryCodeKey();
  TestPricingFamiliesAreIndependent();
  TestPricingInvalidateByListId();
  TestWritesReadBeforeAnInvalidationAreDropped();

  std::cout << "pricing_engine_unit_domain_cache: pass\n";
  return 0;
}
