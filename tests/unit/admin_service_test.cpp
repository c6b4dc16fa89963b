#include "internal/service/admin_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "test_fixtures.hpp"

namespace {

using namespace std::chrono_literals;

using pricing::db::model::CategoryRecord;
using pricing::db::model::PriceListLineRecord;
using pricing::db::model::ProductRecord;
using pricing::db::model::TierRecord;
using pricing::model::DiscountType;
using pricing::model::LineType;
using pricing::testing::EngineHarness;
using pricing::testing::MakeAllLine;
using pricing::testing::MakeInput;
using pricing::testing::MakePriceList;
using pricing::testing::MakeProductLine;
using pricing::util::AlreadyExists;
using pricing::util::NotFound;
using pricing::util::ValidationError;

// Runs fn, expects an Error whose what() equals message (when given).
template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn, const std::string& message = {}) {
  bool threw = false;
  try {
    fn();
  } catch (const Error& e) {
    threw = true;
    if (!message.empty() && message != e.what()) {
      std::cerr << "unexpected message: " << e.what() << "\n";
      assert(false);
    }
  }
  assert(threw);
}

void TestLineValidationMessages() {
  EngineHarness h;
  h.AddList("vip", "VIP10");

  auto product_line       = MakeAllLine("ln1", "vip", DiscountType::kPercentage, 10.0);
  product_line.type       = LineType::kProduct;
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(product_line); }, "product_id is required when type is 'product'");

  auto all_with_category        = MakeAllLine("ln1", "vip", DiscountType::kPercentage, 10.0);
  all_with_category.category_id = "c1";
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(all_with_category); }, "category_id must be null when type is 'all'");

  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kFlat, -1.0)); }, "amount must be >= 0");
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kPercentage, 100.5)); },
                                "amount must be <= 100 when discount_type is 'percentage'");
  ExpectThrows<ValidationError>(
      [&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kFlat, std::numeric_limits<double>::infinity())); },
      "amount must be >= 0");
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kFlat, 5.0, 0)); },
                                "min_quantity must be >= 1");
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kFlat, 5.0, 5, 4u)); },
                                "max_quantity must be >= min_quantity");

  // a flat amount above 100 is fine
  const auto created = h.admin->CreatePriceListLine(MakeAllLine("ln1", "vip", DiscountType::kFlat, 250.0, 5, 5u));
  assert(created.amount == 250.0);
  assert(h.admin->ListPriceListLines("vip").size() == 1);
}

void TestPriceListValidationMessages() {
  EngineHarness h;
  const auto    now = h.clock.Now();

  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceList(MakePriceList("a", "A", 0, now)); }, "priority must be >= 1 (1 is the highest)");
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceList(MakePriceList("a", "", 1, now)); }, "price list name is required");
  ExpectThrows<ValidationError>([&] { h.admin->CreatePriceList(MakePriceList("a", "A", 1, now, now - 1s)); },
                                "valid_from must not be after valid_until");

  // nothing was written
  assert(h.admin->ListPriceLists(false).empty());

  // an empty id is generated
  const auto created = h.admin->CreatePriceList(MakePriceList("", "AUTO", 1, now));
  assert(!created.id.empty());
  assert(h.admin->GetPriceList(created.id).has_value());

  ExpectThrows<AlreadyExists>([&] { h.admin->CreatePriceList(MakePriceList(created.id, "AGAIN", 1, now)); });
}

void TestMissingOwnersAreNotFound() {
  EngineHarness h;

  ExpectThrows<NotFound>([&] { h.admin->CreatePriceListLine(MakeAllLine("ln1", "nope", DiscountType::kFlat, 1.0)); },
                         "Price list with ID nope not found");
  ExpectThrows<NotFound>([&] { h.admin->ListPriceListLines("nope"); }, "Price list with ID nope not found");
  ExpectThrows<NotFound>([&] { h.admin->UpdatePriceListLine(MakeAllLine("ln404", "nope", DiscountType::kFlat, 1.0)); },
                         "Price list line with ID ln404 not found");
  ExpectThrows<NotFound>([&] { h.admin->DeletePriceListLine("ln404"); }, "Price list line with ID ln404 not found");
  ExpectThrows<NotFound>([&] { h.admin->DeletePriceList("nope"); });
  ExpectThrows<NotFound>([&] { h.admin->UpdateProduct(ProductRecord{"p404", "None", 1.0, std::nullopt}); });

  TierRecord tier;
  tier.id             = "t1";
  tier.code           = "gold";
  tier.name           = "Gold";
  tier.price_list_ids = {"nope"};
  ExpectThrows<NotFound>([&] { h.admin->CreateTier(tier); }, "Price list with ID nope not found");

  tier.price_list_ids = {"a", "a"};
  ExpectThrows<ValidationError>([&] { h.admin->CreateTier(tier); }, "price_list_ids must not repeat a");

  tier.code = "";
  ExpectThrows<ValidationError>([&] { h.admin->CreateTier(tier); }, "tier code is required");
}

void TestLineWritesRefreshListings() {
  EngineHarness h;
  h.AddList("a", "A", 1);
  h.AddList("b", "B", 2);

  h.admin->CreatePriceListLine(MakeAllLine("ln1", "a", DiscountType::kPercentage, 10.0));
  assert(h.admin->ListPriceListLines("a").size() == 1);
  assert(h.admin->ListPriceListLines("b").empty());

  // moving a line refreshes both owners
  auto moved          = MakeAllLine("ln1", "b", DiscountType::kPercentage, 10.0);
  h.admin->UpdatePriceListLine(moved);
  assert(h.admin->ListPriceListLines("a").empty());
  assert(h.admin->ListPriceListLines("b").size() == 1);

  h.admin->DeletePriceListLine("ln1");
  assert(h.admin->ListPriceListLines("b").empty());

  // list listings follow price list writes
  assert(h.admin->ListPriceLists(true).size() == 2);
  auto b   = *h.admin->GetPriceList("b");
  b.active = false;
  h.admin->UpdatePriceList(b);
  assert(h.admin->ListPriceLists(true).size() == 1);
  assert(h.admin->ListPriceLists(false).size() == 2);
}

void TestDeletePriceListCascades() {
  EngineHarness h;
  h.AddList("a", "A", 1);
  h.AddList("b", "B", 2);
  h.admin->CreatePriceListLine(MakeAllLine("ln1", "a", DiscountType::kPercentage, 10.0));
  h.admin->CreatePriceListLine(MakeProductLine("ln2", "a", "p1", DiscountType::kFlat, 2.0));

  TierRecord gold;
  gold.id             = "t-gold";
  gold.code           = "gold";
  gold.name           = "Gold";
  gold.level          = 2;
  gold.price_list_ids = {"a", "b"};
  h.admin->CreateTier(gold);

  // warm the tier caches
  assert(h.admin->GetTier("t-gold")->price_list_ids.size() == 2);
  assert(h.admin->GetTierByCode("gold")->price_list_ids.size() == 2);
  assert(h.admin->ListTiers().size() == 1);

  h.admin->DeletePriceList("a");

  assert(!h.admin->GetPriceList("a").has_value());
  ExpectThrows<NotFound>([&] { h.admin->ListPriceListLines("a"); });
  ExpectThrows<NotFound>([&] { h.admin->DeletePriceListLine("ln1"); });
  assert(h.admin->GetTier("t-gold")->price_list_ids == std::vector<std::string>{"b"});
  assert(h.admin->GetTierByCode("gold")->price_list_ids == std::vector<std::string>{"b"});
  assert(h.admin->ListTiers().front().price_list_ids == std::vector<std::string>{"b"});
}

void TestTierWritesInvalidateTierViews() {
  EngineHarness h;
  h.AddList("a", "A");

  TierRecord silver;
  silver.id    = "t-silver";
  silver.code  = "silver";
  silver.name  = "Silver";
  silver.level = 1;
  h.admin->CreateTier(silver);
  assert(h.admin->GetTierByCode("silver").has_value());

  silver.code           = "argent";
  silver.price_list_ids = {"a"};
  h.admin->UpdateTier(silver);
  assert(!h.admin->GetTierByCode("silver").has_value());
  assert(h.admin->GetTierByCode("argent")->price_list_ids == std::vector<std::string>{"a"});

  TierRecord clash = silver;
  clash.id         = "t-other";
  ExpectThrows<AlreadyExists>([&] { h.admin->CreateTier(clash); });

  h.admin->DeleteTier("t-silver");
  assert(!h.admin->GetTier("t-silver").has_value());
  assert(h.admin->ListTiers().empty());
}

void TestCatalogWritesInvalidate() {
  EngineHarness h;
  h.AddList("tools", "TOOLS10");
  h.admin->CreatePriceListLine(pricing::testing::MakeCategoryLine("ln1", "tools", "c1", DiscountType::kPercentage, 10.0));

  h.admin->CreateCategory(CategoryRecord{"c1", "Tools", std::nullopt});
  h.admin->CreateCategory(CategoryRecord{"c2", "Garden", std::nullopt});
  assert(h.admin->ListCategories().size() == 2);

  h.admin->UpdateCategory(CategoryRecord{"c2", "Outdoor", std::nullopt});
  assert(h.admin->GetCategory("c2")->name == "Outdoor");
  assert(h.admin->ListCategories()[1].name == "Outdoor");
  ExpectThrows<ValidationError>([&] { h.admin->UpdateCategory(CategoryRecord{"c2", "Loop", std::string("c2")}); },
                                "a category cannot be its own parent");

  h.admin->DeleteCategory("c2");
  assert(h.admin->ListCategories().size() == 1);
  assert(!h.admin->GetCategory("c2").has_value());

  // product price and category changes reach computed pricing
  h.admin->CreateProduct(ProductRecord{"p1", "Drill", 100.0, std::string("c1")});
  assert(h.pricing_front->ResolveProductPrice("p1", std::string("gold"))->final_price == 90.0);

  h.admin->UpdateProduct(ProductRecord{"p1", "Drill", 200.0, std::nullopt});
  const auto repriced = h.pricing_front->ResolveProductPrice("p1", std::string("gold"));
  assert(repriced->base_price == 200.0);
  assert(repriced->final_price == 200.0);

  ExpectThrows<ValidationError>([&] { h.admin->CreateProduct(ProductRecord{"p2", "Bad", -1.0, std::nullopt}); }, "price must be >= 0");

  h.admin->DeleteProduct("p1");
  assert(!h.admin->GetProduct("p1").has_value());
  assert(!h.pricing_front->ResolveProductPrice("p1", std::string("gold")).has_value());
}

} // namespace

int main() {
  TestLineValidationMessages();
  TestPriceListValidationMessages();
  TestMissingOwnersAreNotFound();
  TestLineWritesRefreshListings();
  TestDeletePriceListCascades();
  TestTierWritesInvalidateTierViews();
  TestCatalogWritesInvalidate();

  std::cout << "pricing_engine_unit_admin_service: pass\n";
  return 0;
}
