#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/price_list_line_record.hpp"
#include "internal/db/model/price_list_record.hpp"
#include "internal/model/pricing_result.hpp"
#include "internal/util/time.hpp"

namespace pricing::engine {

// How a discount is chosen when several lines apply.
enum class SelectionPolicy : uint8_t {
  kBestDiscount      = 1, // largest single discount across all lists
  kPriorityExclusive = 2, // only the first list (priority order) with an applicable line
};

constexpr std::string_view ToString(SelectionPolicy policy) {
  switch (policy) {
    case SelectionPolicy::kPriorityExclusive:
      return "priority_exclusive";
    case SelectionPolicy::kBestDiscount:
    default:
      return "best_discount";
  }
}

std::optional<SelectionPolicy> ParseSelectionPolicy(std::string_view text);

// Resolver input for one product.
struct PricingInput {
  std::optional<std::string> product_id;
  double                     base_price = 0.0;
  std::optional<std::string> category_id;
  std::string                customer_tier;
  uint32_t                   quantity = 1;
};

// A valid price list together with its lines.
struct PricedList {
  db::model::PriceListRecord                  list;
  std::vector<db::model::PriceListLineRecord> lines;
};

/*
  Everything scoring needs, loaded up front. Lists are already filtered
  to valid ones and ordered by priority ascending.
*/
struct PricingSnapshot {
  std::vector<PricedList> lists;

  bool Empty() const {
    return lists.empty();
  }
};

// ------------------------------------------------------------
// Pure scoring. No I/O, no clock, no cache.
// ------------------------------------------------------------

// active, valid_from <= now, and valid_until absent or >= now.
bool IsPriceListValid(const db::model::PriceListRecord& list, util::TimePoint now);

// Structural match (product / category / all) plus quantity bounds.
bool LineApplies(const db::model::PriceListLineRecord& line, const PricingInput& input);

// PERCENTAGE: base * amount / 100. FLAT: min(amount, base). Never
// negative, never above base.
double ComputeDiscount(const db::model::PriceListLineRecord& line, double base_price);

model::PricingResult IdentityPricing(const PricingInput& input);

// Best single discount wins; on equal discounts the first one seen
// (list order, then line order) is kept. Discounts are never summed.
model::PricingResult ScorePricing(const PricingInput& input, const PricingSnapshot& snapshot,
                                  SelectionPolicy policy = SelectionPolicy::kBestDiscount);

// Clamps malformed input: a negative or non-finite base price becomes
// 0, a zero quantity becomes 1. Returns true when anything changed.
bool SanitizeInput(PricingInput& input);

} // namespace pricing::engine
