#include "internal/pricing/pricing_math.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace pricing::engine {

using db::model::PriceListLineRecord;
using db::model::PriceListRecord;
using pricing::model::DiscountType;
using pricing::model::LineType;

std::optional<SelectionPolicy> ParseSelectionPolicy(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  for (char c : text) {
    normalized.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (normalized == "best_discount") return SelectionPolicy::kBestDiscount;
  if (normalized == "priority_exclusive") return SelectionPolicy::kPriorityExclusive;
  return std::nullopt;
}

bool IsPriceListValid(const PriceListRecord& list, util::TimePoint now) {
  if (!list.active) return false;
  if (list.valid_from > now) return false;
  return !list.valid_until || *list.valid_until >= now;
}

bool LineApplies(const PriceListLineRecord& line, const PricingInput& input) {
  switch (line.type) {
    case LineType::kProduct:
      if (!input.product_id || line.product_id != input.product_id) return false;
      break;
    case LineType::kCategory:
      if (!input.category_id || line.category_id != input.category_id) return false;
      break;
    case LineType::kAll:
      break;
  }

  if (input.quantity < line.min_quantity) return false;
  return !line.max_quantity || input.quantity <= *line.max_quantity;
}

double ComputeDiscount(const PriceListLineRecord& line, double base_price) {
  if (base_price <= 0.0 || line.amount <= 0.0) return 0.0;

  double discount = 0.0;
  switch (line.discount_type) {
    case DiscountType::kPercentage:
      discount = base_price * line.amount / 100.0;
      break;
    case DiscountType::kFlat:
      discount = line.amount;
      break;
  }
  return std::clamp(discount, 0.0, base_price);
}

model::PricingResult IdentityPricing(const PricingInput& input) {
  model::PricingResult result;
  result.base_price    = input.base_price;
  result.final_price   = input.base_price;
  result.customer_tier = input.customer_tier;
  result.product_id    = input.product_id;
  return result;
}

model::PricingResult ScorePricing(const PricingInput& input, const PricingSnapshot& snapshot, SelectionPolicy policy) {
  auto result = IdentityPricing(input);

  double best = 0.0;
  for (const auto& priced : snapshot.lists) {
    bool list_applied = false;

    for (const auto& line : priced.lines) {
      if (!LineApplies(line, input)) continue;
      list_applied = true;

      const double discount = ComputeDiscount(line, input.base_price);
      if (discount > best) {
        best = discount;
        const auto& name = priced.list.name;
        if (std::find(result.applied_price_lists.begin(), result.applied_price_lists.end(), name) == result.applied_price_lists.end()) {
          result.applied_price_lists.push_back(name);
        }
      }
    }

    if (policy == SelectionPolicy::kPriorityExclusive && list_applied) break;
  }

  result.discount_applied    = best;
  result.final_price         = std::max(0.0, input.base_price - best);
  result.discount_percentage = input.base_price > 0.0 ? best / input.base_price * 100.0 : 0.0;
  return result;
}

bool SanitizeInput(PricingInput& input) {
  bool changed = false;
  if (!std::isfinite(input.base_price) || input.base_price < 0.0) {
    input.base_price = 0.0;
    changed          = true;
  }
  if (input.quantity == 0) {
    input.quantity = 1;
    changed        = true;
  }
  return changed;
}

} // namespace pricing::engine
