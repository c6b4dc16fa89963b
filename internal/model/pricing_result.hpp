#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pricing::model {

/*
  Derived price for one product. Never persisted; cached.

  final_price == base_price - discount_applied
  0 <= discount_applied <= base_price
*/
struct PricingResult {
  double                     base_price          = 0.0;
  double                     final_price         = 0.0;
  double                     discount_applied    = 0.0;
  double                     discount_percentage = 0.0;
  std::vector<std::string>   applied_price_lists;
  std::string                customer_tier;
  std::optional<std::string> product_id;
};

} // namespace pricing::model
