#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/pricing_types.hpp"

namespace pricing::db::model {

/*
  One discount rule, owned by a price list.

  product_id is set iff type == kProduct, category_id iff type == kCategory.
  Enforced on write (service::ValidateLine); readers assume it holds.
*/

struct PriceListLineRecord {
  std::string id;
  std::string price_list_id;

  pricing::model::LineType type = pricing::model::LineType::kAll;

  std::optional<std::string> product_id;
  std::optional<std::string> category_id;

  pricing::model::DiscountType discount_type = pricing::model::DiscountType::kPercentage;
  double                       amount        = 0.0;

  uint32_t                min_quantity = 1;
  std::optional<uint32_t> max_quantity;
};

} // namespace pricing::db::model
