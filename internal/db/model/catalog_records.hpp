#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pricing::db::model {

struct ProductRecord {
  std::string                id;
  std::string                name;
  double                     price = 0.0;
  std::optional<std::string> category_id;
};

struct CategoryRecord {
  std::string                id;
  std::string                name;
  std::optional<std::string> parent_id;
};

struct TierRequirements {
  uint32_t min_order_count    = 0;
  double   min_lifetime_spend = 0.0;
  uint32_t min_monthly_orders = 0;
};

/*
  Customer tier. price_list_ids references price lists (no ownership).
*/
struct TierRecord {
  std::string              id;
  std::string              code;
  std::string              name;
  int32_t                  level = 0;
  TierRequirements         requirements;
  std::vector<std::string> price_list_ids;
  bool                     active = true;
};

} // namespace pricing::db::model
