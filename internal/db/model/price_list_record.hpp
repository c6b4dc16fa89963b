#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace pricing::db::model {

/*
  Persistent price list row.

  Priority 1 is the highest. valid_until absent means open-ended.
*/

struct PriceListRecord {
  std::string id;
  std::string name;
  std::string description;

  uint32_t priority = 1;
  bool     active   = true;

  util::TimePoint                valid_from{};
  std::optional<util::TimePoint> valid_until;
};

} // namespace pricing::db::model
