#pragma once

#include "internal/db/model/catalog_records.hpp"
#include "internal/db/model/price_list_line_record.hpp"
#include "internal/db/model/price_list_record.hpp"

namespace pricing::service {

/*
  Write-time validation. Throws util::ValidationError with a message
  naming the offending field. Anything that passes is safe for the
  resolvers, which do not re-check line shape.
*/

void ValidatePriceList(const db::model::PriceListRecord& list);

// type / product_id / category_id consistency, amount range, quantity bounds.
void ValidatePriceListLine(const db::model::PriceListLineRecord& line);

void ValidateProduct(const db::model::ProductRecord& product);

void ValidateCategory(const db::model::CategoryRecord& category);

void ValidateTier(const db::model::TierRecord& tier);

} // namespace pricing::service
