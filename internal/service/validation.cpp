#include "internal/service/validation.hpp"

#include <cmath>
#include <set>
#include <string>

#include "internal/util/errors.hpp"

namespace pricing::service {

using pricing::model::DiscountType;
using pricing::model::LineType;

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) throw util::ValidationError(message);
}

void RequireId(const std::string& id, const char* entity) {
  Require(!id.empty(), std::string(entity) + " id is required");
}

} // namespace

void ValidatePriceList(const db::model::PriceListRecord& list) {
  RequireId(list.id, "price list");
  Require(!list.name.empty(), "price list name is required");
  Require(list.priority >= 1, "priority must be >= 1 (1 is the highest)");
  if (list.valid_until) {
    Require(list.valid_from <= *list.valid_until, "valid_from must not be after valid_until");
  }
}

void ValidatePriceListLine(const db::model::PriceListLineRecord& line) {
  RequireId(line.id, "price list line");
  Require(!line.price_list_id.empty(), "price_list_id is required");

  switch (line.type) {
    case LineType::kProduct:
      Require(line.product_id && !line.product_id->empty(), "product_id is required when type is 'product'");
      Require(!line.category_id, "category_id must be null when type is 'product'");
      break;
    case LineType::kCategory:
      Require(line.category_id && !line.category_id->empty(), "category_id is required when type is 'category'");
      Require(!line.product_id, "product_id must be null when type is 'category'");
      break;
    case LineType::kAll:
      Require(!line.product_id, "product_id must be null when type is 'all'");
      Require(!line.category_id, "category_id must be null when type is 'all'");
      break;
    default:
      throw util::ValidationError("type must be one of 'product', 'category', 'all'");
  }

  Require(line.discount_type == DiscountType::kPercentage || line.discount_type == DiscountType::kFlat,
          "discount_type must be one of 'percentage', 'flat'");
  Require(std::isfinite(line.amount) && line.amount >= 0.0, "amount must be >= 0");
  if (line.discount_type == DiscountType::kPercentage) {
    Require(line.amount <= 100.0, "amount must be <= 100 when discount_type is 'percentage'");
  }

  Require(line.min_quantity >= 1, "min_quantity must be >= 1");
  if (line.max_quantity) {
    Require(*line.max_quantity >= line.min_quantity, "max_quantity must be >= min_quantity");
  }
}

void ValidateProduct(const db::model::ProductRecord& product) {
  RequireId(product.id, "product");
  Require(!product.name.empty(), "product name is required");
  Require(std::isfinite(product.price) && product.price >= 0.0, "price must be >= 0");
  if (product.category_id) {
    Require(!product.category_id->empty(), "category_id must be null or non-empty");
  }
}

void ValidateCategory(const db::model::CategoryRecord& category) {
  RequireId(category.id, "category");
  Require(!category.name.empty(), "category name is required");
  if (category.parent_id) {
    Require(*category.parent_id != category.id, "a category cannot be its own parent");
  }
}

void ValidateTier(const db::model::TierRecord& tier) {
  RequireId(tier.id, "customer tier");
  Require(!tier.code.empty(), "tier code is required");
  Require(tier.level >= 0, "level must be >= 0");
  Require(std::isfinite(tier.requirements.min_lifetime_spend) && tier.requirements.min_lifetime_spend >= 0.0,
          "requirements.min_lifetime_spend must be >= 0");
  std::set<std::string> seen;
  for (const auto& price_list_id : tier.price_list_ids) {
    Require(!price_list_id.empty(), "price_list_ids must not contain empty ids");
    Require(seen.insert(price_list_id).second, "price_list_ids must not repeat " + price_list_id);
  }
}

} // namespace pricing::service
