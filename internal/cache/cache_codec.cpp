#include "internal/cache/cache_codec.hpp"

namespace pricing::cache {

namespace {

pricing::v1::LineType ToProto(pricing::model::LineType type) {
  switch (type) {
    case pricing::model::LineType::kProduct:
      return pricing::v1::LINE_TYPE_PRODUCT;
    case pricing::model::LineType::kCategory:
      return pricing::v1::LINE_TYPE_CATEGORY;
    case pricing::model::LineType::kAll:
    default:
      return pricing::v1::LINE_TYPE_ALL;
  }
}

pricing::model::LineType FromProto(pricing::v1::LineType type) {
  switch (type) {
    case pricing::v1::LINE_TYPE_PRODUCT:
      return pricing::model::LineType::kProduct;
    case pricing::v1::LINE_TYPE_CATEGORY:
      return pricing::model::LineType::kCategory;
    default:
      return pricing::model::LineType::kAll;
  }
}

pricing::v1::DiscountType ToProto(pricing::model::DiscountType type) {
  return type == pricing::model::DiscountType::kFlat ? pricing::v1::DISCOUNT_TYPE_FLAT : pricing::v1::DISCOUNT_TYPE_PERCENTAGE;
}

pricing::model::DiscountType FromProto(pricing::v1::DiscountType type) {
  return type == pricing::v1::DISCOUNT_TYPE_FLAT ? pricing::model::DiscountType::kFlat : pricing::model::DiscountType::kPercentage;
}

} // namespace

// ------------------------------------------------------------
// Price lists
// ------------------------------------------------------------

pricing::v1::PriceList ToProto(const db::model::PriceListRecord& record) {
  pricing::v1::PriceList message;
  message.set_id(record.id);
  message.set_name(record.name);
  message.set_description(record.description);
  message.set_priority(record.priority);
  message.set_active(record.active);
  message.set_valid_from_ms(util::ToUnixMillis(record.valid_from));
  if (record.valid_until) message.set_valid_until_ms(util::ToUnixMillis(*record.valid_until));
  return message;
}

db::model::PriceListRecord FromProto(const pricing::v1::PriceList& message) {
  db::model::PriceListRecord record;
  record.id          = message.id();
  record.name        = message.name();
  record.description = message.description();
  record.priority    = message.priority();
  record.active      = message.active();
  record.valid_from  = util::FromUnixMillis(message.valid_from_ms());
  if (message.has_valid_until_ms()) record.valid_until = util::FromUnixMillis(message.valid_until_ms());
  return record;
}

pricing::v1::PriceListLine ToProto(const db::model::PriceListLineRecord& record) {
  pricing::v1::PriceListLine message;
  message.set_id(record.id);
  message.set_price_list_id(record.price_list_id);
  message.set_type(ToProto(record.type));
  if (record.product_id) message.set_product_id(*record.product_id);
  if (record.category_id) message.set_category_id(*record.category_id);
  message.set_discount_type(ToProto(record.discount_type));
  message.set_amount(record.amount);
  message.set_min_quantity(record.min_quantity);
  if (record.max_quantity) message.set_max_quantity(*record.max_quantity);
  return message;
}

db::model::PriceListLineRecord FromProto(const pricing::v1::PriceListLine& message) {
  db::model::PriceListLineRecord record;
  record.id            = message.id();
  record.price_list_id = message.price_list_id();
  record.type          = FromProto(message.type());
  if (message.has_product_id()) record.product_id = message.product_id();
  if (message.has_category_id()) record.category_id = message.category_id();
  record.discount_type = FromProto(message.discount_type());
  record.amount        = message.amount();
  record.min_quantity  = message.min_quantity();
  if (message.has_max_quantity()) record.max_quantity = message.max_quantity();
  return record;
}

// ------------------------------------------------------------
// Catalog
// ------------------------------------------------------------

pricing::v1::Product ToProto(const db::model::ProductRecord& record) {
  pricing::v1::Product message;
  message.set_id(record.id);
  message.set_name(record.name);
  message.set_price(record.price);
  if (record.category_id) message.set_category_id(*record.category_id);
  return message;
}

db::model::ProductRecord FromProto(const pricing::v1::Product& message) {
  db::model::ProductRecord record;
  record.id    = message.id();
  record.name  = message.name();
  record.price = message.price();
  if (message.has_category_id()) record.category_id = message.category_id();
  return record;
}

pricing::v1::Category ToProto(const db::model::CategoryRecord& record) {
  pricing::v1::Category message;
  message.set_id(record.id);
  message.set_name(record.name);
  if (record.parent_id) message.set_parent_id(*record.parent_id);
  return message;
}

db::model::CategoryRecord FromProto(const pricing::v1::Category& message) {
  db::model::CategoryRecord record;
  record.id   = message.id();
  record.name = message.name();
  if (message.has_parent_id()) record.parent_id = message.parent_id();
  return record;
}

pricing::v1::CustomerTier ToProto(const db::model::TierRecord& record) {
  pricing::v1::CustomerTier message;
  message.set_id(record.id);
  message.set_code(record.code);
  message.set_name(record.name);
  message.set_level(record.level);
  auto* requirements = message.mutable_requirements();
  requirements->set_min_order_count(record.requirements.min_order_count);
  requirements->set_min_lifetime_spend(record.requirements.min_lifetime_spend);
  requirements->set_min_monthly_orders(record.requirements.min_monthly_orders);
  for (const auto& id : record.price_list_ids) {
    message.add_price_list_ids(id);
  }
  message.set_active(record.active);
  return message;
}

db::model::TierRecord FromProto(const pricing::v1::CustomerTier& message) {
  db::model::TierRecord record;
  record.id                              = message.id();
  record.code                            = message.code();
  record.name                            = message.name();
  record.level                           = message.level();
  record.requirements.min_order_count    = message.requirements().min_order_count();
  record.requirements.min_lifetime_spend = message.requirements().min_lifetime_spend();
  record.requirements.min_monthly_orders = message.requirements().min_monthly_orders();
  record.price_list_ids.assign(message.price_list_ids().begin(), message.price_list_ids().end());
  record.active = message.active();
  return record;
}

// ------------------------------------------------------------
// Pricing results
// ------------------------------------------------------------

pricing::v1::PricingResult ToProto(const model::PricingResult& result) {
  pricing::v1::PricingResult message;
  message.set_base_price(result.base_price);
  message.set_final_price(result.final_price);
  message.set_discount_applied(result.discount_applied);
  message.set_discount_percentage(result.discount_percentage);
  for (const auto& name : result.applied_price_lists) {
    message.add_applied_price_lists(name);
  }
  message.set_customer_tier(result.customer_tier);
  if (result.product_id) message.set_product_id(*result.product_id);
  return message;
}

model::PricingResult FromProto(const pricing::v1::PricingResult& message) {
  model::PricingResult result;
  result.base_price          = message.base_price();
  result.final_price         = message.final_price();
  result.discount_applied    = message.discount_applied();
  result.discount_percentage = message.discount_percentage();
  result.applied_price_lists.assign(message.applied_price_lists().begin(), message.applied_price_lists().end());
  result.customer_tier = message.customer_tier();
  if (message.has_product_id()) result.product_id = message.product_id();
  return result;
}

std::string Encode(const google::protobuf::MessageLite& message) {
  std::string bytes;
  message.SerializeToString(&bytes);
  return bytes;
}

} // namespace pricing::cache
