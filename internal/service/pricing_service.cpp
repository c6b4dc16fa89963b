#include "pricing_service.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>

#include "internal/cache/products_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pricing/price_source.hpp"
#include "internal/pricing/pricing_resolver.hpp"

namespace pricing::service {

using observability::StringField;

PricingService::PricingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.resolver) throw std::invalid_argument("PricingService requires a pricing resolver");
  if (!ctx_.bulk_resolver) throw std::invalid_argument("PricingService requires a bulk pricing resolver");
  if (!ctx_.invalidation) throw std::invalid_argument("PricingService requires an invalidation coordinator");
  if (!ctx_.cache) throw std::invalid_argument("PricingService requires a keyed cache");
}

model::PricingResult PricingService::ResolvePrice(const engine::PricingInput& request) const {
  return ctx_.resolver->Resolve(request);
}

std::vector<model::PricingResult> PricingService::ResolveBulkPrices(const std::vector<engine::BulkPricingItem>& items,
                                                                    const std::optional<std::string>& tier, uint32_t quantity) const {
  return ctx_.bulk_resolver->Resolve(items, tier, quantity);
}

std::optional<model::PricingResult> PricingService::ResolveProductPrice(const std::string& product_id, const std::optional<std::string>& tier,
                                                                        uint32_t quantity) const {
  auto product = LookupProduct(product_id);
  if (!product) return std::nullopt;

  engine::PricingInput input;
  input.product_id    = product->id;
  input.base_price    = product->price;
  input.category_id   = product->category_id;
  input.customer_tier = tier.value_or("");
  input.quantity      = quantity;
  return ctx_.resolver->Resolve(std::move(input));
}

std::optional<db::model::ProductRecord> PricingService::LookupProduct(const std::string& product_id) const {
  std::optional<uint64_t> generation;
  if (ctx_.products) {
    if (auto cached = ctx_.products->GetProduct(product_id)) return cached;
    generation = ctx_.products->Generation();
  }
  if (!ctx_.price_source) return std::nullopt;

  try {
    auto product = ctx_.price_source->GetProduct(product_id);
    if (product && ctx_.products) ctx_.products->SetProduct(*product, generation);
    return product;
  } catch (const std::exception& e) {
    PRICING_LOG_WARN("product lookup failed", {StringField("product_id", product_id), StringField("error", e.what())});
    return std::nullopt;
  }
}

// ------------------------------------------------------------
// Invalidation / stats
// ------------------------------------------------------------

std::size_t PricingService::Invalidate(invalidation::EntityType entity_type, const std::optional<std::string>& entity_id,
                                       invalidation::InvalidationScope scope) const {
  return ctx_.invalidation->Invalidate(entity_type, entity_id, scope);
}

std::size_t PricingService::Invalidate(std::string_view entity_type, const std::optional<std::string>& entity_id,
                                       invalidation::InvalidationScope scope) const {
  return ctx_.invalidation->Invalidate(entity_type, entity_id, scope);
}

cache::CacheStats PricingService::CacheStats() const {
  return ctx_.cache->Stats();
}

invalidation::InvalidationStats PricingService::InvalidationStats() const {
  return ctx_.invalidation->Stats();
}

} // namespace pricing::service
