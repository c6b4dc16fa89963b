#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/cache/keyed_cache.hpp"
#include "internal/invalidation/invalidation_coordinator.hpp"
#include "internal/model/pricing_result.hpp"
#include "internal/pricing/bulk_pricing_resolver.hpp"
#include "internal/pricing/pricing_math.hpp"
#include "service_context.hpp"

namespace pricing::service {

/*
  Engine operations for route-layer callers.

  Pricing calls never throw for data or cache problems; the worst case
  is the unmodified base price. Invalidate never throws.
*/
class PricingService {
 public:
  explicit PricingService(ServiceContext ctx);

  model::PricingResult ResolvePrice(const engine::PricingInput& request) const;

  std::vector<model::PricingResult> ResolveBulkPrices(const std::vector<engine::BulkPricingItem>& items,
                                                      const std::optional<std::string>& tier, uint32_t quantity = 1) const;

  // Looks the product up (products cache, then the price source) and
  // prices it. nullopt when the product does not exist or cannot be read.
  std::optional<model::PricingResult> ResolveProductPrice(const std::string& product_id, const std::optional<std::string>& tier,
                                                          uint32_t quantity = 1) const;

  std::size_t Invalidate(invalidation::EntityType entity_type, const std::optional<std::string>& entity_id,
                         invalidation::InvalidationScope scope) const;

  // Unknown entity type names log a warning and return 0.
  std::size_t Invalidate(std::string_view entity_type, const std::optional<std::string>& entity_id,
                         invalidation::InvalidationScope scope) const;

  cache::CacheStats CacheStats() const;

  invalidation::InvalidationStats InvalidationStats() const;

 private:
  std::optional<db::model::ProductRecord> LookupProduct(const std::string& product_id) const;

  ServiceContext ctx_;
};

} // namespace pricing::service
