#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/cache/domain_cache.hpp"

namespace pricing::invalidation {

// Entities whose writes invalidate cached data.
enum class EntityType : uint8_t {
  kProduct       = 1,
  kCategory      = 2,
  kCustomerTier  = 3,
  kPriceList     = 4,
  kPriceListLine = 5,
};

inline constexpr std::array<EntityType, 5> kAllEntityTypes = {
    EntityType::kProduct, EntityType::kCategory, EntityType::kCustomerTier, EntityType::kPriceList, EntityType::kPriceListLine,
};

enum class InvalidationScope : uint8_t {
  kSpecific    = 1, // the entity's own domain only
  kCrossDomain = 2, // plus its declared dependents
  kGlobal      = 3, // plus every registered domain
};

constexpr std::string_view ToString(EntityType type) {
  switch (type) {
    case EntityType::kProduct:
      return "product";
    case EntityType::kCategory:
      return "category";
    case EntityType::kCustomerTier:
      return "customer_tier";
    case EntityType::kPriceList:
      return "price_list";
    case EntityType::kPriceListLine:
    default:
      return "price_list_line";
  }
}

constexpr std::string_view ToString(InvalidationScope scope) {
  switch (scope) {
    case InvalidationScope::kSpecific:
      return "specific";
    case InvalidationScope::kCrossDomain:
      return "cross_domain";
    case InvalidationScope::kGlobal:
    default:
      return "global";
  }
}

// Domain whose cache holds the entity's own views. Lines live in the
// price list domain (their cache key is the owning price_list_id).
constexpr cache::DomainKey PrimaryDomain(EntityType type) {
  switch (type) {
    case EntityType::kProduct:
      return cache::DomainKey::kProducts;
    case EntityType::kCategory:
      return cache::DomainKey::kCategories;
    case EntityType::kCustomerTier:
      return cache::DomainKey::kCustomerTiers;
    case EntityType::kPriceList:
    case EntityType::kPriceListLine:
    default:
      return cache::DomainKey::kPriceLists;
  }
}

// Accepts "price_list", "PriceList", "price-list", "pricelist" etc.
std::optional<EntityType>        ParseEntityType(std::string_view text);
std::optional<InvalidationScope> ParseInvalidationScope(std::string_view text);

} // namespace pricing::invalidation
