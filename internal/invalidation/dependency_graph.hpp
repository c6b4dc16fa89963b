#pragma once

#include <map>
#include <vector>

#include "internal/invalidation/entity_type.hpp"

namespace pricing::invalidation {

/*
  Which cache domains go stale when an entity type changes.

  One hop only: dependents are flushed, never expanded further, so an
  invalidation touches a bounded set of domains and cannot cycle.
*/
class DependencyGraph {
 public:
  // CustomerTier  -> PriceLists, Products
  // Category      -> PriceLists, Products
  // Product       -> PriceLists
  // PriceList     -> PriceLists
  // PriceListLine -> PriceLists
  static DependencyGraph Default();

  DependencyGraph() = default;
  explicit DependencyGraph(std::map<EntityType, std::vector<cache::DomainKey>> edges);

  // Empty for a type without edges.
  const std::vector<cache::DomainKey>& Dependents(EntityType type) const;

 private:
  std::map<EntityType, std::vector<cache::DomainKey>> edges_;
};

} // namespace pricing::invalidation
