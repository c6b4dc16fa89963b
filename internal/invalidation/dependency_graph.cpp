#include "internal/invalidation/dependency_graph.hpp"

namespace pricing::invalidation {

using cache::DomainKey;

DependencyGraph DependencyGraph::Default() {
  return DependencyGraph({
      {EntityType::kCustomerTier, {DomainKey::kPriceLists, DomainKey::kProducts}},
      {EntityType::kCategory, {DomainKey::kPriceLists, DomainKey::kProducts}},
      {EntityType::kProduct, {DomainKey::kPriceLists}},
      {EntityType::kPriceList, {DomainKey::kPriceLists}},
      {EntityType::kPriceListLine, {DomainKey::kPriceLists}},
  });
}

DependencyGraph::DependencyGraph(std::map<EntityType, std::vector<cache::DomainKey>> edges) : edges_(std::move(edges)) {
}

const std::vector<cache::DomainKey>& DependencyGraph::Dependents(EntityType type) const {
  static const std::vector<cache::DomainKey> kNone;
  auto                                       it = edges_.find(type);
  return it == edges_.end() ? kNone : it->second;
}

} // namespace pricing::invalidation
