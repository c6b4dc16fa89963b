#pragma once

#include <vector>

#include "internal/cache/domain_cache.hpp"

namespace pricing::cache {

/*
  customer_tiers:id:<id>     -> CustomerTier
  customer_tiers:code:<code> -> CustomerTier
  customer_tiers:all         -> CustomerTierSet
*/
class TiersCache final : public DomainCache {
 public:
  TiersCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl);

  DomainKey Domain() const override {
    return DomainKey::kCustomerTiers;
  }

  std::optional<db::model::TierRecord> GetTier(const std::string& id) const;
  bool                                 SetTier(const db::model::TierRecord& tier, std::optional<uint64_t> generation = std::nullopt) const;

  std::optional<db::model::TierRecord> GetTierByCode(const std::string& code) const;
  bool                                 SetTierByCode(const db::model::TierRecord& tier,
                                                     std::optional<uint64_t> generation = std::nullopt) const;

  std::optional<std::vector<db::model::TierRecord>> GetAllTiers() const;
  bool                                              SetAllTiers(const std::vector<db::model::TierRecord>& tiers,
                                                                std::optional<uint64_t> generation = std::nullopt) const;

  // With an id: the id key, every code key (a code may have moved) and
  // the "all" listing.
  std::size_t Invalidate(const std::optional<std::string>& entity_id) override;

 private:
  std::string IdKey(const std::string& id) const;
  std::string CodeKey(const std::string& code) const;
  std::string AllKey() const;

  std::chrono::seconds ttl_;
};

} // namespace pricing::cache
