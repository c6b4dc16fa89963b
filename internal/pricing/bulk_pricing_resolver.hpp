#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/pricing/pricing_resolver.hpp"

namespace pricing::engine {

struct BulkPricingItem {
  std::string                id;
  double                     price = 0.0;
  std::optional<std::string> category_id;

  // Overrides the batch quantity for this item.
  std::optional<uint32_t> quantity;
};

/*
  BulkPricingResolver

  Same per-item numbers as PricingResolver::Resolve, with the shared
  work done once per batch: one snapshot (valid lists, each list's
  lines fetched once), then a pure scan per item.

  The batch is cached as a whole under <p>_bulk:<tier>:<hash>; the hash
  covers every item's id, price, category and effective quantity in
  input order. A hit skips all per-item work.

  Empty batch -> empty result. Absent tier -> identity per item, cache
  untouched. Items without an id or with a malformed price price at
  identity. Never throws.
*/
class BulkPricingResolver {
 public:
  BulkPricingResolver(std::shared_ptr<SnapshotLoader> loader, std::shared_ptr<cache::PricingCache> cache, ResolverOptions options,
                      util::NowFn now = util::Now);

  std::vector<model::PricingResult> Resolve(const std::vector<BulkPricingItem>& items, const std::optional<std::string>& tier,
                                            uint32_t quantity = 1) const;

  static std::string BatchHash(const std::vector<BulkPricingItem>& items, uint32_t quantity);

 private:
  static PricingInput ToInput(const BulkPricingItem& item, const std::string& tier, uint32_t quantity);

  std::shared_ptr<SnapshotLoader>      loader_;
  std::shared_ptr<cache::PricingCache> cache_;
  ResolverOptions                      options_;
  util::NowFn                          now_;
};

} // namespace pricing::engine
