#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/pricing_cache.hpp"
#include "internal/pricing/price_source.hpp"
#include "internal/pricing/pricing_math.hpp"

namespace pricing::engine {

/*
  SnapshotLoader

  Builds a PricingSnapshot before any scoring happens:

    1. active price lists (cached under <p>_lists:active), filtered to
       those valid at `now`, ordered by priority
    2. lines for each valid list: cache hits first, then every miss is
       fetched at once (one std::async task per list) and joined

  Never throws. A failed list fetch yields an empty snapshot; a failed
  line fetch leaves that list without lines. Both are logged and are
  not written to the cache. Nothing fetched is cached if the pricing
  domain was invalidated after Load began.
*/
class SnapshotLoader {
 public:
  SnapshotLoader(std::shared_ptr<PriceSource> source, std::shared_ptr<cache::PricingCache> cache, bool sequential_line_fetch = false);

  PricingSnapshot Load(util::TimePoint now) const;

 private:
  // generation: PricingCache::Generation() taken when Load began
  std::vector<db::model::PriceListRecord> LoadActiveLists(util::TimePoint now, uint64_t generation) const;

  void LoadLines(std::vector<PricedList>& lists, uint64_t generation) const;

  std::shared_ptr<PriceSource>         source_;
  std::shared_ptr<cache::PricingCache> cache_;
  bool                                 sequential_line_fetch_;
};

} // namespace pricing::engine
