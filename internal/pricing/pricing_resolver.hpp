#pragma once

#include <memory>
#include <string>

#include "internal/cache/pricing_cache.hpp"
#include "internal/pricing/pricing_math.hpp"
#include "internal/pricing/snapshot_loader.hpp"
#include "internal/util/time.hpp"

namespace pricing::engine {

struct ResolverOptions {
  std::string     default_tier = "bronze";
  SelectionPolicy policy       = SelectionPolicy::kBestDiscount;
};

/*
  PricingResolver

  Resolve(input):
    1. empty tier -> default tier; malformed price / quantity clamped
    2. <p>_product:<product>:<base>:<category>:<tier>:<qty> hit -> return
    3. snapshot (valid lists + their lines), then pure scoring
    4. result cached under the same key, identity results included,
       unless the pricing domain was invalidated after step 2 began

  Never throws: data and cache problems degrade to identity pricing.
  Concurrent misses on one key recompute independently; the last
  write wins.
*/
class PricingResolver {
 public:
  PricingResolver(std::shared_ptr<SnapshotLoader> loader, std::shared_ptr<cache::PricingCache> cache, ResolverOptions options,
                  util::NowFn now = util::Now);

  model::PricingResult Resolve(PricingInput input) const;

  const ResolverOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<SnapshotLoader>      loader_;
  std::shared_ptr<cache::PricingCache> cache_;
  ResolverOptions                      options_;
  util::NowFn                          now_;
};

} // namespace pricing::engine
