#include "internal/pricing/pricing_resolver.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace pricing::engine {

using observability::DoubleField;
using observability::StringField;

PricingResolver::PricingResolver(std::shared_ptr<SnapshotLoader> loader, std::shared_ptr<cache::PricingCache> cache,
                                 ResolverOptions options, util::NowFn now)
    : loader_(std::move(loader)), cache_(std::move(cache)), options_(std::move(options)), now_(std::move(now)) {
  if (!loader_) throw std::invalid_argument("PricingResolver requires a snapshot loader");
  if (!cache_) throw std::invalid_argument("PricingResolver requires a pricing cache");
  if (!now_) now_ = util::Now;
}

model::PricingResult PricingResolver::Resolve(PricingInput input) const {
  if (input.customer_tier.empty()) input.customer_tier = options_.default_tier;

  const double requested_price = input.base_price;
  if (SanitizeInput(input)) {
    PRICING_LOG_WARN("malformed pricing input clamped",
                     {StringField("product_id", input.product_id.value_or("none")), DoubleField("base_price", requested_price)});
  }

  try {
    const auto generation = cache_->Generation();
    const auto key = cache_->ProductPricingKey(input.product_id, input.base_price, input.category_id, input.customer_tier, input.quantity);
    if (auto cached = cache_->GetProductPricing(key)) return std::move(*cached);

    const auto snapshot = loader_->Load(now_());
    auto       result   = snapshot.Empty() ? IdentityPricing(input) : ScorePricing(input, snapshot, options_.policy);

    cache_->SetProductPricing(key, result, generation);
    return result;
  } catch (const std::exception& e) {
    PRICING_LOG_WARN("pricing failed; returning base price",
                     {StringField("product_id", input.product_id.value_or("none")), StringField("error", e.what())});
    return IdentityPricing(input);
  }
}

} // namespace pricing::engine
