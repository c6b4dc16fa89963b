#include "internal/pricing/bulk_pricing_resolver.hpp"

#include <stdexcept>

#include "internal/cache/keyed_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/hash.hpp"

namespace pricing::engine {

using observability::IntField;
using observability::StringField;

BulkPricingResolver::BulkPricingResolver(std::shared_ptr<SnapshotLoader> loader, std::shared_ptr<cache::PricingCache> cache,
                                         ResolverOptions options, util::NowFn now)
    : loader_(std::move(loader)), cache_(std::move(cache)), options_(std::move(options)), now_(std::move(now)) {
  if (!loader_) throw std::invalid_argument("BulkPricingResolver requires a snapshot loader");
  if (!cache_) throw std::invalid_argument("BulkPricingResolver requires a pricing cache");
  if (!now_) now_ = util::Now;
}

PricingInput BulkPricingResolver::ToInput(const BulkPricingItem& item, const std::string& tier, uint32_t quantity) {
  PricingInput input;
  input.product_id    = item.id.empty() ? std::nullopt : std::optional<std::string>(item.id);
  input.base_price    = item.price;
  input.category_id   = item.category_id;
  input.customer_tier = tier;
  input.quantity      = item.quantity.value_or(quantity);
  SanitizeInput(input);
  return input;
}

std::string BulkPricingResolver::BatchHash(const std::vector<BulkPricingItem>& items, uint32_t quantity) {
  // id:price:category:qty per item, ';'-terminated, in input order
  std::string signature;
  for (const auto& item : items) {
    const auto input = ToInput(item, {}, quantity);
    cache::detail::AppendKeyPart(signature, input.product_id);
    signature.push_back(':');
    cache::detail::AppendKeyPart(signature, input.base_price);
    signature.push_back(':');
    cache::detail::AppendKeyPart(signature, input.category_id);
    signature.push_back(':');
    cache::detail::AppendKeyPart(signature, input.quantity);
    signature.push_back(';');
  }
  return util::ContentHash(signature);
}

std::vector<model::PricingResult> BulkPricingResolver::Resolve(const std::vector<BulkPricingItem>& items,
                                                               const std::optional<std::string>& tier, uint32_t quantity) const {
  std::vector<model::PricingResult> results;
  if (items.empty()) return results;

  results.reserve(items.size());
  if (!tier || tier->empty()) {
    for (const auto& item : items) results.push_back(IdentityPricing(ToInput(item, {}, quantity)));
    return results;
  }

  try {
    const auto key        = cache_->BulkPricingKey(*tier, BatchHash(items, quantity));
    const auto generation = cache_->Generation();
    if (auto cached = cache_->GetBulkPricing(key); cached && cached->size() == items.size()) return std::move(*cached);

    const auto snapshot = loader_->Load(now_());

    std::size_t degraded = 0;
    for (const auto& item : items) {
      const auto input = ToInput(item, *tier, quantity);
      if (!input.product_id || input.base_price != item.price) ++degraded;

      if (!input.product_id || snapshot.Empty()) {
        results.push_back(IdentityPricing(input));
      } else {
        results.push_back(ScorePricing(input, snapshot, options_.policy));
      }
    }
    if (degraded > 0) {
      PRICING_LOG_WARN("bulk items priced at identity or clamped", {IntField("items", static_cast<int64_t>(degraded))});
    }

    cache_->SetBulkPricing(key, results, generation);
    return results;
  } catch (const std::exception& e) {
    PRICING_LOG_WARN("bulk pricing failed; returning base prices", {StringField("tier", *tier), StringField("error", e.what())});
    results.clear();
    for (const auto& item : items) results.push_back(IdentityPricing(ToInput(item, *tier, quantity)));
    return results;
  }
}

} // namespace pricing::engine
