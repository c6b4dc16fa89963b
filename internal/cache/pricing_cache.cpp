#include "internal/cache/pricing_cache.hpp"

namespace pricing::cache {

PricingCache::PricingCache(std::shared_ptr<KeyedCache> cache, std::string prefix, PricingCacheTtls ttls)
    : DomainCache(std::move(cache), std::move(prefix)), ttls_(ttls) {
  product_family_ = Prefix() + "_product";
  bulk_family_    = Prefix() + "_bulk";
  lists_family_   = Prefix() + "_lists";
  lines_family_   = Prefix() + "_lines";
}

// ------------------------------------------------------------
// Computed pricing
// ------------------------------------------------------------

std::string PricingCache::ProductPricingKey(const std::optional<std::string>& product_id, double base_price,
                                            const std::optional<std::string>& category_id, const std::string& tier, uint32_t quantity) const {
  return Cache().GenerateKey(product_family_, product_id, base_price, category_id, tier, quantity);
}

std::optional<model::PricingResult> PricingCache::GetProductPricing(const std::string& key) const {
  auto message = GetMessage<pricing::v1::PricingResult>(key);
  if (!message) return std::nullopt;
  return FromProto(*message);
}

bool PricingCache::SetProductPricing(const std::string& key, const model::PricingResult& result, std::optional<uint64_t> generation) const {
  return SetMessage(key, ToProto(result), ttls_.product_pricing, generation);
}

std::string PricingCache::BulkPricingKey(const std::string& tier, const std::string& batch_hash) const {
  return Cache().GenerateKey(bulk_family_, tier, batch_hash);
}

std::optional<std::vector<model::PricingResult>> PricingCache::GetBulkPricing(const std::string& key) const {
  auto message = GetMessage<pricing::v1::PricingResultSet>(key);
  if (!message) return std::nullopt;

  std::vector<model::PricingResult> results;
  results.reserve(message->results_size());
  for (const auto& result : message->results()) {
    results.push_back(FromProto(result));
  }
  return results;
}

bool PricingCache::SetBulkPricing(const std::string& key, const std::vector<model::PricingResult>& results,
                                  std::optional<uint64_t> generation) const {
  pricing::v1::PricingResultSet message;
  for (const auto& result : results) {
    *message.add_results() = ToProto(result);
  }
  return SetMessage(key, message, ttls_.bulk_pricing, generation);
}

// ------------------------------------------------------------
// Rule data
// ------------------------------------------------------------

std::optional<std::vector<db::model::PriceListRecord>> PricingCache::GetPriceLists(bool active_only) const {
  auto message = GetMessage<pricing::v1::PriceListSet>(Cache().GenerateKey(lists_family_, active_only ? "active" : "all"));
  if (!message) return std::nullopt;

  std::vector<db::model::PriceListRecord> lists;
  lists.reserve(message->price_lists_size());
  for (const auto& list : message->price_lists()) {
    lists.push_back(FromProto(list));
  }
  return lists;
}

bool PricingCache::SetPriceLists(bool active_only, const std::vector<db::model::PriceListRecord>& lists,
                                 std::optional<uint64_t> generation) const {
  pricing::v1::PriceListSet message;
  for (const auto& list : lists) {
    *message.add_price_lists() = ToProto(list);
  }
  return SetMessage(Cache().GenerateKey(lists_family_, active_only ? "active" : "all"), message, ttls_.price_lists, generation);
}

std::optional<std::vector<db::model::PriceListLineRecord>> PricingCache::GetPriceListLines(const std::string& price_list_id) const {
  auto message = GetMessage<pricing::v1::PriceListLineSet>(Cache().GenerateKey(lines_family_, price_list_id));
  if (!message) return std::nullopt;

  std::vector<db::model::PriceListLineRecord> lines;
  lines.reserve(message->lines_size());
  for (const auto& line : message->lines()) {
    lines.push_back(FromProto(line));
  }
  return lines;
}

bool PricingCache::SetPriceListLines(const std::string& price_list_id, const std::vector<db::model::PriceListLineRecord>& lines,
                                     std::optional<uint64_t> generation) const {
  pricing::v1::PriceListLineSet message;
  for (const auto& line : lines) {
    *message.add_lines() = ToProto(line);
  }
  return SetMessage(Cache().GenerateKey(lines_family_, price_list_id), message, ttls_.price_list_lines, generation);
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

std::size_t PricingCache::Invalidate(const std::optional<std::string>& price_list_id) {
  if (!price_list_id) return InvalidateFamilies(PricingScope::kAll);

  AdvanceGeneration();

  std::size_t removed = Cache().Delete(Cache().GenerateKey(lines_family_, *price_list_id)) ? 1 : 0;
  removed += InvalidateFamilies(PricingScope::kPriceLists);
  removed += InvalidateFamilies(PricingScope::kComputed);
  return removed;
}

std::size_t PricingCache::InvalidateFamilies(PricingScope scope) {
  AdvanceGeneration();
  switch (scope) {
    case PricingScope::kComputed:
      return Flush(product_family_) + Flush(bulk_family_);
    case PricingScope::kPriceLists:
      return Flush(lists_family_);
    case PricingScope::kPriceListLines:
      return Flush(lines_family_);
    case PricingScope::kAll:
    default:
      return Flush(product_family_) + Flush(bulk_family_) + Flush(lists_family_) + Flush(lines_family_);
  }
}

} // namespace pricing::cache
