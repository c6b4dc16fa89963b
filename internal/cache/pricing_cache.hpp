#pragma once

#include <cstdint>
#include <vector>

#include "internal/cache/domain_cache.hpp"

namespace pricing::cache {

struct PricingCacheTtls {
  std::chrono::seconds product_pricing{300};
  std::chrono::seconds bulk_pricing{300};
  std::chrono::seconds price_lists{600};
  std::chrono::seconds price_list_lines{600};
};

// Key families InvalidateFamilies can target.
enum class PricingScope : uint8_t {
  kAll,
  kComputed,        // <prefix>_product + <prefix>_bulk
  kPriceLists,      // <prefix>_lists
  kPriceListLines,  // <prefix>_lines
};

/*
  PricingCache

  Domain cache for everything derived from price lists. Four key
  families, each its own prefix so one can be flushed without the
  others:

    <p>_product:<product>:<base>:<category>:<tier>:<qty>  PricingResult
    <p>_bulk:<tier>:<batch hash>                           PricingResultSet
    <p>_lists:<active|all>                                 PriceListSet
    <p>_lines:<price_list_id>                              PriceListLineSet

  where <p> is the configured prefix ("pricing"). An absent product or
  category is an empty part.
*/
class PricingCache final : public DomainCache {
 public:
  PricingCache(std::shared_ptr<KeyedCache> cache, std::string prefix, PricingCacheTtls ttls);

  DomainKey Domain() const override {
    return DomainKey::kPriceLists;
  }

  // --------------------------------------------------------------
  // Computed pricing
  // --------------------------------------------------------------

  std::string ProductPricingKey(const std::optional<std::string>& product_id, double base_price, const std::optional<std::string>& category_id,
                                const std::string& tier, uint32_t quantity) const;

  std::optional<model::PricingResult> GetProductPricing(const std::string& key) const;
  bool                                SetProductPricing(const std::string& key, const model::PricingResult& result,
                                                        std::optional<uint64_t> generation = std::nullopt) const;

  std::string BulkPricingKey(const std::string& tier, const std::string& batch_hash) const;

  std::optional<std::vector<model::PricingResult>> GetBulkPricing(const std::string& key) const;
  bool SetBulkPricing(const std::string& key, const std::vector<model::PricingResult>& results,
                      std::optional<uint64_t> generation = std::nullopt) const;

  // --------------------------------------------------------------
  // Rule data
  // --------------------------------------------------------------

  std::optional<std::vector<db::model::PriceListRecord>> GetPriceLists(bool active_only) const;
  bool SetPriceLists(bool active_only, const std::vector<db::model::PriceListRecord>& lists,
                     std::optional<uint64_t> generation = std::nullopt) const;

  std::optional<std::vector<db::model::PriceListLineRecord>> GetPriceListLines(const std::string& price_list_id) const;
  bool SetPriceListLines(const std::string& price_list_id, const std::vector<db::model::PriceListLineRecord>& lines,
                         std::optional<uint64_t> generation = std::nullopt) const;

  // --------------------------------------------------------------
  // Invalidation
  // --------------------------------------------------------------

  // With a price list id: that list's lines, the listings, and all
  // computed pricing (any price may have changed). Without: all four
  // families.
  std::size_t Invalidate(const std::optional<std::string>& price_list_id) override;

  std::size_t InvalidateFamilies(PricingScope scope);

  const std::string& ProductFamily() const {
    return product_family_;
  }
  const std::string& BulkFamily() const {
    return bulk_family_;
  }
  const std::string& ListsFamily() const {
    return lists_family_;
  }
  const std::string& LinesFamily() const {
    return lines_family_;
  }

 private:
  PricingCacheTtls ttls_;

  std::string product_family_;
  std::string bulk_family_;
  std::string lists_family_;
  std::string lines_family_;
};

} // namespace pricing::cache
