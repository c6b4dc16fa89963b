#pragma once

#include "internal/cache/domain_cache.hpp"

namespace pricing::cache {

/*
  products:<id> -> Product
*/
class ProductsCache final : public DomainCache {
 public:
  ProductsCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl);

  DomainKey Domain() const override {
    return DomainKey::kProducts;
  }

  std::optional<db::model::ProductRecord> GetProduct(const std::string& id) const;
  bool                                    SetProduct(const db::model::ProductRecord& product,
                                                     std::optional<uint64_t> generation = std::nullopt) const;

  std::size_t Invalidate(const std::optional<std::string>& entity_id) override;

 private:
  std::chrono::seconds ttl_;
};

} // namespace pricing::cache
