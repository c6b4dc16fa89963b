#pragma once

#include <vector>

#include "internal/cache/domain_cache.hpp"

namespace pricing::cache {

/*
  categories:id:<id> -> Category
  categories:all     -> CategorySet
*/
class CategoriesCache final : public DomainCache {
 public:
  CategoriesCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl);

  DomainKey Domain() const override {
    return DomainKey::kCategories;
  }

  std::optional<db::model::CategoryRecord> GetCategory(const std::string& id) const;
  bool                                     SetCategory(const db::model::CategoryRecord& category,
                                                       std::optional<uint64_t> generation = std::nullopt) const;

  std::optional<std::vector<db::model::CategoryRecord>> GetAllCategories() const;
  bool                                                  SetAllCategories(const std::vector<db::model::CategoryRecord>& categories,
                                                                         std::optional<uint64_t> generation = std::nullopt) const;

  // With an id: the category key and the "all" listing.
  std::size_t Invalidate(const std::optional<std::string>& entity_id) override;

 private:
  std::string IdKey(const std::string& id) const;
  std::string AllKey() const;

  std::chrono::seconds ttl_;
};

} // namespace pricing::cache
