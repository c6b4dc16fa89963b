#include "internal/cache/categories_cache.hpp"

namespace pricing::cache {

CategoriesCache::CategoriesCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl)
    : DomainCache(std::move(cache), std::move(prefix)), ttl_(ttl) {
}

std::string CategoriesCache::IdKey(const std::string& id) const {
  return Cache().GenerateKey(Prefix(), "id", id);
}

std::string CategoriesCache::AllKey() const {
  return Cache().GenerateKey(Prefix(), "all");
}

std::optional<db::model::CategoryRecord> CategoriesCache::GetCategory(const std::string& id) const {
  auto message = GetMessage<pricing::v1::Category>(IdKey(id));
  if (!message) return std::nullopt;
  return FromProto(*message);
}

bool CategoriesCache::SetCategory(const db::model::CategoryRecord& category, std::optional<uint64_t> generation) const {
  return SetMessage(IdKey(category.id), ToProto(category), ttl_, generation);
}

std::optional<std::vector<db::model::CategoryRecord>> CategoriesCache::GetAllCategories() const {
  auto message = GetMessage<pricing::v1::CategorySet>(AllKey());
  if (!message) return std::nullopt;

  std::vector<db::model::CategoryRecord> categories;
  categories.reserve(message->categories_size());
  for (const auto& category : message->categories()) {
    categories.push_back(FromProto(category));
  }
  return categories;
}

bool CategoriesCache::SetAllCategories(const std::vector<db::model::CategoryRecord>& categories, std::optional<uint64_t> generation) const {
  pricing::v1::CategorySet message;
  for (const auto& category : categories) {
    *message.add_categories() = ToProto(category);
  }
  return SetMessage(AllKey(), message, ttl_, generation);
}

std::size_t CategoriesCache::Invalidate(const std::optional<std::string>& entity_id) {
  AdvanceGeneration();
  if (!entity_id) return Flush(Prefix());

  std::size_t removed = Cache().Delete(IdKey(*entity_id)) ? 1 : 0;
  removed += Cache().Delete(AllKey()) ? 1 : 0;
  return removed;
}

} // namespace pricing::cache
