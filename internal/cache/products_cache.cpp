#include "internal/cache/products_cache.hpp"

namespace pricing::cache {

ProductsCache::ProductsCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl)
    : DomainCache(std::move(cache), std::move(prefix)), ttl_(ttl) {
}

std::optional<db::model::ProductRecord> ProductsCache::GetProduct(const std::string& id) const {
  auto message = GetMessage<pricing::v1::Product>(Cache().GenerateKey(Prefix(), id));
  if (!message) return std::nullopt;
  return FromProto(*message);
}

bool ProductsCache::SetProduct(const db::model::ProductRecord& product, std::optional<uint64_t> generation) const {
  return SetMessage(Cache().GenerateKey(Prefix(), product.id), ToProto(product), ttl_, generation);
}

std::size_t ProductsCache::Invalidate(const std::optional<std::string>& entity_id) {
  AdvanceGeneration();
  if (!entity_id) return Flush(Prefix());
  return Cache().Delete(Cache().GenerateKey(Prefix(), *entity_id)) ? 1 : 0;
}

} // namespace pricing::cache
