#include "internal/cache/domain_cache.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace pricing::cache {

DomainCache::DomainCache(std::shared_ptr<KeyedCache> cache, std::string prefix) : cache_(std::move(cache)), prefix_(std::move(prefix)) {
  if (!cache_) throw std::invalid_argument("DomainCache requires a KeyedCache");
  if (prefix_.empty()) throw std::invalid_argument("DomainCache requires a key prefix");
}

std::size_t DomainCache::Flush(std::string_view prefix) const {
  std::string pattern(prefix);
  pattern += ":*";
  return cache_->DeletePattern(pattern);
}

bool DomainCache::SetMessage(const std::string& key, const google::protobuf::MessageLite& message, std::chrono::seconds ttl,
                             std::optional<uint64_t> generation) const {
  if (generation && *generation != Generation()) {
    PRICING_LOG_DEBUG("skipping cache write read before an invalidation", {observability::StringField("key", key)});
    return false;
  }
  if (!cache_->Set(key, Encode(message), ttl)) return false;

  // an invalidation that started between the check and the put may have
  // flushed before the put landed
  if (generation && *generation != Generation()) {
    cache_->Delete(key);
    return false;
  }
  return true;
}

void DomainCache::DropUndecodable(const std::string& key) const {
  PRICING_LOG_WARN("dropping undecodable cache entry", {observability::StringField("key", key)});
  cache_->Delete(key);
}

} // namespace pricing::cache
