#include "internal/cache/keyed_cache.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace pricing::cache {

using observability::IntField;
using observability::StringField;

KeyedCache::KeyedCache(std::shared_ptr<CacheStore> store, KeyedCacheOptions options, util::NowFn now)
    : store_(std::move(store)), options_(options), now_(std::move(now)) {
  if (!store_) throw std::invalid_argument("KeyedCache requires a store");
  if (!now_) now_ = util::Now;
}

std::string KeyedCache::Bound(std::string_view prefix, std::string key) const {
  if (key.size() <= options_.max_key_length) return key;

  std::string bounded(prefix);
  bounded += ":hash:";
  bounded += util::ContentHash(key);
  return bounded;
}

void KeyedCache::RecordBackendError(std::string_view op, const std::string& key, const std::exception& e) {
  backend_errors_.fetch_add(1, std::memory_order_relaxed);
  PRICING_LOG_WARN("cache backend unavailable; degrading", {StringField("op", op), StringField("key", key), StringField("error", e.what())});
}

// ------------------------------------------------------------
// Point operations
// ------------------------------------------------------------

std::optional<std::string> KeyedCache::Get(const std::string& key) {
  LookupResult found;
  try {
    found = store_->Get(key, now_());
  } catch (const util::CacheBackendError& e) {
    RecordBackendError("get", key, e);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  if (found.expired) expired_.fetch_add(1, std::memory_order_relaxed);

  if (!found.value) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }
  hits_.fetch_add(1, std::memory_order_relaxed);
  return std::move(found.value);
}

bool KeyedCache::Set(const std::string& key, std::string value, std::chrono::seconds ttl) {
  if (ttl.count() <= 0) ttl = options_.default_ttl;

  bool stored = false;
  try {
    stored = store_->Put(key, std::move(value), now_() + ttl);
  } catch (const util::CacheBackendError& e) {
    RecordBackendError("set", key, e);
    return false;
  }

  if (!stored) {
    PRICING_LOG_WARN("cache entry rejected by store", {StringField("key", key)});
    return false;
  }
  sets_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool KeyedCache::Delete(const std::string& key) {
  try {
    if (!store_->Erase(key)) return false;
  } catch (const util::CacheBackendError& e) {
    RecordBackendError("delete", key, e);
    return false;
  }
  deletes_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::size_t KeyedCache::DeletePattern(const std::string& pattern) {
  if (pattern.empty() || pattern.back() != '*') {
    return Delete(pattern) ? 1 : 0;
  }

  std::size_t removed = 0;
  try {
    removed = store_->ErasePrefix(pattern.substr(0, pattern.size() - 1));
  } catch (const util::CacheBackendError& e) {
    RecordBackendError("delete_pattern", pattern, e);
    return 0;
  }
  deletes_.fetch_add(removed, std::memory_order_relaxed);
  return removed;
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

std::size_t KeyedCache::Sweep() {
  std::size_t removed = 0;
  try {
    removed = store_->Sweep(now_());
  } catch (const util::CacheBackendError& e) {
    RecordBackendError("sweep", "*", e);
    return 0;
  }
  swept_.fetch_add(removed, std::memory_order_relaxed);
  if (removed > 0) {
    PRICING_LOG_INFO("cache sweep reclaimed expired entries", {IntField("removed", static_cast<int64_t>(removed))});
  }
  return removed;
}

CacheStats KeyedCache::Stats() const {
  CacheStats stats;
  stats.hits           = hits_.load(std::memory_order_relaxed);
  stats.misses         = misses_.load(std::memory_order_relaxed);
  stats.sets           = sets_.load(std::memory_order_relaxed);
  stats.deletes        = deletes_.load(std::memory_order_relaxed);
  stats.expired        = expired_.load(std::memory_order_relaxed);
  stats.swept          = swept_.load(std::memory_order_relaxed);
  stats.backend_errors = backend_errors_.load(std::memory_order_relaxed);

  try {
    auto store_stats     = store_->Stats(now_());
    stats.total_keys     = store_stats.total_keys;
    stats.live_keys      = store_stats.live_keys;
    stats.bytes          = store_stats.bytes;
    stats.evicted        = store_stats.evicted;
    stats.keys_by_prefix = std::move(store_stats.keys_by_prefix);
  } catch (const util::CacheBackendError& e) {
    PRICING_LOG_WARN("cache backend unavailable; stats incomplete", {StringField("error", e.what())});
  }
  return stats;
}

} // namespace pricing::cache
