#include "internal/cache/memory_cache_store.hpp"

#include "internal/observability/logging.hpp"

namespace pricing::cache {

namespace {

std::size_t EntryBytes(const std::string& key, const std::string& value) {
  return key.size() + value.size();
}

std::string PrefixOf(const std::string& key) {
  const auto pos = key.find(':');
  return pos == std::string::npos ? key : key.substr(0, pos);
}

} // namespace

MemoryCacheStore::MemoryCacheStore(std::size_t max_bytes) : max_bytes_(max_bytes) {
}

MemoryCacheStore::EntryMap::iterator MemoryCacheStore::EraseLocked(EntryMap::iterator it) {
  bytes_ -= EntryBytes(it->first, it->second.value);
  expiry_.erase(ExpiryKey{it->second.expires_at, it->first});
  return entries_.erase(it);
}

LookupResult MemoryCacheStore::Get(const std::string& key, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return {};

  if (now >= it->second.expires_at) {
    EraseLocked(it);
    return {std::nullopt, true};
  }
  return {it->second.value, false};
}

bool MemoryCacheStore::Put(const std::string& key, std::string value, util::TimePoint expires_at) {
  const std::size_t need = EntryBytes(key, value);
  if (need > max_bytes_) return false;

  std::size_t evicted_now = 0;
  {
    std::lock_guard lock(mutex_);

    if (auto it = entries_.find(key); it != entries_.end()) {
      EraseLocked(it);
    }

    while (bytes_ + need > max_bytes_ && !expiry_.empty()) {
      auto victim = entries_.find(expiry_.begin()->second);
      EraseLocked(victim);
      ++evicted_now;
    }
    evicted_ += evicted_now;

    expiry_.emplace(expires_at, key);
    entries_.emplace(key, Entry{std::move(value), expires_at});
    bytes_ += need;
  }

  if (evicted_now > 0) {
    PRICING_LOG_INFO("cache size bound reached; evicted entries",
                     {observability::IntField("evicted", static_cast<int64_t>(evicted_now)),
                      observability::IntField("max_bytes", static_cast<int64_t>(max_bytes_))});
  }
  return true;
}

bool MemoryCacheStore::Erase(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = entries_.find(key);
  if (it == entries_.end()) return false;
  EraseLocked(it);
  return true;
}

std::size_t MemoryCacheStore::ErasePrefix(const std::string& prefix) {
  std::lock_guard lock(mutex_);

  std::size_t removed = 0;
  auto        it      = entries_.lower_bound(prefix);
  while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
    it = EraseLocked(it);
    ++removed;
  }
  return removed;
}

std::size_t MemoryCacheStore::Sweep(util::TimePoint now) {
  std::lock_guard lock(mutex_);

  std::size_t removed = 0;
  while (!expiry_.empty() && expiry_.begin()->first <= now) {
    auto it = entries_.find(expiry_.begin()->second);
    EraseLocked(it);
    ++removed;
  }
  return removed;
}

std::size_t MemoryCacheStore::Size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::size_t MemoryCacheStore::Bytes() const {
  std::lock_guard lock(mutex_);
  return bytes_;
}

CacheStoreStats MemoryCacheStore::Stats(util::TimePoint now) const {
  std::lock_guard lock(mutex_);

  CacheStoreStats stats;
  stats.total_keys = entries_.size();
  stats.bytes      = bytes_;
  stats.evicted    = evicted_;
  for (const auto& [key, entry] : entries_) {
    if (now < entry.expires_at) ++stats.live_keys;
    ++stats.keys_by_prefix[PrefixOf(key)];
  }
  return stats;
}

} // namespace pricing::cache
