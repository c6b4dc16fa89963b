#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <utility>

#include "internal/cache/cache_store.hpp"

namespace pricing::cache {

/*
  In-process CacheStore.

  - ordered key index: prefix erase is O(log n + matches)
  - expiry index (expires_at, key): sweep and eviction pop from the front
  - one mutex around both indexes; no I/O under the lock
  - byte bound (key + value sizes): when exceeded, the entries closest
    to expiry are evicted first
*/
class MemoryCacheStore final : public CacheStore {
 public:
  explicit MemoryCacheStore(std::size_t max_bytes);

  LookupResult Get(const std::string& key, util::TimePoint now) override;
  bool         Put(const std::string& key, std::string value, util::TimePoint expires_at) override;
  bool         Erase(const std::string& key) override;
  std::size_t  ErasePrefix(const std::string& prefix) override;
  std::size_t  Sweep(util::TimePoint now) override;

  std::size_t     Size() const override;
  std::size_t     Bytes() const override;
  CacheStoreStats Stats(util::TimePoint now) const override;

  std::size_t MaxBytes() const {
    return max_bytes_;
  }

 private:
  struct Entry {
    std::string     value;
    util::TimePoint expires_at;
  };

  using EntryMap  = std::map<std::string, Entry, std::less<>>;
  using ExpiryKey = std::pair<util::TimePoint, std::string>;

  // caller holds mutex_
  EntryMap::iterator EraseLocked(EntryMap::iterator it);

  const std::size_t max_bytes_;

  mutable std::mutex  mutex_;
  EntryMap            entries_;
  std::set<ExpiryKey> expiry_;
  std::size_t         bytes_   = 0;
  uint64_t            evicted_ = 0;
};

} // namespace pricing::cache
