#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace pricing::cache {

struct LookupResult {
  std::optional<std::string> value;

  // true when an entry existed but had expired; it has been removed
  bool expired = false;
};

struct CacheStoreStats {
  std::size_t total_keys = 0;
  std::size_t live_keys  = 0;
  std::size_t bytes      = 0;
  uint64_t    evicted    = 0; // removed by the size bound

  // text before the first ':' of each key -> key count
  std::map<std::string, std::size_t> keys_by_prefix;
};

/*
  Backing store for KeyedCache.

  Values are opaque byte strings. Expiry is absolute (expires_at);
  an entry is live while now < expires_at.

  Implementations throw util::CacheBackendError when they cannot serve
  a request. Everything else (expiry, eviction, prefix matching) is
  the store's job so that an external store can do it atomically.
*/
class CacheStore {
 public:
  virtual ~CacheStore() = default;

  // Expired entries are removed on the spot and reported as expired.
  virtual LookupResult Get(const std::string& key, util::TimePoint now) = 0;

  // false if the entry can never fit (larger than the store's bound).
  virtual bool Put(const std::string& key, std::string value, util::TimePoint expires_at) = 0;

  virtual bool Erase(const std::string& key) = 0;

  // Removes every key starting with prefix ("" removes everything).
  virtual std::size_t ErasePrefix(const std::string& prefix) = 0;

  // Removes every entry expired at now.
  virtual std::size_t Sweep(util::TimePoint now) = 0;

  virtual std::size_t Size() const  = 0;
  virtual std::size_t Bytes() const = 0;

  virtual CacheStoreStats Stats(util::TimePoint now) const = 0;
};

} // namespace pricing::cache
