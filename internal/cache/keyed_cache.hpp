#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/cache/cache_store.hpp"
#include "internal/util/time.hpp"

namespace pricing::cache {

struct KeyedCacheOptions {
  std::chrono::seconds default_ttl{300};

  // keys longer than this are replaced by "<prefix>:hash:<content hash>"
  std::size_t max_key_length = 200;
};

struct CacheStats {
  uint64_t hits           = 0;
  uint64_t misses         = 0;
  uint64_t sets           = 0;
  uint64_t deletes        = 0;
  uint64_t expired        = 0; // evicted lazily on read
  uint64_t swept          = 0;
  uint64_t evicted        = 0; // size bound
  uint64_t backend_errors = 0;

  std::size_t total_keys = 0;
  std::size_t live_keys  = 0;
  std::size_t bytes      = 0;

  std::map<std::string, std::size_t> keys_by_prefix;

  double HitRate() const {
    const auto lookups = hits + misses;
    return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
  }
};

// ------------------------------------------------------------
// Key parts
// ------------------------------------------------------------

namespace detail {

// Text parts are percent-escaped for '%', ':' and ';', so a part never
// spills into its neighbour and never reads as a separator.
inline void AppendKeyPart(std::string& out, std::string_view part) {
  for (const char c : part) {
    switch (c) {
      case '%':
        out.append("%25");
        break;
      case ':':
        out.append("%3A");
        break;
      case ';':
        out.append("%3B");
        break;
      default:
        out.push_back(c);
    }
  }
}

inline void AppendKeyPart(std::string& out, const std::string& part) {
  AppendKeyPart(out, std::string_view(part));
}

inline void AppendKeyPart(std::string& out, const char* part) {
  if (part) AppendKeyPart(out, std::string_view(part));
}

// shortest round-trip form: 100.0 -> "100", 19.99 -> "19.99"
inline void AppendKeyPart(std::string& out, double part) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), part);
  out.append(buf, ec == std::errc() ? ptr : buf);
}

template <typename Int, std::enable_if_t<std::is_integral_v<Int> && !std::is_same_v<Int, bool>, int> = 0>
void AppendKeyPart(std::string& out, Int part) {
  out.append(std::to_string(part));
}

inline void AppendKeyPart(std::string& out, bool part) {
  out.append(part ? "1" : "0");
}

template <typename T>
void AppendKeyPart(std::string& out, const std::optional<T>& part) {
  // absent renders as an empty part; an escaped id is never empty
  // unless the id itself is, and empty ids match no line
  if (part.has_value()) AppendKeyPart(out, *part);
}

} // namespace detail

/*
  KeyedCache

  TTL key/value cache over a CacheStore. Thread-safe; shared by every
  domain cache.

  - Get: miss on absent or expired (expired entries are dropped)
  - Set: ttl <= 0 uses the default TTL
  - DeletePattern: "prefix*" removes by prefix, anything else is an
    exact key
  - backend failures (util::CacheBackendError) degrade: Get misses,
    Set returns false, Delete/DeletePattern return 0. Logged, counted,
    never thrown.
*/
class KeyedCache {
 public:
  KeyedCache(std::shared_ptr<CacheStore> store, KeyedCacheOptions options, util::NowFn now = util::Now);

  std::optional<std::string> Get(const std::string& key);

  bool Set(const std::string& key, std::string value, std::chrono::seconds ttl = std::chrono::seconds{0});

  bool Delete(const std::string& key);

  std::size_t DeletePattern(const std::string& pattern);

  // Removes expired entries now. Called by CacheSweeper.
  std::size_t Sweep();

  CacheStats Stats() const;

  // prefix:part1:part2... ; optional parts without a value render empty.
  template <typename... Parts>
  std::string GenerateKey(std::string_view prefix, const Parts&... parts) const {
    std::string key(prefix);
    ((key.push_back(':'), detail::AppendKeyPart(key, parts)), ...);
    return Bound(prefix, std::move(key));
  }

  std::chrono::seconds DefaultTtl() const {
    return options_.default_ttl;
  }

  std::size_t MaxKeyLength() const {
    return options_.max_key_length;
  }

  util::TimePoint Now() const {
    return now_();
  }

 private:
  std::string Bound(std::string_view prefix, std::string key) const;

  void RecordBackendError(std::string_view op, const std::string& key, const std::exception& e);

  std::shared_ptr<CacheStore> store_;
  KeyedCacheOptions           options_;
  util::NowFn                 now_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> sets_{0};
  std::atomic<uint64_t> deletes_{0};
  std::atomic<uint64_t> expired_{0};
  std::atomic<uint64_t> swept_{0};
  std::atomic<uint64_t> backend_errors_{0};
};

} // namespace pricing::cache
