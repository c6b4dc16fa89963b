#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/cache/cache_codec.hpp"
#include "internal/cache/keyed_cache.hpp"

namespace pricing::cache {

// The cache domains the invalidation layer can address.
enum class DomainKey : uint8_t {
  kProducts      = 1,
  kCategories    = 2,
  kCustomerTiers = 3,
  kPriceLists    = 4,
};

constexpr std::string_view ToString(DomainKey domain) {
  switch (domain) {
    case DomainKey::kProducts:
      return "products";
    case DomainKey::kCategories:
      return "categories";
    case DomainKey::kCustomerTiers:
      return "customer_tiers";
    case DomainKey::kPriceLists:
    default:
      return "price_lists";
  }
}

/*
  DomainCache

  One entity type's cached views over the shared KeyedCache: a key
  prefix, a TTL policy, and typed accessors in the subclasses.

  Invalidate(id) removes only that entity's direct keys;
  Invalidate(nullopt) flushes the whole domain. Returns keys removed.

  Generation() advances at the start of every Invalidate, before any
  key is removed. A reader takes it before loading from the backing
  store and hands it to the Set* call; the write is dropped when an
  invalidation ran in between, so data read before a write never
  outlives the invalidation that followed it.
*/
class DomainCache {
 public:
  DomainCache(std::shared_ptr<KeyedCache> cache, std::string prefix);
  virtual ~DomainCache() = default;

  virtual DomainKey Domain() const = 0;

  const std::string& Prefix() const {
    return prefix_;
  }

  virtual std::size_t Invalidate(const std::optional<std::string>& entity_id) = 0;

  uint64_t Generation() const {
    return generation_.load();
  }

 protected:
  KeyedCache& Cache() const {
    return *cache_;
  }

  // "<prefix>:*"
  std::size_t Flush(std::string_view prefix) const;

  template <typename Message>
  std::optional<Message> GetMessage(const std::string& key) const {
    auto bytes = cache_->Get(key);
    if (!bytes) return std::nullopt;
    auto message = Decode<Message>(*bytes);
    if (!message) {
      DropUndecodable(key);
    }
    return message;
  }

  // Every Invalidate override calls this before removing anything.
  void AdvanceGeneration() {
    generation_.fetch_add(1);
  }

  // With a generation, the write is skipped (false) when the domain was
  // invalidated since it was taken.
  bool SetMessage(const std::string& key, const google::protobuf::MessageLite& message, std::chrono::seconds ttl,
                  std::optional<uint64_t> generation = std::nullopt) const;

 private:
  void DropUndecodable(const std::string& key) const;

  std::shared_ptr<KeyedCache> cache_;
  std::string                 prefix_;
  std::atomic<uint64_t>       generation_{0};
};

} // namespace pricing::cache
