#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/cache/domain_cache.hpp"
#include "internal/invalidation/dependency_graph.hpp"
#include "internal/invalidation/entity_type.hpp"

namespace pricing::invalidation {

struct InvalidationEvent {
  EntityType                 entity_type = EntityType::kProduct;
  std::optional<std::string> entity_id;
  InvalidationScope          scope = InvalidationScope::kSpecific;
};

// One sub-step that threw. Collected, logged, never rethrown.
struct InvalidationPartialFailure {
  std::string      stage; // "primary", "hook:<name>", "dependent", "global"
  cache::DomainKey domain = cache::DomainKey::kPriceLists;
  std::string      error;
};

struct InvalidationReport {
  std::size_t                             keys_removed = 0;
  std::vector<InvalidationPartialFailure> failures;

  bool Complete() const {
    return failures.empty();
  }
};

struct InvalidationStats {
  uint64_t calls              = 0;
  uint64_t keys_removed       = 0;
  uint64_t partial_failures   = 0;
  uint64_t unregistered_skips = 0;
};

// Returns keys removed by the hook's side effect.
using InvalidationHook = std::function<std::size_t(const InvalidationEvent&)>;

/*
  InvalidationCoordinator

  Single entry point for cache invalidation after entity writes.

  Per call:
    1. primary: the entity's own domain cache, Invalidate(id)
    2. hooks registered for that domain, in registration order
    3. CROSS_DOMAIN / GLOBAL: every dependent domain from the
       DependencyGraph is flushed (no id, no further hops)
    4. GLOBAL: every registered domain is flushed

  Each step is isolated: a throwing cache or hook is recorded as an
  InvalidationPartialFailure and the rest still runs. Never throws to
  the caller. Repeating a call is safe (later calls may remove 0 keys).

  Registration may happen in any order and at any time; Invalidate
  snapshots the registry and runs without holding the lock.
*/
class InvalidationCoordinator {
 public:
  explicit InvalidationCoordinator(DependencyGraph graph = DependencyGraph::Default());

  // One cache per domain. A second registration for a domain replaces
  // the first.
  void Register(std::shared_ptr<cache::DomainCache> domain_cache);

  void RegisterHook(cache::DomainKey domain, std::string name, InvalidationHook hook);

  bool IsRegistered(cache::DomainKey domain) const;

  InvalidationReport InvalidateWithReport(EntityType entity_type, const std::optional<std::string>& entity_id, InvalidationScope scope);

  std::size_t Invalidate(EntityType entity_type, const std::optional<std::string>& entity_id, InvalidationScope scope);

  // For callers holding an entity type name (CLI, external hooks).
  // Unknown names log a warning and remove nothing.
  std::size_t Invalidate(std::string_view entity_type, const std::optional<std::string>& entity_id, InvalidationScope scope);

  InvalidationStats Stats() const;

  const DependencyGraph& Graph() const {
    return graph_;
  }

 private:
  struct NamedHook {
    std::string      name;
    InvalidationHook hook;
  };

  std::shared_ptr<cache::DomainCache> Lookup(cache::DomainKey domain) const;

  // Runs domain_cache->Invalidate(id); failures go into the report.
  void InvalidateDomain(cache::DomainKey domain, const std::optional<std::string>& entity_id, std::string_view stage,
                        InvalidationReport& report);

  static void RecordDomainFailure(cache::DomainKey domain, std::string_view stage, std::string_view error, InvalidationReport& report);
  static void RecordHookFailure(const NamedHook& hook, cache::DomainKey domain, std::string_view error, InvalidationReport& report);

  const DependencyGraph graph_;

  mutable std::shared_mutex                                          mutex_;
  std::map<cache::DomainKey, std::shared_ptr<cache::DomainCache>>    caches_;
  std::map<cache::DomainKey, std::vector<NamedHook>>                 hooks_;

  std::atomic<uint64_t> calls_{0};
  std::atomic<uint64_t> keys_removed_{0};
  std::atomic<uint64_t> partial_failures_{0};
  std::atomic<uint64_t> unregistered_skips_{0};
};

} // namespace pricing::invalidation
