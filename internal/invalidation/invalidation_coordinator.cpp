#include "internal/invalidation/invalidation_coordinator.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace pricing::invalidation {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kNonStandardException = "non-standard exception";

} // namespace

InvalidationCoordinator::InvalidationCoordinator(DependencyGraph graph) : graph_(std::move(graph)) {
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

void InvalidationCoordinator::Register(std::shared_ptr<cache::DomainCache> domain_cache) {
  if (!domain_cache) throw std::invalid_argument("cannot register a null domain cache");

  const auto      domain = domain_cache->Domain();
  std::unique_lock lock(mutex_);
  if (caches_.contains(domain)) {
    PRICING_LOG_WARN("replacing registered domain cache", {StringField("domain", cache::ToString(domain))});
  }
  caches_[domain] = std::move(domain_cache);
  PRICING_LOG_DEBUG("registered domain cache", {StringField("domain", cache::ToString(domain))});
}

void InvalidationCoordinator::RegisterHook(cache::DomainKey domain, std::string name, InvalidationHook hook) {
  if (!hook) throw std::invalid_argument("cannot register an empty invalidation hook");

  std::unique_lock lock(mutex_);
  hooks_[domain].push_back({std::move(name), std::move(hook)});
}

bool InvalidationCoordinator::IsRegistered(cache::DomainKey domain) const {
  std::shared_lock lock(mutex_);
  return caches_.contains(domain);
}

std::shared_ptr<cache::DomainCache> InvalidationCoordinator::Lookup(cache::DomainKey domain) const {
  std::shared_lock lock(mutex_);
  auto             it = caches_.find(domain);
  return it == caches_.end() ? nullptr : it->second;
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void InvalidationCoordinator::InvalidateDomain(cache::DomainKey domain, const std::optional<std::string>& entity_id, std::string_view stage,
                                               InvalidationReport& report) {
  auto domain_cache = Lookup(domain);
  if (!domain_cache) {
    unregistered_skips_.fetch_add(1, std::memory_order_relaxed);
    PRICING_LOG_WARN("no cache registered for domain; skipping", {StringField("domain", cache::ToString(domain)), StringField("stage", stage)});
    return;
  }

  try {
    report.keys_removed += domain_cache->Invalidate(entity_id);
  } catch (const std::exception& e) {
    RecordDomainFailure(domain, stage, e.what(), report);
  } catch (...) {
    RecordDomainFailure(domain, stage, kNonStandardException, report);
  }
}

void InvalidationCoordinator::RecordDomainFailure(cache::DomainKey domain, std::string_view stage, std::string_view error,
                                                  InvalidationReport& report) {
  report.failures.push_back({std::string(stage), domain, std::string(error)});
  PRICING_LOG_ERROR("domain invalidation failed",
                    {StringField("domain", cache::ToString(domain)), StringField("stage", stage), StringField("error", error)});
}

void InvalidationCoordinator::RecordHookFailure(const NamedHook& hook, cache::DomainKey domain, std::string_view error,
                                                InvalidationReport& report) {
  report.failures.push_back({"hook:" + hook.name, domain, std::string(error)});
  PRICING_LOG_ERROR("invalidation hook failed",
                    {StringField("hook", hook.name), StringField("domain", cache::ToString(domain)), StringField("error", error)});
}

InvalidationReport InvalidationCoordinator::InvalidateWithReport(EntityType entity_type, const std::optional<std::string>& entity_id,
                                                                 InvalidationScope scope) {
  calls_.fetch_add(1, std::memory_order_relaxed);

  InvalidationReport report;
  const auto         primary = PrimaryDomain(entity_type);
  const InvalidationEvent event{entity_type, entity_id, scope};

  // 1. primary
  InvalidateDomain(primary, entity_id, "primary", report);

  // 2. hooks
  std::vector<NamedHook> hooks;
  {
    std::shared_lock lock(mutex_);
    if (auto it = hooks_.find(primary); it != hooks_.end()) hooks = it->second;
  }
  for (const auto& hook : hooks) {
    try {
      report.keys_removed += hook.hook(event);
    } catch (const std::exception& e) {
      RecordHookFailure(hook, primary, e.what(), report);
    } catch (...) {
      RecordHookFailure(hook, primary, kNonStandardException, report);
    }
  }

  // 3. dependents, one hop
  if (scope == InvalidationScope::kCrossDomain || scope == InvalidationScope::kGlobal) {
    for (auto dependent : graph_.Dependents(entity_type)) {
      InvalidateDomain(dependent, std::nullopt, "dependent", report);
    }
  }

  // 4. everything
  if (scope == InvalidationScope::kGlobal) {
    std::vector<cache::DomainKey> registered;
    {
      std::shared_lock lock(mutex_);
      for (const auto& [domain, _] : caches_) registered.push_back(domain);
    }
    for (auto domain : registered) {
      InvalidateDomain(domain, std::nullopt, "global", report);
    }
  }

  keys_removed_.fetch_add(report.keys_removed, std::memory_order_relaxed);
  partial_failures_.fetch_add(report.failures.size(), std::memory_order_relaxed);

  if (report.keys_removed > 0 || !report.failures.empty()) {
    PRICING_LOG_INFO("cache invalidated", {StringField("entity_type", ToString(entity_type)), StringField("entity_id", entity_id.value_or("*")),
                                           StringField("scope", ToString(scope)), IntField("keys_removed", static_cast<int64_t>(report.keys_removed)),
                                           IntField("failures", static_cast<int64_t>(report.failures.size()))});
  }
  return report;
}

std::size_t InvalidationCoordinator::Invalidate(EntityType entity_type, const std::optional<std::string>& entity_id, InvalidationScope scope) {
  return InvalidateWithReport(entity_type, entity_id, scope).keys_removed;
}

std::size_t InvalidationCoordinator::Invalidate(std::string_view entity_type, const std::optional<std::string>& entity_id,
                                                InvalidationScope scope) {
  auto parsed = ParseEntityType(entity_type);
  if (!parsed) {
    unregistered_skips_.fetch_add(1, std::memory_order_relaxed);
    PRICING_LOG_WARN("unknown entity type; nothing invalidated", {StringField("entity_type", entity_type)});
    return 0;
  }
  return Invalidate(*parsed, entity_id, scope);
}

InvalidationStats InvalidationCoordinator::Stats() const {
  InvalidationStats stats;
  stats.calls              = calls_.load(std::memory_order_relaxed);
  stats.keys_removed       = keys_removed_.load(std::memory_order_relaxed);
  stats.partial_failures   = partial_failures_.load(std::memory_order_relaxed);
  stats.unregistered_skips = unregistered_skips_.load(std::memory_order_relaxed);
  return stats;
}

} // namespace pricing::invalidation
