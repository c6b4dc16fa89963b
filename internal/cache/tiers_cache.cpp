#include "internal/cache/tiers_cache.hpp"

namespace pricing::cache {

TiersCache::TiersCache(std::shared_ptr<KeyedCache> cache, std::string prefix, std::chrono::seconds ttl)
    : DomainCache(std::move(cache), std::move(prefix)), ttl_(ttl) {
}

std::string TiersCache::IdKey(const std::string& id) const {
  return Cache().GenerateKey(Prefix(), "id", id);
}

std::string TiersCache::CodeKey(const std::string& code) const {
  return Cache().GenerateKey(Prefix() + ":code", code);
}

std::string TiersCache::AllKey() const {
  return Cache().GenerateKey(Prefix(), "all");
}

std::optional<db::model::TierRecord> TiersCache::GetTier(const std::string& id) const {
  auto message = GetMessage<pricing::v1::CustomerTier>(IdKey(id));
  if (!message) return std::nullopt;
  return FromProto(*message);
}

bool TiersCache::SetTier(const db::model::TierRecord& tier, std::optional<uint64_t> generation) const {
  return SetMessage(IdKey(tier.id), ToProto(tier), ttl_, generation);
}

std::optional<db::model::TierRecord> TiersCache::GetTierByCode(const std::string& code) const {
  auto message = GetMessage<pricing::v1::CustomerTier>(CodeKey(code));
  if (!message) return std::nullopt;
  return FromProto(*message);
}

bool TiersCache::SetTierByCode(const db::model::TierRecord& tier, std::optional<uint64_t> generation) const {
  return SetMessage(CodeKey(tier.code), ToProto(tier), ttl_, generation);
}

std::optional<std::vector<db::model::TierRecord>> TiersCache::GetAllTiers() const {
  auto message = GetMessage<pricing::v1::CustomerTierSet>(AllKey());
  if (!message) return std::nullopt;

  std::vector<db::model::TierRecord> tiers;
  tiers.reserve(message->tiers_size());
  for (const auto& tier : message->tiers()) {
    tiers.push_back(FromProto(tier));
  }
  return tiers;
}

bool TiersCache::SetAllTiers(const std::vector<db::model::TierRecord>& tiers, std::optional<uint64_t> generation) const {
  pricing::v1::CustomerTierSet message;
  for (const auto& tier : tiers) {
    *message.add_tiers() = ToProto(tier);
  }
  return SetMessage(AllKey(), message, ttl_, generation);
}

std::size_t TiersCache::Invalidate(const std::optional<std::string>& entity_id) {
  AdvanceGeneration();
  if (!entity_id) return Flush(Prefix());

  std::size_t removed = Cache().Delete(IdKey(*entity_id)) ? 1 : 0;
  removed += Cache().DeletePattern(Prefix() + ":code:*");
  removed += Cache().Delete(AllKey()) ? 1 : 0;
  return removed;
}

} // namespace pricing::cache
