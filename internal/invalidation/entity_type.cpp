#include "internal/invalidation/entity_type.hpp"

#include <cctype>
#include <string>

namespace pricing::invalidation {

namespace {

// lowercase, separators dropped
std::string Normalize(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '_' || c == '-' || c == ' ') continue;
    out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

} // namespace

std::optional<EntityType> ParseEntityType(std::string_view text) {
  const auto normalized = Normalize(text);
  for (auto type : kAllEntityTypes) {
    if (normalized == Normalize(ToString(type))) return type;
  }
  if (normalized == "tier" || normalized == "tiers" || normalized == "customertiers") return EntityType::kCustomerTier;
  if (normalized == "products") return EntityType::kProduct;
  if (normalized == "categories") return EntityType::kCategory;
  if (normalized == "pricelists") return EntityType::kPriceList;
  if (normalized == "pricelistlines") return EntityType::kPriceListLine;
  return std::nullopt;
}

std::optional<InvalidationScope> ParseInvalidationScope(std::string_view text) {
  const auto normalized = Normalize(text);
  if (normalized == "specific") return InvalidationScope::kSpecific;
  if (normalized == "crossdomain") return InvalidationScope::kCrossDomain;
  if (normalized == "global") return InvalidationScope::kGlobal;
  return std::nullopt;
}

} // namespace pricing::invalidation
