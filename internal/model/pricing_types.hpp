#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pricing::model {

// Scope of a price list line.
enum class LineType : std::uint8_t {
  kProduct  = 1,
  kCategory = 2,
  kAll      = 3,
};

enum class DiscountType : std::uint8_t {
  kPercentage = 1,
  kFlat       = 2,
};

constexpr std::string_view ToString(LineType type) {
  switch (type) {
    case LineType::kProduct:
      return "product";
    case LineType::kCategory:
      return "category";
    case LineType::kAll:
    default:
      return "all";
  }
}

constexpr std::string_view ToString(DiscountType type) {
  switch (type) {
    case DiscountType::kFlat:
      return "flat";
    case DiscountType::kPercentage:
    default:
      return "percentage";
  }
}

// Case-insensitive ("PRODUCT", "product").
std::optional<LineType>     ParseLineType(std::string_view text);
std::optional<DiscountType> ParseDiscountType(std::string_view text);

} // namespace pricing::model
