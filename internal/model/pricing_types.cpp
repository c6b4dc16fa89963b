#include "internal/model/pricing_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace pricing::model {

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::optional<LineType> ParseLineType(std::string_view text) {
  const auto lower = Lower(text);
  if (lower == "product") return LineType::kProduct;
  if (lower == "category") return LineType::kCategory;
  if (lower == "all") return LineType::kAll;
  return std::nullopt;
}

std::optional<DiscountType> ParseDiscountType(std::string_view text) {
  const auto lower = Lower(text);
  if (lower == "percentage") return DiscountType::kPercentage;
  if (lower == "flat") return DiscountType::kFlat;
  return std::nullopt;
}

} // namespace pricing::model
