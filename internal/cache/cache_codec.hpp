#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/catalog_records.hpp"
#include "internal/db/model/price_list_line_record.hpp"
#include "internal/db/model/price_list_record.hpp"
#include "internal/model/pricing_result.hpp"
#include "pricing/v1/pricing.pb.h"

namespace pricing::cache {

/*
  Record <-> protobuf conversion for cached values.

  The cache stores serialized pricing.v1 messages so that an external
  store sees a stable, language-neutral payload.
*/

pricing::v1::PriceList         ToProto(const db::model::PriceListRecord& record);
pricing::v1::PriceListLine     ToProto(const db::model::PriceListLineRecord& record);
pricing::v1::Product           ToProto(const db::model::ProductRecord& record);
pricing::v1::Category          ToProto(const db::model::CategoryRecord& record);
pricing::v1::CustomerTier      ToProto(const db::model::TierRecord& record);
pricing::v1::PricingResult     ToProto(const model::PricingResult& result);

db::model::PriceListRecord     FromProto(const pricing::v1::PriceList& message);
db::model::PriceListLineRecord FromProto(const pricing::v1::PriceListLine& message);
db::model::ProductRecord       FromProto(const pricing::v1::Product& message);
db::model::CategoryRecord      FromProto(const pricing::v1::Category& message);
db::model::TierRecord          FromProto(const pricing::v1::CustomerTier& message);
model::PricingResult           FromProto(const pricing::v1::PricingResult& message);

std::string Encode(const google::protobuf::MessageLite& message);

// nullopt when the bytes do not parse (treated as a cache miss).
template <typename Message>
std::optional<Message> Decode(const std::string& bytes) {
  Message message;
  if (!message.ParseFromString(bytes)) return std::nullopt;
  return message;
}

} // namespace pricing::cache
