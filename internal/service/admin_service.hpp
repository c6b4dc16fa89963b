#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/catalog_records.hpp"
#include "internal/db/model/price_list_line_record.hpp"
#include "internal/db/model/price_list_record.hpp"
#include "service_context.hpp"

namespace pricing::service {

/*
  Entity write path.

  Every write: validate -> repository write in one transaction ->
  commit -> cross-domain cache invalidation. Invalidation runs only
  after a successful commit and never fails the write.

  Errors: util::ValidationError, util::NotFound, util::AlreadyExists;
  anything else from the store is a std::runtime_error.

  Reads go through the domain caches and fill them on a miss.
  Create fills in an id when the record has none.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  // --------------------------------------------------------------
  // Price lists
  // --------------------------------------------------------------

  db::model::PriceListRecord CreatePriceList(db::model::PriceListRecord list);
  db::model::PriceListRecord UpdatePriceList(const db::model::PriceListRecord& list);
  void                       DeletePriceList(const std::string& id);

  std::optional<db::model::PriceListRecord> GetPriceList(const std::string& id);
  std::vector<db::model::PriceListRecord>   ListPriceLists(bool active_only);

  // --------------------------------------------------------------
  // Price list lines
  // --------------------------------------------------------------

  db::model::PriceListLineRecord CreatePriceListLine(db::model::PriceListLineRecord line);
  db::model::PriceListLineRecord UpdatePriceListLine(const db::model::PriceListLineRecord& line);
  void                           DeletePriceListLine(const std::string& id);

  std::vector<db::model::PriceListLineRecord> ListPriceListLines(const std::string& price_list_id);

  // --------------------------------------------------------------
  // Products
  // --------------------------------------------------------------

  db::model::ProductRecord CreateProduct(db::model::ProductRecord product);
  db::model::ProductRecord UpdateProduct(const db::model::ProductRecord& product);
  void                     DeleteProduct(const std::string& id);

  std::optional<db::model::ProductRecord> GetProduct(const std::string& id);

  // --------------------------------------------------------------
  // Categories
  // --------------------------------------------------------------

  db::model::CategoryRecord CreateCategory(db::model::CategoryRecord category);
  db::model::CategoryRecord UpdateCategory(const db::model::CategoryRecord& category);
  void                      DeleteCategory(const std::string& id);

  std::optional<db::model::CategoryRecord> GetCategory(const std::string& id);
  std::vector<db::model::CategoryRecord>   ListCategories();

  // --------------------------------------------------------------
  // Customer tiers
  // --------------------------------------------------------------

  db::model::TierRecord CreateTier(db::model::TierRecord tier);
  db::model::TierRecord UpdateTier(const db::model::TierRecord& tier);
  void                  DeleteTier(const std::string& id);

  std::optional<db::model::TierRecord> GetTier(const std::string& id);
  std::optional<db::model::TierRecord> GetTierByCode(const std::string& code);
  std::vector<db::model::TierRecord>   ListTiers();

 private:
  ServiceContext ctx_;
};

} // namespace pricing::service
