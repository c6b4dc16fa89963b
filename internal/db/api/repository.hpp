#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/catalog_records.hpp"
#include "internal/db/model/price_list_line_record.hpp"
#include "internal/db/model/price_list_record.hpp"
#include "internal/util/time.hpp"

namespace pricing::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a price list deletes its lines and drops it from every
    tier's price_list_ids
  - List order is stable: price lists by priority ascending then
    creation order, lines by creation order

  The DB is the source of truth for price lists, lines, products,
  categories and customer tiers. Everything in the cache layer is
  derived from it.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Price lists
  // ---------------------------------------------------------------------

  virtual Result InsertPriceList(Transaction&, const model::PriceListRecord&) = 0;

  virtual std::optional<model::PriceListRecord> GetPriceList(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PriceListRecord> ListPriceLists(Transaction&) = 0;

  // active == true and (valid_until absent or valid_until >= now).
  // Lists that only start in the future are included.
  virtual std::vector<model::PriceListRecord> ListActivePriceLists(Transaction&, util::TimePoint now) = 0;

  virtual Result UpdatePriceList(Transaction&, const model::PriceListRecord&) = 0;

  virtual Result DeletePriceList(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Price list lines
  // ---------------------------------------------------------------------

  virtual Result InsertPriceListLine(Transaction&, const model::PriceListLineRecord&) = 0;

  virtual std::optional<model::PriceListLineRecord> GetPriceListLine(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::PriceListLineRecord> ListPriceListLines(Transaction&, const std::string& price_list_id) = 0;

  virtual Result UpdatePriceListLine(Transaction&, const model::PriceListLineRecord&) = 0;

  virtual Result DeletePriceListLine(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Products
  // ---------------------------------------------------------------------

  virtual Result InsertProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ProductRecord> ListProducts(Transaction&) = 0;

  virtual Result UpdateProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual Result DeleteProduct(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Categories
  // ---------------------------------------------------------------------

  virtual Result InsertCategory(Transaction&, const model::CategoryRecord&) = 0;

  virtual std::optional<model::CategoryRecord> GetCategory(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::CategoryRecord> ListCategories(Transaction&) = 0;

  virtual Result UpdateCategory(Transaction&, const model::CategoryRecord&) = 0;

  virtual Result DeleteCategory(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Customer tiers
  // ---------------------------------------------------------------------

  virtual Result InsertTier(Transaction&, const model::TierRecord&) = 0;

  virtual std::optional<model::TierRecord> GetTier(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::TierRecord> GetTierByCode(Transaction&, const std::string& code) = 0;

  // Ordered by level ascending.
  virtual std::vector<model::TierRecord> ListTiers(Transaction&) = 0;

  virtual Result UpdateTier(Transaction&, const model::TierRecord&) = 0;

  virtual Result DeleteTier(Transaction&, const std::string& id) = 0;
};

} // namespace pricing::db
