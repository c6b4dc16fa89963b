#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace pricing::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertPriceList(Transaction&, const model::PriceListRecord&) override;
  std::optional<model::PriceListRecord> GetPriceList(Transaction&, const std::string&) override;
  std::vector<model::PriceListRecord>   ListPriceLists(Transaction&) override;
  std::vector<model::PriceListRecord>   ListActivePriceLists(Transaction&, util::TimePoint now) override;
  Result                                UpdatePriceList(Transaction&, const model::PriceListRecord&) override;
  Result                                DeletePriceList(Transaction&, const std::string&) override;

  Result                                    InsertPriceListLine(Transaction&, const model::PriceListLineRecord&) override;
  std::optional<model::PriceListLineRecord> GetPriceListLine(Transaction&, const std::string&) override;
  std::vector<model::PriceListLineRecord>   ListPriceListLines(Transaction&, const std::string& price_list_id) override;
  Result                                    UpdatePriceListLine(Transaction&, const model::PriceListLineRecord&) override;
  Result                                    DeletePriceListLine(Transaction&, const std::string&) override;

  Result                              InsertProduct(Transaction&, const model::ProductRecord&) override;
  std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string&) override;
  std::vector<model::ProductRecord>   ListProducts(Transaction&) override;
  Result                              UpdateProduct(Transaction&, const model::ProductRecord&) override;
  Result                              DeleteProduct(Transaction&, const std::string&) override;

  Result                               InsertCategory(Transaction&, const model::CategoryRecord&) override;
  std::optional<model::CategoryRecord> GetCategory(Transaction&, const std::string&) override;
  std::vector<model::CategoryRecord>   ListCategories(Transaction&) override;
  Result                               UpdateCategory(Transaction&, const model::CategoryRecord&) override;
  Result                               DeleteCategory(Transaction&, const std::string&) override;

  Result                           InsertTier(Transaction&, const model::TierRecord&) override;
  std::optional<model::TierRecord> GetTier(Transaction&, const std::string&) override;
  std::optional<model::TierRecord> GetTierByCode(Transaction&, const std::string&) override;
  std::vector<model::TierRecord>   ListTiers(Transaction&) override;
  Result                           UpdateTier(Transaction&, const model::TierRecord&) override;
  Result                           DeleteTier(Transaction&, const std::string&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  Result                         WriteTierPriceLists(sqlite3* db, const model::TierRecord& r);
  std::vector<model::TierRecord> QueryTiers(sqlite3* db, const char* sql, const std::string* param);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace pricing::db::sqlite
