#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace pricing::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                                 InsertPriceList(Transaction&, const model::PriceListRecord&) override;
  std::optional<model::PriceListRecord>  GetPriceList(Transaction&, const std::string&) override;
  std::vector<model::PriceListRecord>    ListPriceLists(Transaction&) override;
  std::vector<model::PriceListRecord>    ListActivePriceLists(Transaction&, util::TimePoint now) override;
  Result                                 UpdatePriceList(Transaction&, const model::PriceListRecord&) override;
  Result                                 DeletePriceList(Transaction&, const std::string&) override;

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
  friend class MemoryTransaction;

  // seq preserves creation order for stable listings.
  template <typename Record>
  struct Row {
    Record   record;
    uint64_t seq = 0;
  };

  struct State {
    std::unordered_map<std::string, Row<model::PriceListRecord>>     price_lists;
    std::unordered_map<std::string, Row<model::PriceListLineRecord>> lines;
    std::unordered_map<std::string, Row<model::ProductRecord>>       products;
    std::unordered_map<std::string, Row<model::CategoryRecord>>      categories;
    std::unordered_map<std::string, Row<model::TierRecord>>          tiers;
    uint64_t                                                         next_seq = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace pricing::db::memory
