#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace pricing::engine {

/*
  Read side the resolvers depend on. Implementations must be safe to
  call from several threads at once (lines are fetched concurrently).

  Failures are reported by throwing; the snapshot loader degrades them.
*/
class PriceSource {
 public:
  virtual ~PriceSource() = default;

  // Active, not expired, priority ascending.
  virtual std::vector<db::model::PriceListRecord> ListActivePriceLists(util::TimePoint now) = 0;

  virtual std::vector<db::model::PriceListLineRecord> ListPriceListLines(const std::string& price_list_id) = 0;

  virtual std::optional<db::model::ProductRecord> GetProduct(const std::string& product_id) = 0;
};

// One read transaction per call.
class RepositoryPriceSource final : public PriceSource {
 public:
  explicit RepositoryPriceSource(std::shared_ptr<db::Repository> repository);

  std::vector<db::model::PriceListRecord>     ListActivePriceLists(util::TimePoint now) override;
  std::vector<db::model::PriceListLineRecord> ListPriceListLines(const std::string& price_list_id) override;
  std::optional<db::model::ProductRecord>     GetProduct(const std::string& product_id) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace pricing::engine
