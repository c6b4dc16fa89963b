#include "internal/pricing/price_source.hpp"

#include <stdexcept>

namespace pricing::engine {

RepositoryPriceSource::RepositoryPriceSource(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw std::invalid_argument("RepositoryPriceSource requires a repository");
}

std::vector<db::model::PriceListRecord> RepositoryPriceSource::ListActivePriceLists(util::TimePoint now) {
  auto tx    = repository_->Begin();
  auto lists = repository_->ListActivePriceLists(*tx, now);
  tx->Commit();
  return lists;
}

std::vector<db::model::PriceListLineRecord> RepositoryPriceSource::ListPriceListLines(const std::string& price_list_id) {
  auto tx    = repository_->Begin();
  auto lines = repository_->ListPriceListLines(*tx, price_list_id);
  tx->Commit();
  return lines;
}

std::optional<db::model::ProductRecord> RepositoryPriceSource::GetProduct(const std::string& product_id) {
  auto tx      = repository_->Begin();
  auto product = repository_->GetProduct(*tx, product_id);
  tx->Commit();
  return product;
}

} // namespace pricing::engine
