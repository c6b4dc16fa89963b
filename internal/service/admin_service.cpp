#include "admin_service.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/cache/categories_cache.hpp"
#include "internal/cache/pricing_cache.hpp"
#include "internal/cache/products_cache.hpp"
#include "internal/cache/tiers_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/invalidation/invalidation_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/validation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace pricing::service {

using db::model::CategoryRecord;
using db::model::PriceListLineRecord;
using db::model::PriceListRecord;
using db::model::ProductRecord;
using db::model::TierRecord;
using invalidation::EntityType;
using invalidation::InvalidationScope;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  const auto message = prefix + ": " + result.Describe();
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    default:
      throw std::runtime_error(message);
  }
}

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& entity_id, Fn&& fn) {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    PRICING_LOG_ERROR("admin call failed", {observability::StringField("route", route), observability::StringField("entity_id", entity_id),
                                            observability::StringField("error", ex.what())});
    throw;
  }
}

void RequirePriceList(db::Repository& repo, db::Transaction& tx, const std::string& price_list_id) {
  if (!repo.GetPriceList(tx, price_list_id)) {
    throw util::NotFound("Price list with ID " + price_list_id + " not found");
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.repository) throw std::invalid_argument("AdminService requires a repository");
  if (!ctx_.invalidation) throw std::invalid_argument("AdminService requires an invalidation coordinator");
  if (!ctx_.now) ctx_.now = util::Now;
}

// ------------------------------------------------------------
// Price lists
// ------------------------------------------------------------

PriceListRecord AdminService::CreatePriceList(PriceListRecord list) {
  if (list.id.empty()) list.id = util::GenerateId();

  return ObserveCall("AdminService.CreatePriceList", list.id, [&] {
    ValidatePriceList(list);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertPriceList(*tx, list), "create price list");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceList, list.id, InvalidationScope::kCrossDomain);
    return list;
  });
}

PriceListRecord AdminService::UpdatePriceList(const PriceListRecord& list) {
  return ObserveCall("AdminService.UpdatePriceList", list.id, [&] {
    ValidatePriceList(list);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpdatePriceList(*tx, list), "update price list");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceList, list.id, InvalidationScope::kCrossDomain);
    return list;
  });
}

void AdminService::DeletePriceList(const std::string& id) {
  ObserveCall("AdminService.DeletePriceList", id, [&] {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->DeletePriceList(*tx, id), "delete price list");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceList, id, InvalidationScope::kCrossDomain);
    // the delete also dropped the id from tier price_list_ids
    ctx_.invalidation->Invalidate(EntityType::kCustomerTier, std::nullopt, InvalidationScope::kSpecific);
  });
}

std::optional<PriceListRecord> AdminService::GetPriceList(const std::string& id) {
  auto tx   = ctx_.repository->Begin();
  auto list = ctx_.repository->GetPriceList(*tx, id);
  tx->Commit();
  return list;
}

std::vector<PriceListRecord> AdminService::ListPriceLists(bool active_only) {
  std::optional<uint64_t> generation;
  if (ctx_.pricing) {
    if (auto cached = ctx_.pricing->GetPriceLists(active_only)) return std::move(*cached);
    generation = ctx_.pricing->Generation();
  }

  auto tx    = ctx_.repository->Begin();
  auto lists = active_only ? ctx_.repository->ListActivePriceLists(*tx, ctx_.now()) : ctx_.repository->ListPriceLists(*tx);
  tx->Commit();

  if (ctx_.pricing) ctx_.pricing->SetPriceLists(active_only, lists, generation);
  return lists;
}

// ------------------------------------------------------------
// Price list lines
// ------------------------------------------------------------

PriceListLineRecord AdminService::CreatePriceListLine(PriceListLineRecord line) {
  if (line.id.empty()) line.id = util::GenerateId();

  return ObserveCall("AdminService.CreatePriceListLine", line.id, [&] {
    ValidatePriceListLine(line);

    auto tx = ctx_.repository->Begin();
    RequirePriceList(*ctx_.repository, *tx, line.price_list_id);
    ThrowIfDbError(ctx_.repository->InsertPriceListLine(*tx, line), "create price list line");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceListLine, line.price_list_id, InvalidationScope::kCrossDomain);
    return line;
  });
}

PriceListLineRecord AdminService::UpdatePriceListLine(const PriceListLineRecord& line) {
  return ObserveCall("AdminService.UpdatePriceListLine", line.id, [&] {
    ValidatePriceListLine(line);

    auto tx       = ctx_.repository->Begin();
    auto existing = ctx_.repository->GetPriceListLine(*tx, line.id);
    if (!existing) throw util::NotFound("Price list line with ID " + line.id + " not found");
    RequirePriceList(*ctx_.repository, *tx, line.price_list_id);
    ThrowIfDbError(ctx_.repository->UpdatePriceListLine(*tx, line), "update price list line");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceListLine, line.price_list_id, InvalidationScope::kCrossDomain);
    if (existing->price_list_id != line.price_list_id) {
      ctx_.invalidation->Invalidate(EntityType::kPriceListLine, existing->price_list_id, InvalidationScope::kCrossDomain);
    }
    return line;
  });
}

void AdminService::DeletePriceListLine(const std::string& id) {
  ObserveCall("AdminService.DeletePriceListLine", id, [&] {
    auto tx       = ctx_.repository->Begin();
    auto existing = ctx_.repository->GetPriceListLine(*tx, id);
    if (!existing) throw util::NotFound("Price list line with ID " + id + " not found");
    ThrowIfDbError(ctx_.repository->DeletePriceListLine(*tx, id), "delete price list line");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kPriceListLine, existing->price_list_id, InvalidationScope::kCrossDomain);
  });
}

std::vector<PriceListLineRecord> AdminService::ListPriceListLines(const std::string& price_list_id) {
  std::optional<uint64_t> generation;
  if (ctx_.pricing) {
    if (auto cached = ctx_.pricing->GetPriceListLines(price_list_id)) return std::move(*cached);
    generation = ctx_.pricing->Generation();
  }

  auto tx = ctx_.repository->Begin();
  RequirePriceList(*ctx_.repository, *tx, price_list_id);
  auto lines = ctx_.repository->ListPriceListLines(*tx, price_list_id);
  tx->Commit();

  if (ctx_.pricing) ctx_.pricing->SetPriceListLines(price_list_id, lines, generation);
  return lines;
}

// ------------------------------------------------------------
// Products
// ------------------------------------------------------------

ProductRecord AdminService::CreateProduct(ProductRecord product) {
  if (product.id.empty()) product.id = util::GenerateId();

  return ObserveCall("AdminService.CreateProduct", product.id, [&] {
    ValidateProduct(product);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertProduct(*tx, product), "create product");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kProduct, product.id, InvalidationScope::kCrossDomain);
    return product;
  });
}

ProductRecord AdminService::UpdateProduct(const ProductRecord& product) {
  return ObserveCall("AdminService.UpdateProduct", product.id, [&] {
    ValidateProduct(product);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpdateProduct(*tx, product), "update product");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kProduct, product.id, InvalidationScope::kCrossDomain);
    return product;
  });
}

void AdminService::DeleteProduct(const std::string& id) {
  ObserveCall("AdminService.DeleteProduct", id, [&] {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->DeleteProduct(*tx, id), "delete product");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kProduct, id, InvalidationScope::kCrossDomain);
  });
}

std::optional<ProductRecord> AdminService::GetProduct(const std::string& id) {
  std::optional<uint64_t> generation;
  if (ctx_.products) {
    if (auto cached = ctx_.products->GetProduct(id)) return cached;
    generation = ctx_.products->Generation();
  }

  auto tx      = ctx_.repository->Begin();
  auto product = ctx_.repository->GetProduct(*tx, id);
  tx->Commit();

  if (product && ctx_.products) ctx_.products->SetProduct(*product, generation);
  return product;
}

// ------------------------------------------------------------
// Categories
// ------------------------------------------------------------

CategoryRecord AdminService::CreateCategory(CategoryRecord category) {
  if (category.id.empty()) category.id = util::GenerateId();

  return ObserveCall("AdminService.CreateCategory", category.id, [&] {
    ValidateCategory(category);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertCategory(*tx, category), "create category");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCategory, category.id, InvalidationScope::kCrossDomain);
    return category;
  });
}

CategoryRecord AdminService::UpdateCategory(const CategoryRecord& category) {
  return ObserveCall("AdminService.UpdateCategory", category.id, [&] {
    ValidateCategory(category);

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpdateCategory(*tx, category), "update category");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCategory, category.id, InvalidationScope::kCrossDomain);
    return category;
  });
}

void AdminService::DeleteCategory(const std::string& id) {
  ObserveCall("AdminService.DeleteCategory", id, [&] {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->DeleteCategory(*tx, id), "delete category");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCategory, id, InvalidationScope::kCrossDomain);
  });
}

std::optional<CategoryRecord> AdminService::GetCategory(const std::string& id) {
  std::optional<uint64_t> generation;
  if (ctx_.categories) {
    if (auto cached = ctx_.categories->GetCategory(id)) return cached;
    generation = ctx_.categories->Generation();
  }

  auto tx       = ctx_.repository->Begin();
  auto category = ctx_.repository->GetCategory(*tx, id);
  tx->Commit();

  if (category && ctx_.categories) ctx_.categories->SetCategory(*category, generation);
  return category;
}

std::vector<CategoryRecord> AdminService::ListCategories() {
  std::optional<uint64_t> generation;
  if (ctx_.categories) {
    if (auto cached = ctx_.categories->GetAllCategories()) return std::move(*cached);
    generation = ctx_.categories->Generation();
  }

  auto tx         = ctx_.repository->Begin();
  auto categories = ctx_.repository->ListCategories(*tx);
  tx->Commit();

  if (ctx_.categories) ctx_.categories->SetAllCategories(categories, generation);
  return categories;
}

// ------------------------------------------------------------
// Customer tiers
// ------------------------------------------------------------

TierRecord AdminService::CreateTier(TierRecord tier) {
  if (tier.id.empty()) tier.id = util::GenerateId();

  return ObserveCall("AdminService.CreateTier", tier.id, [&] {
    ValidateTier(tier);

    auto tx = ctx_.repository->Begin();
    for (const auto& price_list_id : tier.price_list_ids) {
      RequirePriceList(*ctx_.repository, *tx, price_list_id);
    }
    ThrowIfDbError(ctx_.repository->InsertTier(*tx, tier), "create customer tier");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCustomerTier, tier.id, InvalidationScope::kCrossDomain);
    return tier;
  });
}

TierRecord AdminService::UpdateTier(const TierRecord& tier) {
  return ObserveCall("AdminService.UpdateTier", tier.id, [&] {
    ValidateTier(tier);

    auto tx = ctx_.repository->Begin();
    for (const auto& price_list_id : tier.price_list_ids) {
      RequirePriceList(*ctx_.repository, *tx, price_list_id);
    }
    ThrowIfDbError(ctx_.repository->UpdateTier(*tx, tier), "update customer tier");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCustomerTier, tier.id, InvalidationScope::kCrossDomain);
    return tier;
  });
}

void AdminService::DeleteTier(const std::string& id) {
  ObserveCall("AdminService.DeleteTier", id, [&] {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->DeleteTier(*tx, id), "delete customer tier");
    tx->Commit();

    ctx_.invalidation->Invalidate(EntityType::kCustomerTier, id, InvalidationScope::kCrossDomain);
  });
}

std::optional<TierRecord> AdminService::GetTier(const std::string& id) {
  std::optional<uint64_t> generation;
  if (ctx_.tiers) {
    if (auto cached = ctx_.tiers->GetTier(id)) return cached;
    generation = ctx_.tiers->Generation();
  }

  auto tx   = ctx_.repository->Begin();
  auto tier = ctx_.repository->GetTier(*tx, id);
  tx->Commit();

  if (tier && ctx_.tiers) ctx_.tiers->SetTier(*tier, generation);
  return tier;
}

std::optional<TierRecord> AdminService::GetTierByCode(const std::string& code) {
  std::optional<uint64_t> generation;
  if (ctx_.tiers) {
    if (auto cached = ctx_.tiers->GetTierByCode(code)) return cached;
    generation = ctx_.tiers->Generation();
  }

  auto tx   = ctx_.repository->Begin();
  auto tier = ctx_.repository->GetTierByCode(*tx, code);
  tx->Commit();

  if (tier && ctx_.tiers) ctx_.tiers->SetTierByCode(*tier, generation);
  return tier;
}

std::vector<TierRecord> AdminService::ListTiers() {
  std::optional<uint64_t> generation;
  if (ctx_.tiers) {
    if (auto cached = ctx_.tiers->GetAllTiers()) return std::move(*cached);
    generation = ctx_.tiers->Generation();
  }

  auto tx    = ctx_.repository->Begin();
  auto tiers = ctx_.repository->ListTiers(*tx);
  tx->Commit();

  if (ctx_.tiers) ctx_.tiers->SetAllTiers(tiers, generation);
  return tiers;
}

} // namespace pricing::service
