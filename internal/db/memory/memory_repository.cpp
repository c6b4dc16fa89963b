#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace pricing::db::memory {

namespace {

template <typename Map, typename Record>
Result InsertRow(Map& rows, uint64_t& next_seq, const Record& record) {
  if (rows.contains(record.id)) return Result::Err(ErrorCode::AlreadyExists, record.id);
  rows[record.id] = {record, next_seq++};
  return Result::Ok();
}

template <typename Map, typename Record>
Result UpdateRow(Map& rows, const Record& record) {
  auto it = rows.find(record.id);
  if (it == rows.end()) return Result::Err(ErrorCode::NotFound, record.id);
  it->second.record = record;
  return Result::Ok();
}

template <typename Map>
auto FindRow(const Map& rows, const std::string& id) -> std::optional<decltype(rows.begin()->second.record)> {
  auto it = rows.find(id);
  if (it == rows.end()) return std::nullopt;
  return it->second.record;
}

// Rows in creation order, optionally filtered.
template <typename Map, typename Pred>
auto CollectRows(const Map& rows, Pred&& keep) {
  using Entry = typename Map::mapped_type;
  std::vector<const Entry*> picked;
  for (const auto& [_, row] : rows) {
    if (keep(row.record)) picked.push_back(&row);
  }
  std::sort(picked.begin(), picked.end(), [](const Entry* a, const Entry* b) { return a->seq < b->seq; });

  std::vector<decltype(picked.front()->record)> out;
  out.reserve(picked.size());
  for (const auto* row : picked) {
    out.push_back(row->record);
  }
  return out;
}

constexpr auto kAny = [](const auto&) { return true; };

void SortByPriority(std::vector<model::PriceListRecord>& lists) {
  std::stable_sort(lists.begin(), lists.end(), [](const auto& a, const auto& b) { return a.priority < b.priority; });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Price lists
// ------------------------------------------------------------

Result MemoryRepository::InsertPriceList(Transaction& t, const model::PriceListRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertRow(s.price_lists, s.next_seq, r);
}

std::optional<model::PriceListRecord> MemoryRepository::GetPriceList(Transaction& t, const std::string& id) {
  return FindRow(TX(t).View().price_lists, id);
}

std::vector<model::PriceListRecord> MemoryRepository::ListPriceLists(Transaction& t) {
  auto lists = CollectRows(TX(t).View().price_lists, kAny);
  SortByPriority(lists);
  return lists;
}

std::vector<model::PriceListRecord> MemoryRepository::ListActivePriceLists(Transaction& t, util::TimePoint now) {
  auto lists = CollectRows(TX(t).View().price_lists, [&](const model::PriceListRecord& r) {
    return r.active && (!r.valid_until.has_value() || *r.valid_until >= now);
  });
  SortByPriority(lists);
  return lists;
}

Result MemoryRepository::UpdatePriceList(Transaction& t, const model::PriceListRecord& r) {
  return UpdateRow(TX(t).Mutable().price_lists, r);
}

Result MemoryRepository::DeletePriceList(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.price_lists.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);

  // cascade: owned lines, tier references
  std::erase_if(s.lines, [&](const auto& entry) { return entry.second.record.price_list_id == id; });
  for (auto& [_, tier] : s.tiers) {
    std::erase(tier.record.price_list_ids, id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------
// Price list lines
// ------------------------------------------------------------

Result MemoryRepository::InsertPriceListLine(Transaction& t, const model::PriceListLineRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.price_lists.contains(r.price_list_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown price list " + r.price_list_id);
  }
  return InsertRow(s.lines, s.next_seq, r);
}

std::optional<model::PriceListLineRecord> MemoryRepository::GetPriceListLine(Transaction& t, const std::string& id) {
  return FindRow(TX(t).View().lines, id);
}

std::vector<model::PriceListLineRecord> MemoryRepository::ListPriceListLines(Transaction& t, const std::string& price_list_id) {
  return CollectRows(TX(t).View().lines, [&](const model::PriceListLineRecord& r) { return r.price_list_id == price_list_id; });
}

Result MemoryRepository::UpdatePriceListLine(Transaction& t, const model::PriceListLineRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.price_lists.contains(r.price_list_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown price list " + r.price_list_id);
  }
  return UpdateRow(s.lines, r);
}

Result MemoryRepository::DeletePriceListLine(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().lines.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Products
// ------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertRow(s.products, s.next_seq, r);
}

std::optional<model::ProductRecord> MemoryRepository::GetProduct(Transaction& t, const std::string& id) {
  return FindRow(TX(t).View().products, id);
}

std::vector<model::ProductRecord> MemoryRepository::ListProducts(Transaction& t) {
  return CollectRows(TX(t).View().products, kAny);
}

Result MemoryRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
  return UpdateRow(TX(t).Mutable().products, r);
}

Result MemoryRepository::DeleteProduct(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().products.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Categories
// ------------------------------------------------------------

Result MemoryRepository::InsertCategory(Transaction& t, const model::CategoryRecord& r) {
  auto& s = TX(t).Mutable();
  return InsertRow(s.categories, s.next_seq, r);
}

std::optional<model::CategoryRecord> MemoryRepository::GetCategory(Transaction& t, const std::string& id) {
  return FindRow(TX(t).View().categories, id);
}

std::vector<model::CategoryRecord> MemoryRepository::ListCategories(Transaction& t) {
  return CollectRows(TX(t).View().categories, kAny);
}

Result MemoryRepository::UpdateCategory(Transaction& t, const model::CategoryRecord& r) {
  return UpdateRow(TX(t).Mutable().categories, r);
}

Result MemoryRepository::DeleteCategory(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().categories.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

// ------------------------------------------------------------
// Customer tiers
// ------------------------------------------------------------

Result MemoryRepository::InsertTier(Transaction& t, const model::TierRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, row] : s.tiers) {
    if (row.record.code == r.code) return Result::Err(ErrorCode::AlreadyExists, "tier code " + r.code);
  }
  return InsertRow(s.tiers, s.next_seq, r);
}

std::optional<model::TierRecord> MemoryRepository::GetTier(Transaction& t, const std::string& id) {
  return FindRow(TX(t).View().tiers, id);
}

std::optional<model::TierRecord> MemoryRepository::GetTierByCode(Transaction& t, const std::string& code) {
  for (const auto& [_, row] : TX(t).View().tiers) {
    if (row.record.code == code) return row.record;
  }
  return std::nullopt;
}

std::vector<model::TierRecord> MemoryRepository::ListTiers(Transaction& t) {
  auto tiers = CollectRows(TX(t).View().tiers, kAny);
  std::stable_sort(tiers.begin(), tiers.end(), [](const auto& a, const auto& b) { return a.level < b.level; });
  return tiers;
}

Result MemoryRepository::UpdateTier(Transaction& t, const model::TierRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [id, row] : s.tiers) {
    if (id != r.id && row.record.code == r.code) return Result::Err(ErrorCode::AlreadyExists, "tier code " + r.code);
  }
  return UpdateRow(s.tiers, r);
}

Result MemoryRepository::DeleteTier(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().tiers.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

} // namespace pricing::db::memory
