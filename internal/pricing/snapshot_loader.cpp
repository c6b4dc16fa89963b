#include "internal/pricing/snapshot_loader.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace pricing::engine {

using observability::IntField;
using observability::StringField;

SnapshotLoader::SnapshotLoader(std::shared_ptr<PriceSource> source, std::shared_ptr<cache::PricingCache> cache, bool sequential_line_fetch)
    : source_(std::move(source)), cache_(std::move(cache)), sequential_line_fetch_(sequential_line_fetch) {
  if (!source_) throw std::invalid_argument("SnapshotLoader requires a price source");
  if (!cache_) throw std::invalid_argument("SnapshotLoader requires a pricing cache");
}

PricingSnapshot SnapshotLoader::Load(util::TimePoint now) const {
  PricingSnapshot snapshot;
  const auto      generation = cache_->Generation();

  for (auto& list : LoadActiveLists(now, generation)) {
    if (!IsPriceListValid(list, now)) continue;
    snapshot.lists.push_back({std::move(list), {}});
  }
  if (snapshot.lists.empty()) return snapshot;

  std::stable_sort(snapshot.lists.begin(), snapshot.lists.end(),
                   [](const PricedList& a, const PricedList& b) { return a.list.priority < b.list.priority; });

  LoadLines(snapshot.lists, generation);
  return snapshot;
}

// ------------------------------------------------------------
// Price lists
// ------------------------------------------------------------

std::vector<db::model::PriceListRecord> SnapshotLoader::LoadActiveLists(util::TimePoint now, uint64_t generation) const {
  if (auto cached = cache_->GetPriceLists(true)) return std::move(*cached);

  try {
    auto lists = source_->ListActivePriceLists(now);
    cache_->SetPriceLists(true, lists, generation);
    return lists;
  } catch (const std::exception& e) {
    PRICING_LOG_WARN("active price list fetch failed; pricing without discounts", {StringField("error", e.what())});
    return {};
  }
}

// ------------------------------------------------------------
// Lines: cached first, then fetch-then-join
// ------------------------------------------------------------

void SnapshotLoader::LoadLines(std::vector<PricedList>& lists, uint64_t generation) const {
  std::vector<PricedList*> misses;
  for (auto& priced : lists) {
    if (auto cached = cache_->GetPriceListLines(priced.list.id)) {
      priced.lines = std::move(*cached);
    } else {
      misses.push_back(&priced);
    }
  }
  if (misses.empty()) return;

  auto store = [this, generation](PricedList& priced, std::vector<db::model::PriceListLineRecord> lines) {
    cache_->SetPriceListLines(priced.list.id, lines, generation);
    priced.lines = std::move(lines);
  };
  auto degrade = [](const PricedList& priced, const std::exception& e) {
    PRICING_LOG_WARN("price list line fetch failed; list contributes no discount",
                     {StringField("price_list_id", priced.list.id), StringField("error", e.what())});
  };

  if (sequential_line_fetch_ || misses.size() == 1) {
    for (auto* priced : misses) {
      try {
        store(*priced, source_->ListPriceListLines(priced->list.id));
      } catch (const std::exception& e) {
        degrade(*priced, e);
      }
    }
    return;
  }

  std::vector<std::future<std::vector<db::model::PriceListLineRecord>>> pending;
  pending.reserve(misses.size());
  for (auto* priced : misses) {
    pending.push_back(std::async(std::launch::async, [source = source_, id = priced->list.id] { return source->ListPriceListLines(id); }));
  }

  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      store(*misses[i], pending[i].get());
    } catch (const std::exception& e) {
      degrade(*misses[i], e);
    }
  }

  PRICING_LOG_DEBUG("fetched price list lines", {IntField("lists", static_cast<int64_t>(misses.size()))});
}

} // namespace pricing::engine
