#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace pricing::db::sqlite {

using pricing::db::ErrorCode;
using pricing::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Read paths throw on prepare failure; callers above the repository
// (PriceSource, services) decide how to degrade.
Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

// ------------------------------------------------------------------
// Row mappers
// ------------------------------------------------------------------

constexpr const char* kPriceListColumns = "id,name,description,priority,active,valid_from_ms,valid_until_ms";

model::PriceListRecord ReadPriceList(sqlite3_stmt* st) {
  model::PriceListRecord r;
  r.id          = ColText(st, 0);
  r.name        = ColText(st, 1);
  r.description = ColText(st, 2);
  r.priority    = static_cast<uint32_t>(ColI64(st, 3));
  r.active      = ColI64(st, 4) != 0;
  r.valid_from  = util::FromUnixMillis(ColI64(st, 5));
  if (auto until = ColOptI64(st, 6)) r.valid_until = util::FromUnixMillis(*until);
  return r;
}

constexpr const char* kLineColumns = "id,price_list_id,type,product_id,category_id,discount_type,amount,min_quantity,max_quantity";

model::PriceListLineRecord ReadLine(sqlite3_stmt* st) {
  model::PriceListLineRecord r;
  r.id            = ColText(st, 0);
  r.price_list_id = ColText(st, 1);
  r.type          = static_cast<pricing::model::LineType>(ColI64(st, 2));
  r.product_id    = ColOptText(st, 3);
  r.category_id   = ColOptText(st, 4);
  r.discount_type = static_cast<pricing::model::DiscountType>(ColI64(st, 5));
  r.amount        = sqlite3_column_double(st, 6);
  r.min_quantity  = static_cast<uint32_t>(ColI64(st, 7));
  if (auto max = ColOptI64(st, 8)) r.max_quantity = static_cast<uint32_t>(*max);
  return r;
}

model::ProductRecord ReadProduct(sqlite3_stmt* st) {
  model::ProductRecord r;
  r.id          = ColText(st, 0);
  r.name        = ColText(st, 1);
  r.price       = sqlite3_column_double(st, 2);
  r.category_id = ColOptText(st, 3);
  return r;
}

model::CategoryRecord ReadCategory(sqlite3_stmt* st) {
  model::CategoryRecord r;
  r.id        = ColText(st, 0);
  r.name      = ColText(st, 1);
  r.parent_id = ColOptText(st, 2);
  return r;
}

template <typename Record, typename Mapper>
std::vector<Record> CollectAll(sqlite3_stmt* st, Mapper&& map) {
  std::vector<Record> out;
  int                 rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(map(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(sqlite3_db_handle(st)));
  }
  return out;
}

template <typename Record, typename Mapper>
std::optional<Record> CollectOne(sqlite3_stmt* st, Mapper&& map) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return map(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(sqlite3_db_handle(st)));
  }
  return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

namespace {

// Runs a prepared write and maps "no row touched" to NotFound.
template <typename Translator>
Result StepWrite(sqlite3* db, sqlite3_stmt* st, bool require_change, const std::string& id, Translator&& translate) {
  const int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return translate(db, rc);
  if (require_change && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

Result PrepareWrite(sqlite3* db, const char* sql, Statement& out) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  out.reset(st);
  return Result::Ok();
}

} // namespace

// ------------------------------------------------------------------
// Price lists
// ------------------------------------------------------------------

static void BindPriceList(sqlite3_stmt* st, const model::PriceListRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.name);
  BindText(st, 3, r.description);
  BindI64(st, 4, r.priority);
  BindI64(st, 5, r.active ? 1 : 0);
  BindI64(st, 6, util::ToUnixMillis(r.valid_from));
  if (r.valid_until.has_value()) {
    BindI64(st, 7, util::ToUnixMillis(*r.valid_until));
  } else {
    sqlite3_bind_null(st, 7);
  }
}

Result SqliteRepository::InsertPriceList(Transaction& t, const model::PriceListRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "INSERT INTO price_lists(id,name,description,priority,active,valid_from_ms,valid_until_ms) VALUES(?,?,?,?,?,?,?);", st); !res) {
    return res;
  }
  BindPriceList(st.get(), r);
  return StepWrite(db, st.get(), false, r.id, Translate);
}

std::optional<model::PriceListRecord> SqliteRepository::GetPriceList(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), (std::string("SELECT ") + kPriceListColumns + " FROM price_lists WHERE id=?;").c_str());
  BindText(st.get(), 1, id);
  return CollectOne<model::PriceListRecord>(st.get(), ReadPriceList);
}

std::vector<model::PriceListRecord> SqliteRepository::ListPriceLists(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), (std::string("SELECT ") + kPriceListColumns + " FROM price_lists ORDER BY priority ASC, rowid ASC;").c_str());
  return CollectAll<model::PriceListRecord>(st.get(), ReadPriceList);
}

std::vector<model::PriceListRecord> SqliteRepository::ListActivePriceLists(Transaction& t, util::TimePoint now) {
  auto st = Prepare(TX(t).Handle(), (std::string("SELECT ") + kPriceListColumns +
                                     " FROM price_lists WHERE active=1 AND (valid_until_ms IS NULL OR valid_until_ms>=?) "
                                     "ORDER BY priority ASC, rowid ASC;")
                                        .c_str());
  BindI64(st.get(), 1, util::ToUnixMillis(now));
  return CollectAll<model::PriceListRecord>(st.get(), ReadPriceList);
}

Result SqliteRepository::UpdatePriceList(Transaction& t, const model::PriceListRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "UPDATE price_lists SET id=?1,name=?2,description=?3,priority=?4,active=?5,valid_from_ms=?6,valid_until_ms=?7 WHERE id=?1;", st);
      !res) {
    return res;
  }
  BindPriceList(st.get(), r);
  return StepWrite(db, st.get(), true, r.id, Translate);
}

Result SqliteRepository::DeletePriceList(Transaction& t, const std::string& id) {
  // lines and tier links go with it (ON DELETE CASCADE)
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "DELETE FROM price_lists WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, id);
  return StepWrite(db, st.get(), true, id, Translate);
}

// ------------------------------------------------------------------
// Price list lines
// ------------------------------------------------------------------

static void BindLine(sqlite3_stmt* st, const model::PriceListLineRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.price_list_id);
  BindI64(st, 3, static_cast<int64_t>(r.type));
  BindOptText(st, 4, r.product_id);
  BindOptText(st, 5, r.category_id);
  BindI64(st, 6, static_cast<int64_t>(r.discount_type));
  BindDouble(st, 7, r.amount);
  BindI64(st, 8, r.min_quantity);
  if (r.max_quantity.has_value()) {
    BindI64(st, 9, *r.max_quantity);
  } else {
    sqlite3_bind_null(st, 9);
  }
}

Result SqliteRepository::InsertPriceListLine(Transaction& t, const model::PriceListLineRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db,
                              "INSERT INTO price_list_lines(id,price_list_id,type,product_id,category_id,discount_type,amount,min_quantity,max_quantity) "
                              "VALUES(?,?,?,?,?,?,?,?,?);",
                              st);
      !res) {
    return res;
  }
  BindLine(st.get(), r);
  return StepWrite(db, st.get(), false, r.id, Translate);
}

std::optional<model::PriceListLineRecord> SqliteRepository::GetPriceListLine(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), (std::string("SELECT ") + kLineColumns + " FROM price_list_lines WHERE id=?;").c_str());
  BindText(st.get(), 1, id);
  return CollectOne<model::PriceListLineRecord>(st.get(), ReadLine);
}

std::vector<model::PriceListLineRecord> SqliteRepository::ListPriceListLines(Transaction& t, const std::string& price_list_id) {
  auto st = Prepare(TX(t).Handle(), (std::string("SELECT ") + kLineColumns + " FROM price_list_lines WHERE price_list_id=? ORDER BY rowid ASC;").c_str());
  BindText(st.get(), 1, price_list_id);
  return CollectAll<model::PriceListLineRecord>(st.get(), ReadLine);
}

Result SqliteRepository::UpdatePriceListLine(Transaction& t, const model::PriceListLineRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db,
                              "UPDATE price_list_lines SET id=?1,price_list_id=?2,type=?3,product_id=?4,category_id=?5,discount_type=?6,amount=?7,"
                              "min_quantity=?8,max_quantity=?9 WHERE id=?1;",
                              st);
      !res) {
    return res;
  }
  BindLine(st.get(), r);
  return StepWrite(db, st.get(), true, r.id, Translate);
}

Result SqliteRepository::DeletePriceListLine(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "DELETE FROM price_list_lines WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, id);
  return StepWrite(db, st.get(), true, id, Translate);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result SqliteRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "INSERT INTO products(id,name,price,category_id) VALUES(?,?,?,?);", st); !res) return res;
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindDouble(st.get(), 3, r.price);
  BindOptText(st.get(), 4, r.category_id);
  return StepWrite(db, st.get(), false, r.id, Translate);
}

std::optional<model::ProductRecord> SqliteRepository::GetProduct(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,price,category_id FROM products WHERE id=?;");
  BindText(st.get(), 1, id);
  return CollectOne<model::ProductRecord>(st.get(), ReadProduct);
}

std::vector<model::ProductRecord> SqliteRepository::ListProducts(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,price,category_id FROM products ORDER BY rowid ASC;");
  return CollectAll<model::ProductRecord>(st.get(), ReadProduct);
}

Result SqliteRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "UPDATE products SET name=?,price=?,category_id=? WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, r.name);
  BindDouble(st.get(), 2, r.price);
  BindOptText(st.get(), 3, r.category_id);
  BindText(st.get(), 4, r.id);
  return StepWrite(db, st.get(), true, r.id, Translate);
}

Result SqliteRepository::DeleteProduct(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "DELETE FROM products WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, id);
  return StepWrite(db, st.get(), true, id, Translate);
}

// ------------------------------------------------------------------
// Categories
// ------------------------------------------------------------------

Result SqliteRepository::InsertCategory(Transaction& t, const model::CategoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "INSERT INTO categories(id,name,parent_id) VALUES(?,?,?);", st); !res) return res;
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindOptText(st.get(), 3, r.parent_id);
  return StepWrite(db, st.get(), false, r.id, Translate);
}

std::optional<model::CategoryRecord> SqliteRepository::GetCategory(Transaction& t, const std::string& id) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,parent_id FROM categories WHERE id=?;");
  BindText(st.get(), 1, id);
  return CollectOne<model::CategoryRecord>(st.get(), ReadCategory);
}

std::vector<model::CategoryRecord> SqliteRepository::ListCategories(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), "SELECT id,name,parent_id FROM categories ORDER BY rowid ASC;");
  return CollectAll<model::CategoryRecord>(st.get(), ReadCategory);
}

Result SqliteRepository::UpdateCategory(Transaction& t, const model::CategoryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "UPDATE categories SET name=?,parent_id=? WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, r.name);
  BindOptText(st.get(), 2, r.parent_id);
  BindText(st.get(), 3, r.id);
  return StepWrite(db, st.get(), true, r.id, Translate);
}

Result SqliteRepository::DeleteCategory(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "DELETE FROM categories WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, id);
  return StepWrite(db, st.get(), true, id, Translate);
}

// ------------------------------------------------------------------
// Customer tiers
// ------------------------------------------------------------------

Result SqliteRepository::WriteTierPriceLists(sqlite3* db, const model::TierRecord& r) {
  {
    Statement st;
    if (auto res = PrepareWrite(db, "DELETE FROM customer_tier_price_lists WHERE tier_id=?;", st); !res) return res;
    BindText(st.get(), 1, r.id);
    if (auto res = StepWrite(db, st.get(), false, r.id, Translate); !res) return res;
  }

  int64_t position = 0;
  for (const auto& price_list_id : r.price_list_ids) {
    Statement st;
    if (auto res = PrepareWrite(db, "INSERT INTO customer_tier_price_lists(tier_id,price_list_id,position) VALUES(?,?,?);", st); !res) return res;
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, price_list_id);
    BindI64(st.get(), 3, position++);
    if (auto res = StepWrite(db, st.get(), false, r.id, Translate); !res) return res;
  }
  return Result::Ok();
}

std::vector<model::TierRecord> SqliteRepository::QueryTiers(sqlite3* db, const char* sql, const std::string* param) {
  auto st = Prepare(db, sql);
  if (param) BindText(st.get(), 1, *param);

  auto tiers = CollectAll<model::TierRecord>(st.get(), [](sqlite3_stmt* row) {
    model::TierRecord r;
    r.id                                = ColText(row, 0);
    r.code                              = ColText(row, 1);
    r.name                              = ColText(row, 2);
    r.level                             = static_cast<int32_t>(ColI64(row, 3));
    r.requirements.min_order_count      = static_cast<uint32_t>(ColI64(row, 4));
    r.requirements.min_lifetime_spend   = sqlite3_column_double(row, 5);
    r.requirements.min_monthly_orders   = static_cast<uint32_t>(ColI64(row, 6));
    r.active                            = ColI64(row, 7) != 0;
    return r;
  });

  for (auto& tier : tiers) {
    auto links = Prepare(db, "SELECT price_list_id FROM customer_tier_price_lists WHERE tier_id=? ORDER BY position ASC;");
    BindText(links.get(), 1, tier.id);
    tier.price_list_ids = CollectAll<std::string>(links.get(), [](sqlite3_stmt* row) { return ColText(row, 0); });
  }
  return tiers;
}

static void BindTier(sqlite3_stmt* st, const model::TierRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.code);
  BindText(st, 3, r.name);
  BindI64(st, 4, r.level);
  BindI64(st, 5, r.requirements.min_order_count);
  BindDouble(st, 6, r.requirements.min_lifetime_spend);
  BindI64(st, 7, r.requirements.min_monthly_orders);
  BindI64(st, 8, r.active ? 1 : 0);
}

Result SqliteRepository::InsertTier(Transaction& t, const model::TierRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db,
                              "INSERT INTO customer_tiers(id,code,name,level,min_order_count,min_lifetime_spend,min_monthly_orders,active) "
                              "VALUES(?,?,?,?,?,?,?,?);",
                              st);
      !res) {
    return res;
  }
  BindTier(st.get(), r);
  if (auto res = StepWrite(db, st.get(), false, r.id, Translate); !res) return res;
  return WriteTierPriceLists(db, r);
}

std::optional<model::TierRecord> SqliteRepository::GetTier(Transaction& t, const std::string& id) {
  auto tiers = QueryTiers(TX(t).Handle(),
                          "SELECT id,code,name,level,min_order_count,min_lifetime_spend,min_monthly_orders,active FROM customer_tiers WHERE id=?;", &id);
  if (tiers.empty()) return std::nullopt;
  return tiers.front();
}

std::optional<model::TierRecord> SqliteRepository::GetTierByCode(Transaction& t, const std::string& code) {
  auto tiers = QueryTiers(TX(t).Handle(),
                          "SELECT id,code,name,level,min_order_count,min_lifetime_spend,min_monthly_orders,active FROM customer_tiers WHERE code=?;", &code);
  if (tiers.empty()) return std::nullopt;
  return tiers.front();
}

std::vector<model::TierRecord> SqliteRepository::ListTiers(Transaction& t) {
  return QueryTiers(TX(t).Handle(),
                    "SELECT id,code,name,level,min_order_count,min_lifetime_spend,min_monthly_orders,active FROM customer_tiers "
                    "ORDER BY level ASC, rowid ASC;",
                    nullptr);
}

Result SqliteRepository::UpdateTier(Transaction& t, const model::TierRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db,
                              "UPDATE customer_tiers SET id=?1,code=?2,name=?3,level=?4,min_order_count=?5,min_lifetime_spend=?6,min_monthly_orders=?7,"
                              "active=?8 WHERE id=?1;",
                              st);
      !res) {
    return res;
  }
  BindTier(st.get(), r);
  if (auto res = StepWrite(db, st.get(), true, r.id, Translate); !res) return res;
  return WriteTierPriceLists(db, r);
}

Result SqliteRepository::DeleteTier(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st;
  if (auto res = PrepareWrite(db, "DELETE FROM customer_tiers WHERE id=?;", st); !res) return res;
  BindText(st.get(), 1, id);
  return StepWrite(db, st.get(), true, id, Translate);
}

} // namespace pricing::db::sqlite
