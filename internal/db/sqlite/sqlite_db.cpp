#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace pricing::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers in other processes proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; cascades depend on them
  Exec("PRAGMA foreign_keys=ON;");

  // SQLITE_CONSTRAINT_UNIQUE etc. instead of bare SQLITE_CONSTRAINT
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS price_lists (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT NOT NULL DEFAULT '', priority INTEGER NOT NULL CHECK (priority >= 1), active INTEGER NOT NULL, valid_from_ms INTEGER NOT NULL, valid_until_ms INTEGER);",
      "CREATE INDEX IF NOT EXISTS price_lists_priority_idx ON price_lists(priority);",
      "CREATE TABLE IF NOT EXISTS price_list_lines (id TEXT PRIMARY KEY, price_list_id TEXT NOT NULL REFERENCES price_lists(id) ON DELETE CASCADE, type INTEGER NOT NULL, product_id TEXT, category_id TEXT, discount_type INTEGER NOT NULL, amount REAL NOT NULL, min_quantity INTEGER NOT NULL DEFAULT 1, max_quantity INTEGER);",
      "CREATE INDEX IF NOT EXISTS price_list_lines_list_idx ON price_list_lines(price_list_id);",
      "CREATE TABLE IF NOT EXISTS products (id TEXT PRIMARY KEY, name TEXT NOT NULL, price REAL NOT NULL, category_id TEXT);",
      "CREATE TABLE IF NOT EXISTS categories (id TEXT PRIMARY KEY, name TEXT NOT NULL, parent_id TEXT);",
      "CREATE TABLE IF NOT EXISTS customer_tiers (id TEXT PRIMARY KEY, code TEXT NOT NULL UNIQUE, name TEXT NOT NULL, level INTEGER NOT NULL, min_order_count INTEGER NOT NULL, min_lifetime_spend REAL NOT NULL, min_monthly_orders INTEGER NOT NULL, active INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS customer_tier_price_lists (tier_id TEXT NOT NULL REFERENCES customer_tiers(id) ON DELETE CASCADE, price_list_id TEXT NOT NULL REFERENCES price_lists(id) ON DELETE CASCADE, position INTEGER NOT NULL, PRIMARY KEY (tier_id, price_list_id));"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }

  Exec("SELECT id,name,description,priority,active,valid_from_ms,valid_until_ms FROM price_lists LIMIT 1;");
  Exec("SELECT id,price_list_id,type,product_id,category_id,discount_type,amount,min_quantity,max_quantity FROM price_list_lines LIMIT 1;");
  Exec("SELECT tier_id,price_list_id,position FROM customer_tier_price_lists LIMIT 1;");
}

} // namespace pricing::db::sqlite
