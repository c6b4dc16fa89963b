#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace pricing::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction. SqliteTransaction holds
  TxMutex() for its whole lifetime, so transactions on one SqliteDB are
  serialized.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Create tables if missing. Safe to run on every start.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace pricing::db::sqlite
