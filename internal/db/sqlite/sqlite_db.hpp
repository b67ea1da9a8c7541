#pragma once

#include <sqlite3.h>

#include <string>

namespace subnet::db::sqlite {

/*
  Owns the single sqlite3 connection behind the ledger.

  Every ledger transaction runs on this connection, so the ledger has at most
  one writer at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const std::string& path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Statements without results: pragmas, schema, transaction control.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3* db_ = nullptr;
};

} // namespace subnet::db::sqlite
