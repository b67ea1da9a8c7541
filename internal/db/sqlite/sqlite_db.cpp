#include "sqlite_db.hpp"

#include <stdexcept>

namespace subnet::db::sqlite {

SqliteDB::SqliteDB(const std::string& path, bool wal_mode) {
  const int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("open ledger " + path + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite: " + msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  // A settlement commits many small cells; NORMAL only risks the last commit on power loss.
  Exec("PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

} // namespace subnet::db::sqlite
