#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace subnet::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN IMMEDIATE takes the write lock up front, so a settlement never fails
  half way on SQLITE_BUSY after reading the pool. Only one transaction may be
  open per connection.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_ = false;
};

}
