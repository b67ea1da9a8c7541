#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace subnet::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the storage table when missing. Safe to run on every start.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<subnet::manager::v1::StorageValue> Get(Transaction&, const model::StorageKey&) override;
  Result Put(Transaction&, const model::StorageKey&, const subnet::manager::v1::StorageValue&) override;
  Result Erase(Transaction&, const model::StorageKey&) override;

  Result ErasePrefix(Transaction&, const std::string& item, model::Scope scope) override;
  std::vector<model::StorageEntry> Scan(Transaction&, const std::string& item,
                                        std::optional<model::Scope> scope) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
