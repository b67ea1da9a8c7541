#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/storage_record.hpp"

namespace subnet::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Scans return entries ordered by (scope, subkey)
  - A transaction that is not committed leaves no trace

  The ledger (networks, stake, balances, migration flags) is stored as
  named items; typed access lives in storage::Ledger.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Single cells
  // ---------------------------------------------------------------------

  virtual std::optional<subnet::manager::v1::StorageValue> Get(Transaction&, const model::StorageKey&) = 0;

  virtual Result Put(Transaction&, const model::StorageKey&, const subnet::manager::v1::StorageValue&) = 0;

  // Erasing an absent key is not an error.
  virtual Result Erase(Transaction&, const model::StorageKey&) = 0;

  // ---------------------------------------------------------------------
  // Collections
  // ---------------------------------------------------------------------

  // Removes every subkey of `item` under `scope`.
  virtual Result ErasePrefix(Transaction&, const std::string& item, model::Scope scope) = 0;

  // Entries of `item`, restricted to `scope` when given.
  virtual std::vector<model::StorageEntry> Scan(Transaction&, const std::string& item, std::optional<model::Scope> scope) = 0;
};

} // namespace subnet::db
