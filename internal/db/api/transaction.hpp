#pragma once

namespace subnet::db {

/*
  Abstract ledger transaction.

  One transaction spans a whole lifecycle operation (registration, dissolution,
  migration), so an exception anywhere before Commit() leaves the ledger as it was.

  - Writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE on the shared connection
  Memory: private copy of the committed cells
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
