#pragma once

#include <string_view>

namespace subnet::storage {
class Ledger;
}

namespace subnet::migrations {

/*
  Name-keyed completion flags for one-shot storage transforms.
  Flags are only ever written true.
*/
class MigrationGuard {
 public:
  explicit MigrationGuard(storage::Ledger& ledger);

  bool HasRun(std::string_view name) const;
  void MarkRun(std::string_view name);

 private:
  storage::Ledger& ledger_;
};

} // namespace subnet::migrations
