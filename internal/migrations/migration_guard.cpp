#include "internal/migrations/migration_guard.hpp"

#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"

namespace subnet::migrations {

MigrationGuard::MigrationGuard(storage::Ledger& ledger) : ledger_(ledger) {
}

bool MigrationGuard::HasRun(std::string_view name) const {
  const auto value = ledger_.Get(storage::Key(storage::items::kHasMigrationRun, db::model::kGlobalScope, name));
  return value && value->flag();
}

void MigrationGuard::MarkRun(std::string_view name) {
  ledger_.Put(storage::Key(storage::items::kHasMigrationRun, db::model::kGlobalScope, name), storage::FlagValue(true));
}

} // namespace subnet::migrations
