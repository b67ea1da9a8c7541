#include "internal/migrations/migrations.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/migrations/migration_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/ledger.hpp"

namespace subnet::migrations {

MigrationCost MigrateNetworkImmunityPeriod(storage::Ledger& ledger) {
  MigrationCost  cost;
  MigrationGuard guard(ledger);

  ++cost.reads;
  if (guard.HasRun(kMigrateNetworkImmunityPeriod)) {
    SUBNET_LOG_INFO("migration already run", {observability::StringField("name", kMigrateNetworkImmunityPeriod)});
    return cost;
  }

  ledger.SetNetworkImmunityPeriod(kNewNetworkImmunityPeriod);
  ++cost.writes;

  guard.MarkRun(kMigrateNetworkImmunityPeriod);
  ++cost.writes;

  SUBNET_LOG_INFO("migration completed", {observability::StringField("name", kMigrateNetworkImmunityPeriod),
                                          observability::UintField("network_immunity_period", kNewNetworkImmunityPeriod)});
  return cost;
}

const std::vector<Migration>& RegisteredMigrations() {
  static const std::vector<Migration> kMigrations = {
      {kMigrateNetworkImmunityPeriod, &MigrateNetworkImmunityPeriod},
  };
  return kMigrations;
}

std::vector<MigrationOutcome> RunPendingMigrations(db::Repository& repository) {
  std::vector<MigrationOutcome> outcomes;
  for (const auto& migration : RegisteredMigrations()) {
    auto            tx = repository.Begin();
    storage::Ledger ledger(repository, *tx);

    MigrationOutcome outcome;
    outcome.name     = migration.name;
    outcome.cost     = migration.run(ledger);
    outcome.executed = outcome.cost.writes > 0;
    tx->Commit();

    outcomes.push_back(outcome);
  }
  return outcomes;
}

} // namespace subnet::migrations
