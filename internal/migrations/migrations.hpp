#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace subnet::db {
class Repository;
}

namespace subnet::storage {
class Ledger;
}

namespace subnet::migrations {

// Storage operations performed by a migration.
struct MigrationCost {
  uint64_t reads  = 0;
  uint64_t writes = 0;
};

using MigrationFn = MigrationCost (*)(storage::Ledger&);

struct Migration {
  std::string_view name;
  MigrationFn      run;
};

inline constexpr std::string_view kMigrateNetworkImmunityPeriod = "migrate_network_immunity_period";
inline constexpr uint64_t         kNewNetworkImmunityPeriod     = 864'000;

// Sets NetworkImmunityPeriod to kNewNetworkImmunityPeriod exactly once.
MigrationCost MigrateNetworkImmunityPeriod(storage::Ledger& ledger);

// Every known migration, in execution order.
const std::vector<Migration>& RegisteredMigrations();

struct MigrationOutcome {
  std::string_view name;
  bool             executed = false;
  MigrationCost    cost;
};

// Runs each migration in its own transaction.
std::vector<MigrationOutcome> RunPendingMigrations(db::Repository& repository);

} // namespace subnet::migrations
