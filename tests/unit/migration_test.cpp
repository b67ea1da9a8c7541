#include "internal/migrations/migrations.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/migrations/migration_guard.hpp"
#include "internal/storage/genesis.hpp"
#include "internal/storage/ledger.hpp"

namespace {

using subnet::migrations::kMigrateNetworkImmunityPeriod;
using subnet::migrations::kNewNetworkImmunityPeriod;
using subnet::migrations::MigrationGuard;
using subnet::storage::Ledger;

void TestGuardIsWriteOnceTrue() {
  subnet::db::memory::MemoryRepository repo;
  auto   tx = repo.Begin();
  Ledger ledger(repo, *tx);

  MigrationGuard guard(ledger);
  assert(!guard.HasRun("a"));
  guard.MarkRun("a");
  guard.MarkRun("a");
  assert(guard.HasRun("a"));
  assert(!guard.HasRun("b"));
  tx->Commit();
}

void TestImmunityMigrationRunsOnce() {
  subnet::db::memory::MemoryRepository repo;

  {
    auto   tx = repo.Begin();
    Ledger ledger(repo, *tx);
    ledger.SetNetworkImmunityPeriod(7200);

    const auto cost = subnet::migrations::MigrateNetworkImmunityPeriod(ledger);
    assert(cost.reads == 1);
    assert(cost.writes == 2);
    assert(ledger.NetworkImmunityPeriod() == kNewNetworkImmunityPeriod);
    tx->Commit();
  }

  {
    auto   tx = repo.Begin();
    Ledger ledger(repo, *tx);
    // Later governance change must survive a second run.
    ledger.SetNetworkImmunityPeriod(5);

    const auto cost = subnet::migrations::MigrateNetworkImmunityPeriod(ledger);
    assert(cost.reads == 1);
    assert(cost.writes == 0);
    assert(ledger.NetworkImmunityPeriod() == 5);
    assert(MigrationGuard(ledger).HasRun(kMigrateNetworkImmunityPeriod));
    tx->Commit();
  }
}

void TestRunnerReportsEachMigration() {
  subnet::db::memory::MemoryRepository repo;

  const auto first = subnet::migrations::RunPendingMigrations(repo);
  assert(first.size() == subnet::migrations::RegisteredMigrations().size());
  assert(first.front().name == kMigrateNetworkImmunityPeriod);
  assert(first.front().executed);

  const auto second = subnet::migrations::RunPendingMigrations(repo);
  assert(!second.front().executed);
  assert(second.front().cost.writes == 0);

  auto   tx = repo.Begin();
  Ledger ledger(repo, *tx);
  assert(ledger.NetworkImmunityPeriod() == kNewNetworkImmunityPeriod);
  tx->Commit();
}

void TestConfiguredImmunitySurvivesStartup() {
  subnet::db::memory::MemoryRepository repo;

  subnet::runtime::config::NetworkConfig cfg;
  cfg.set_network_immunity_period(7200);
  subnet::storage::ApplyGenesis(repo, cfg);

  const auto outcomes = subnet::migrations::RunPendingMigrations(repo);
  assert(!outcomes.front().executed);
  assert(outcomes.front().cost.writes == 0);

  auto   tx = repo.Begin();
  Ledger ledger(repo, *tx);
  assert(ledger.NetworkImmunityPeriod() == 7200);
  assert(MigrationGuard(ledger).HasRun(kMigrateNetworkImmunityPeriod));
  tx->Commit();
}

void TestExistingStoreIsStillMigrated() {
  subnet::db::memory::MemoryRepository repo;
  {
    // Store written before the migration existed.
    auto   tx = repo.Begin();
    Ledger ledger(repo, *tx);
    ledger.SetNetworkImmunityPeriod(7200);
    tx->Commit();
  }

  subnet::runtime::config::NetworkConfig cfg;
  cfg.set_network_immunity_period(7200);
  assert(subnet::storage::ApplyGenesis(repo, cfg) == 4);

  const auto outcomes = subnet::migrations::RunPendingMigrations(repo);
  assert(outcomes.front().executed);

  auto   tx = repo.Begin();
  Ledger ledger(repo, *tx);
  assert(ledger.NetworkImmunityPeriod() == kNewNetworkImmunityPeriod);
  tx->Commit();
}

} // namespace

int main() {
  TestGuardIsWriteOnceTrue();
  TestImmunityMigrationRunsOnce();
  TestRunnerReportsEachMigration();
  TestConfiguredImmunitySurvivesStartup();
  TestExistingStoreIsStillMigrated();

  std::cout << "subnet_manager_unit_migration: pass\n";
  return 0;
}
