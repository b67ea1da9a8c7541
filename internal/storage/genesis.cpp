#include "internal/storage/genesis.hpp"

#include <iterator>
#include <utility>

#include "config/config.pb.h"
#include "internal/migrations/migration_guard.hpp"
#include "internal/migrations/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"

namespace subnet::storage {

namespace {

uint64_t OrDefault(uint64_t value, uint64_t fallback) {
  return value != 0 ? value : fallback;
}

} // namespace

NetworkDefaults DefaultsFromConfig(const subnet::runtime::config::NetworkConfig& config) {
  NetworkDefaults defaults;
  defaults.tempo               = OrDefault(config.default_tempo(), defaults.tempo);
  defaults.max_allowed_uids    = OrDefault(config.default_max_allowed_uids(), defaults.max_allowed_uids);
  defaults.immunity_period     = OrDefault(config.default_immunity_period(), defaults.immunity_period);
  defaults.activity_cutoff     = OrDefault(config.default_activity_cutoff(), defaults.activity_cutoff);
  defaults.difficulty          = OrDefault(config.default_difficulty(), defaults.difficulty);
  defaults.kappa               = OrDefault(config.default_kappa(), defaults.kappa);
  defaults.max_weights_limit   = OrDefault(config.default_max_weights_limit(), defaults.max_weights_limit);
  defaults.min_allowed_weights = OrDefault(config.default_min_allowed_weights(), defaults.min_allowed_weights);
  return defaults;
}

int ApplyGenesis(db::Repository& repository, const subnet::runtime::config::NetworkConfig& config) {
  auto   tx = repository.Begin();
  Ledger ledger(repository, *tx);

  const std::pair<std::string_view, uint64_t> globals[] = {
      {items::kSubnetLimit, OrDefault(config.subnet_limit(), kDefaultSubnetLimit)},
      {items::kNetworkImmunityPeriod, OrDefault(config.network_immunity_period(), kDefaultNetworkImmunityPeriod)},
      {items::kNetworkMinLockCost, OrDefault(config.min_lock_cost(), kDefaultMinLockCost)},
      {items::kNetworkLockReductionInterval, OrDefault(config.lock_reduction_interval(), kDefaultLockReductionInterval)},
      {items::kSubnetOwnerCut, config.has_owner_cut() ? config.owner_cut() : kDefaultOwnerCut},
  };

  int written = 0;
  for (const auto& [item, value] : globals) {
    if (ledger.HasCell(item, db::model::kGlobalScope)) continue;
    ledger.PutU64(item, db::model::kGlobalScope, value);
    ++written;
  }

  // A store created here already holds current values; the migrations that
  // would rewrite them must not run against it.
  if (written == static_cast<int>(std::size(globals))) {
    migrations::MigrationGuard guard(ledger);
    for (const auto& migration : migrations::RegisteredMigrations()) {
      guard.MarkRun(migration.name);
    }
    SUBNET_LOG_INFO("new store marked current", {observability::IntField("migrations", static_cast<int64_t>(migrations::RegisteredMigrations().size()))});
  }

  for (const auto& [account, balance] : config.genesis_balances()) {
    if (ledger.HasCell(items::kBalances, db::model::kGlobalScope, account)) continue;
    ledger.PutU64(items::kBalances, db::model::kGlobalScope, balance, account);
    ++written;
  }

  tx->Commit();

  if (written > 0) {
    SUBNET_LOG_INFO("genesis parameters written", {observability::IntField("cells", written)});
  }
  return written;
}

} // namespace subnet::storage
