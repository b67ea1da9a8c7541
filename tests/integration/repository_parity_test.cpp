#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lifecycle/registrar.hpp"
#include "internal/lifecycle/settlement_engine.hpp"
#include "internal/liquidity/position_book.hpp"
#include "internal/storage/genesis.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"

#if SUBNET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using subnet::db::Repository;
using subnet::db::memory::MemoryRepository;
using subnet::db::model::kGlobalScope;
using subnet::db::model::StorageKey;
using subnet::storage::Ledger;

namespace items = subnet::storage::items;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Observable outcome of one dissolution, compared across backends.
struct SettlementOutcome {
  std::vector<uint64_t> balances;
  uint64_t              recycled = 0;
  uint64_t              pot      = 0;
  uint64_t              refund   = 0;
  uint32_t              positions = 0;

  friend bool operator==(const SettlementOutcome&, const SettlementOutcome&) = default;
};

void VerifyPutGetErase(Repository& repo) {
  auto tx = repo.Begin();

  const StorageKey key{std::string(items::kSubnetTAO), 3, ""};
  assert(repo.Put(*tx, key, subnet::storage::U64Value(42)));

  auto value = repo.Get(*tx, key);
  assert(value.has_value());
  assert(value->u64() == 42);

  assert(repo.Put(*tx, key, subnet::storage::U64Value(43)));
  assert(repo.Get(*tx, key)->u64() == 43);

  assert(repo.Erase(*tx, key));
  assert(!repo.Get(*tx, key).has_value());
  // Absent keys erase cleanly.
  assert(repo.Erase(*tx, key));

  tx->Commit();
}

void VerifyScanOrderAndScopedPrefixErase(Repository& repo) {
  const std::string item(items::kIsNetworkMember);
  {
    auto tx = repo.Begin();
    for (const char* hot : {"charlie", "alice", "bob"}) {
      assert(repo.Put(*tx, StorageKey{item, 2, hot}, subnet::storage::FlagValue(true)));
    }
    assert(repo.Put(*tx, StorageKey{item, 1, "zed"}, subnet::storage::FlagValue(true)));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto all = repo.Scan(*tx, item, std::nullopt);
    assert(all.size() == 4);
    assert(all[0].key.scope == 1);
    assert(all[1].key.subkey == "alice");
    assert(all[2].key.subkey == "bob");
    assert(all[3].key.subkey == "charlie");

    assert(repo.Scan(*tx, item, 2).size() == 3);

    assert(repo.ErasePrefix(*tx, item, 2));
    assert(repo.Scan(*tx, item, 2).empty());
    assert(repo.Scan(*tx, item, 1).size() == 1);
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo) {
  const StorageKey key{std::string(items::kBalances), kGlobalScope, "rollback"};
  {
    auto tx = repo.Begin();
    assert(repo.Put(*tx, key, subnet::storage::U64Value(7)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.Put(*tx, key, subnet::storage::U64Value(8)));
    // Dropped without commit.
  }

  auto tx = repo.Begin();
  assert(!repo.Get(*tx, key).has_value());
  tx->Commit();
}

void VerifyConcurrentCommitConflict(Repository& repo, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  const StorageKey key{std::string(items::kBalances), kGlobalScope, "conflict"};
  auto             tx1 = repo.Begin();
  auto             tx2 = repo.Begin();
  assert(repo.Put(*tx1, key, subnet::storage::U64Value(1)));
  assert(repo.Put(*tx2, key, subnet::storage::U64Value(2)));
  tx1->Commit();

  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify = repo.Begin();
  assert(repo.Get(*verify, key)->u64() == 1);
  verify->Commit();
}

SettlementOutcome RunSettlement(Repository& repo) {
  subnet::runtime::config::NetworkConfig cfg;
  cfg.set_min_lock_cost(1000);
  (*cfg.mutable_genesis_balances())["owner"] = 10'000;
  subnet::storage::ApplyGenesis(repo, cfg);

  auto book       = std::make_shared<subnet::liquidity::PositionBook>();
  auto settlement = std::make_shared<subnet::lifecycle::SettlementEngine>(book);
  subnet::lifecycle::Registrar registrar(settlement, subnet::storage::NetworkDefaults{});

  subnet::model::NetworkId net = 0;
  {
    auto   tx = repo.Begin();
    Ledger ledger(repo, *tx);
    net = registrar.Register(ledger, "owner", "owner-hot").netuid;
    ledger.SetStake("hot-a", "alice", net, 300);
    ledger.SetStake("hot-b", "bob", net, 100);
    ledger.SetStake("hot-c", "carol", net, 7);
    ledger.AppendEmission(net, 800);

    subnet::manager::v1::LiquidityPosition position;
    position.set_owner_coldkey("dave");
    position.set_owner_hotkey("hot-d");
    position.set_tick_low(-100);
    position.set_tick_high(100);
    position.set_liquidity(1000);
    position.set_tao(50);
    position.set_fees_tao(5);
    position.set_alpha(40);
    book->AddPosition(ledger, net, position);
    tx->Commit();
  }

  SettlementOutcome outcome;
  {
    auto   tx     = repo.Begin();
    Ledger ledger(repo, *tx);
    const auto report = settlement->Dissolve(ledger, net);
    tx->Commit();

    assert(report.distributed == report.pot);
    outcome.pot       = report.pot;
    outcome.refund    = report.owner_refund;
    outcome.positions = report.positions_liquidated;
  }

  auto   tx = repo.Begin();
  Ledger ledger(repo, *tx);
  assert(!ledger.NetworkExists(net));
  assert(ledger.TotalNetworks() == 0);
  assert(ledger.StakePositions(net).empty());
  assert(repo.Scan(*tx, std::string(items::kPositions), net).empty());
  assert(repo.Scan(*tx, std::string(items::kTickIndexBitmapWords), net).empty());
  for (const char* account : {"owner", "alice", "bob", "carol", "dave"}) {
    outcome.balances.push_back(ledger.BalanceOf(account));
  }
  outcome.recycled = ledger.RecycledTao();
  tx->Commit();
  return outcome;
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto             repo = backend.make_repository();
  const StorageKey key{std::string(items::kHasMigrationRun), kGlobalScope, "durable"};
  {
    auto tx = repo->Begin();
    assert(repo->Put(*tx, key, subnet::storage::FlagValue(true)));
    assert(repo->Put(*tx, StorageKey{std::string(items::kEmission), 9, ""}, [] {
      subnet::manager::v1::StorageValue value;
      value.mutable_u64_list()->add_values(5);
      value.mutable_u64_list()->add_values(6);
      return value;
    }()));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto flag = repo->Get(*tx, key);
  assert(flag.has_value());
  assert(flag->flag());

  auto emission = repo->Get(*tx, StorageKey{std::string(items::kEmission), 9, ""});
  assert(emission.has_value());
  assert(emission->u64_list().values_size() == 2);
  assert(emission->u64_list().values(1) == 6);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SUBNET_DB_SQLITE
BackendFactory MakeSqliteFactory(const std::string& tag) {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("subnet_manager_integration_sqlite_" + tag + "_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<subnet::db::sqlite::SqliteDB>(db_path);
    subnet::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<subnet::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

SettlementOutcome RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  SettlementOutcome outcome;
  {
    auto repo = backend.make_repository();

    VerifyPutGetErase(*repo);
    VerifyScanOrderAndScopedPrefixErase(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyConcurrentCommitConflict(*repo, backend.supports_parallel_transactions);
    VerifyRestartDurability(backend);
  }
  backend.cleanup();

  // Fresh store for the end-to-end run.
  {
    auto repo = backend.make_repository();
    outcome   = RunSettlement(*repo);
  }
  backend.cleanup();
  return outcome;
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SUBNET_DB_SQLITE
  backends.push_back(MakeSqliteFactory("parity"));
#endif

  std::optional<SettlementOutcome> reference;
  for (auto& backend : backends) {
    const auto outcome = RunBackendSuite(backend);
    assert(outcome.positions == 1);
    if (!reference) {
      reference = outcome;
    } else {
      assert(outcome == *reference);
    }
  }

  std::cout << "subnet_manager_integration_repository_parity: pass\n";
  return 0;
}
