#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/genesis.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "subnet_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::filesystem::path& path) {
  try {
    (void)subnet::config::ConfigLoader::LoadFromYaml(path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\subnet\\\"quoted\"\\ledger.sqlite"
    wal_mode: true
)");

  auto config = subnet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\subnet\\\"quoted\"\\ledger.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = subnet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestMissingDatabaseSelectsMemory() {
  const auto yaml_path = WriteYaml("memory_default",
                                   R"(server:
  bind_address: "127.0.0.1:0"
)");

  auto config = subnet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestNetworkSectionAndGenesis() {
  const auto yaml_path = WriteYaml("network",
                                   R"(server:
  bind_address: "127.0.0.1:0"
logging:
  level: debug
network:
  subnet_limit: 3
  network_immunity_period: 50
  min_lock_cost: "1000000000000"
  owner_cut: 65535
  default_tempo: 12
  genesis_balances:
    alice: "7000000000000"
    bob: 25
)");

  auto config = subnet::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.network().subnet_limit() == 3);
  assert(config.network().min_lock_cost() == 1'000'000'000'000ULL);
  assert(config.network().owner_cut() == 65535);
  assert(config.network().genesis_balances().at("alice") == 7'000'000'000'000ULL);

  const auto defaults = subnet::storage::DefaultsFromConfig(config.network());
  assert(defaults.tempo == 12);
  assert(defaults.kappa == 32'767);

  subnet::db::memory::MemoryRepository repo;
  assert(subnet::storage::ApplyGenesis(repo, config.network()) == 7);
  // Existing values are never overwritten.
  assert(subnet::storage::ApplyGenesis(repo, config.network()) == 0);

  auto                    tx = repo.Begin();
  subnet::storage::Ledger ledger(repo, *tx);
  assert(ledger.SubnetLimit() == 3);
  assert(ledger.NetworkImmunityPeriod() == 50);
  assert(ledger.MinLockCost() == 1'000'000'000'000ULL);
  assert(ledger.OwnerCut() == 65535);
  assert(ledger.LockReductionInterval() == subnet::storage::kDefaultLockReductionInterval);
  assert(ledger.BalanceOf("bob") == 25);
  tx->Commit();
}

void TestZeroOwnerCutIsKept() {
  const auto zero_path = WriteYaml("owner_cut_zero",
                                   R"(network:
  owner_cut: 0
)");
  auto zero = subnet::config::ConfigLoader::LoadFromYaml(zero_path.string());
  assert(zero.network().has_owner_cut());

  const auto absent_path = WriteYaml("owner_cut_absent",
                                     R"(network:
  subnet_limit: 4
)");
  auto absent = subnet::config::ConfigLoader::LoadFromYaml(absent_path.string());
  assert(!absent.network().has_owner_cut());

  subnet::db::memory::MemoryRepository zero_repo;
  subnet::storage::ApplyGenesis(zero_repo, zero.network());
  subnet::db::memory::MemoryRepository absent_repo;
  subnet::storage::ApplyGenesis(absent_repo, absent.network());

  auto                    zero_tx = zero_repo.Begin();
  subnet::storage::Ledger zero_ledger(zero_repo, *zero_tx);
  assert(zero_ledger.OwnerCut() == 0);
  assert(zero_ledger.HasCell(subnet::storage::items::kSubnetOwnerCut, subnet::db::model::kGlobalScope));
  zero_tx->Commit();

  auto                    absent_tx = absent_repo.Begin();
  subnet::storage::Ledger absent_ledger(absent_repo, *absent_tx);
  assert(absent_ledger.OwnerCut() == subnet::storage::kDefaultOwnerCut);
  absent_tx->Commit();
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  assert(Rejects(yaml_path) && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeNetworkValuesAreRejected() {
  assert(Rejects(WriteYaml("owner_cut_range", R"(network:
  owner_cut: 70000
)")));
  assert(Rejects(WriteYaml("subnet_limit_range", R"(network:
  subnet_limit: 70000
)")));
  assert(Rejects(WriteYaml("sqlite_path_missing", R"(database:
  sqlite:
    wal_mode: true
)")));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestMissingDatabaseSelectsMemory();
  TestNetworkSectionAndGenesis();
  TestZeroOwnerCutIsKept();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeNetworkValuesAreRejected();

  std::cout << "subnet_manager_unit_config_loader: pass\n";
  return 0;
}
