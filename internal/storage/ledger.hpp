#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/types.hpp"

namespace subnet::storage {

/*
  Typed view of the ledger inside one open transaction.

  Absent numeric cells read as zero. Write failures from the repository are
  raised as exceptions; the caller's transaction is then discarded.
*/
class Ledger {
 public:
  Ledger(db::Repository& repository, db::Transaction& tx);

  // ---------------------------------------------------------------------
  // Cells
  // ---------------------------------------------------------------------

  std::optional<subnet::manager::v1::StorageValue> Get(const db::model::StorageKey& key) const;
  void Put(const db::model::StorageKey& key, const subnet::manager::v1::StorageValue& value);
  void Erase(const db::model::StorageKey& key);
  void ErasePrefix(std::string_view item, db::model::Scope scope);
  std::vector<db::model::StorageEntry> Scan(std::string_view item, std::optional<db::model::Scope> scope) const;

  uint64_t GetU64(std::string_view item, db::model::Scope scope, std::string_view subkey = {}) const;
  void     PutU64(std::string_view item, db::model::Scope scope, uint64_t value, std::string_view subkey = {});

  bool HasCell(std::string_view item, db::model::Scope scope, std::string_view subkey = {}) const;

  // ---------------------------------------------------------------------
  // Networks
  // ---------------------------------------------------------------------

  bool                           NetworkExists(model::NetworkId net) const;
  std::vector<model::NetworkId>  Networks() const;
  model::AccountId               Owner(model::NetworkId net) const;
  model::AccountId               OwnerHotkey(model::NetworkId net) const;
  model::BlockNumber             RegisteredAt(model::NetworkId net) const;

  model::Balance     SubnetTao(model::NetworkId net) const;
  void               SetSubnetTao(model::NetworkId net, model::Balance value);
  model::AlphaAmount AlphaIn(model::NetworkId net) const;
  void               SetAlphaIn(model::NetworkId net, model::AlphaAmount value);
  model::AlphaAmount AlphaOut(model::NetworkId net) const;
  void               SetAlphaOut(model::NetworkId net, model::AlphaAmount value);
  model::Balance     SubnetLocked(model::NetworkId net) const;
  void               SetSubnetLocked(model::NetworkId net, model::Balance value);

  std::vector<model::AlphaAmount> Emission(model::NetworkId net) const;
  // Saturating sum of the emission record.
  uint64_t TotalEmission(model::NetworkId net) const;
  void     AppendEmission(model::NetworkId net, model::AlphaAmount amount);

  model::NetworkSummary Summary(model::NetworkId net) const;

  // ---------------------------------------------------------------------
  // Stake
  // ---------------------------------------------------------------------

  // Scan order: (hotkey, coldkey) bytewise.
  std::vector<model::StakePosition> StakePositions(model::NetworkId net) const;
  model::AlphaAmount Stake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net) const;
  void SetStake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net, model::AlphaAmount alpha);
  void AddStake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net, model::AlphaAmount alpha);

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  model::Balance BalanceOf(const model::AccountId& account) const;
  // Additive and saturating; never fails.
  void Credit(const model::AccountId& account, model::Balance amount);
  // Throws util::InvalidState when the balance is short.
  void Debit(const model::AccountId& account, model::Balance amount);

  // ---------------------------------------------------------------------
  // Globals
  // ---------------------------------------------------------------------

  uint64_t TotalNetworks() const;
  void     SetTotalNetworks(uint64_t value);
  uint64_t SubnetLimit() const;
  uint64_t NetworkImmunityPeriod() const;
  void     SetNetworkImmunityPeriod(uint64_t value);
  uint16_t OwnerCut() const;

  model::Balance     MinLockCost() const;
  model::Balance     LastLockCost() const;
  void               SetLastLockCost(model::Balance value);
  model::BlockNumber LastLockBlock() const;
  void               SetLastLockBlock(model::BlockNumber value);
  uint64_t           LockReductionInterval() const;

  model::BlockNumber CurrentBlock() const;
  model::BlockNumber AdvanceBlock(uint64_t blocks);

  model::Balance RecycledTao() const;
  void           Recycle(model::Balance amount);

 private:
  db::Repository&  repository_;
  db::Transaction& tx_;
};

db::model::StorageKey Key(std::string_view item, db::model::Scope scope, std::string_view subkey = {});

subnet::manager::v1::StorageValue U64Value(uint64_t value);
subnet::manager::v1::StorageValue AccountValue(const model::AccountId& account);
subnet::manager::v1::StorageValue FlagValue(bool flag);

void ThrowIfDbError(const db::Result& result, const std::string& context);

} // namespace subnet::storage
