#include "internal/storage/ledger.hpp"

#include <stdexcept>

#include "internal/storage/storage_items.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace subnet::storage {

using db::model::kGlobalScope;
using db::model::Scope;
using db::model::StorageEntry;
using db::model::StorageKey;
using subnet::manager::v1::StorageValue;

db::model::StorageKey Key(std::string_view item, Scope scope, std::string_view subkey) {
  return StorageKey{std::string(item), scope, std::string(subkey)};
}

StorageValue U64Value(uint64_t value) {
  StorageValue v;
  v.set_u64(value);
  return v;
}

StorageValue AccountValue(const model::AccountId& account) {
  StorageValue v;
  v.set_account(account);
  return v;
}

StorageValue FlagValue(bool flag) {
  StorageValue v;
  v.set_flag(flag);
  return v;
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    case db::ErrorCode::Busy:
      throw util::ResourceExhausted(message);
    default:
      throw std::runtime_error(message);
  }
}

Ledger::Ledger(db::Repository& repository, db::Transaction& tx) : repository_(repository), tx_(tx) {
}

std::optional<StorageValue> Ledger::Get(const StorageKey& key) const {
  return repository_.Get(tx_, key);
}

void Ledger::Put(const StorageKey& key, const StorageValue& value) {
  ThrowIfDbError(repository_.Put(tx_, key, value), "write " + key.item);
}

void Ledger::Erase(const StorageKey& key) {
  ThrowIfDbError(repository_.Erase(tx_, key), "erase " + key.item);
}

void Ledger::ErasePrefix(std::string_view item, Scope scope) {
  ThrowIfDbError(repository_.ErasePrefix(tx_, std::string(item), scope), "clear " + std::string(item));
}

std::vector<StorageEntry> Ledger::Scan(std::string_view item, std::optional<Scope> scope) const {
  return repository_.Scan(tx_, std::string(item), scope);
}

uint64_t Ledger::GetU64(std::string_view item, Scope scope, std::string_view subkey) const {
  const auto value = Get(Key(item, scope, subkey));
  return value ? value->u64() : 0;
}

void Ledger::PutU64(std::string_view item, Scope scope, uint64_t value, std::string_view subkey) {
  Put(Key(item, scope, subkey), U64Value(value));
}

bool Ledger::HasCell(std::string_view item, Scope scope, std::string_view subkey) const {
  return Get(Key(item, scope, subkey)).has_value();
}

// ---------------------------------------------------------------------------
// Networks
// ---------------------------------------------------------------------------

bool Ledger::NetworkExists(model::NetworkId net) const {
  const auto value = Get(Key(items::kNetworksAdded, net));
  return value && value->flag();
}

std::vector<model::NetworkId> Ledger::Networks() const {
  std::vector<model::NetworkId> out;
  for (const auto& entry : Scan(items::kNetworksAdded, std::nullopt)) {
    if (entry.value.flag()) {
      out.push_back(static_cast<model::NetworkId>(entry.key.scope));
    }
  }
  return out;
}

model::AccountId Ledger::Owner(model::NetworkId net) const {
  const auto value = Get(Key(items::kSubnetOwner, net));
  return value ? value->account() : model::AccountId{};
}

model::AccountId Ledger::OwnerHotkey(model::NetworkId net) const {
  const auto value = Get(Key(items::kSubnetOwnerHotkey, net));
  return value ? value->account() : model::AccountId{};
}

model::BlockNumber Ledger::RegisteredAt(model::NetworkId net) const {
  return GetU64(items::kNetworkRegisteredAt, net);
}

model::Balance Ledger::SubnetTao(model::NetworkId net) const {
  return GetU64(items::kSubnetTAO, net);
}

void Ledger::SetSubnetTao(model::NetworkId net, model::Balance value) {
  PutU64(items::kSubnetTAO, net, value);
}

model::AlphaAmount Ledger::AlphaIn(model::NetworkId net) const {
  return GetU64(items::kSubnetAlphaIn, net);
}

void Ledger::SetAlphaIn(model::NetworkId net, model::AlphaAmount value) {
  PutU64(items::kSubnetAlphaIn, net, value);
}

model::AlphaAmount Ledger::AlphaOut(model::NetworkId net) const {
  return GetU64(items::kSubnetAlphaOut, net);
}

void Ledger::SetAlphaOut(model::NetworkId net, model::AlphaAmount value) {
  PutU64(items::kSubnetAlphaOut, net, value);
}

model::Balance Ledger::SubnetLocked(model::NetworkId net) const {
  return GetU64(items::kSubnetLocked, net);
}

void Ledger::SetSubnetLocked(model::NetworkId net, model::Balance value) {
  PutU64(items::kSubnetLocked, net, value);
}

std::vector<model::AlphaAmount> Ledger::Emission(model::NetworkId net) const {
  const auto value = Get(Key(items::kEmission, net));
  if (!value) return {};
  return {value->u64_list().values().begin(), value->u64_list().values().end()};
}

uint64_t Ledger::TotalEmission(model::NetworkId net) const {
  uint64_t total = 0;
  for (auto amount : Emission(net)) {
    total = util::SaturatingAdd(total, amount);
  }
  return total;
}

void Ledger::AppendEmission(model::NetworkId net, model::AlphaAmount amount) {
  StorageValue value;
  if (auto current = Get(Key(items::kEmission, net))) {
    value = std::move(*current);
  }
  value.mutable_u64_list()->add_values(amount);
  Put(Key(items::kEmission, net), value);
}

model::NetworkSummary Ledger::Summary(model::NetworkId net) const {
  model::NetworkSummary s;
  s.id             = net;
  s.owner_coldkey  = Owner(net);
  s.owner_hotkey   = OwnerHotkey(net);
  s.registered_at  = RegisteredAt(net);
  s.subnet_tao     = SubnetTao(net);
  s.alpha_in       = AlphaIn(net);
  s.alpha_out      = AlphaOut(net);
  s.locked         = SubnetLocked(net);
  s.total_emission = TotalEmission(net);
  s.tempo          = static_cast<uint16_t>(GetU64(items::kTempo, net));
  s.subnetwork_n   = static_cast<uint16_t>(GetU64(items::kSubnetworkN, net));
  return s;
}

// ---------------------------------------------------------------------------
// Stake
// ---------------------------------------------------------------------------

std::vector<model::StakePosition> Ledger::StakePositions(model::NetworkId net) const {
  std::vector<model::StakePosition> out;
  for (const auto& entry : Scan(items::kAlpha, net)) {
    model::StakePosition position;
    if (!ParseStakeSubkey(entry.key.subkey, &position.hotkey, &position.coldkey)) {
      throw std::runtime_error("malformed stake key: " + entry.key.subkey);
    }
    position.network = net;
    position.alpha   = entry.value.u64();
    out.push_back(std::move(position));
  }
  return out;
}

model::AlphaAmount Ledger::Stake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net) const {
  return GetU64(items::kAlpha, net, StakeSubkey(hotkey, coldkey));
}

void Ledger::SetStake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net, model::AlphaAmount alpha) {
  PutU64(items::kAlpha, net, alpha, StakeSubkey(hotkey, coldkey));
}

void Ledger::AddStake(const model::AccountId& hotkey, const model::AccountId& coldkey, model::NetworkId net, model::AlphaAmount alpha) {
  SetStake(hotkey, coldkey, net, util::SaturatingAdd(Stake(hotkey, coldkey, net), alpha));
}

// ---------------------------------------------------------------------------
// Balances
// ---------------------------------------------------------------------------

model::Balance Ledger::BalanceOf(const model::AccountId& account) const {
  return GetU64(items::kBalances, kGlobalScope, account);
}

void Ledger::Credit(const model::AccountId& account, model::Balance amount) {
  if (amount == 0) return;
  PutU64(items::kBalances, kGlobalScope, util::SaturatingAdd(BalanceOf(account), amount), account);
}

void Ledger::Debit(const model::AccountId& account, model::Balance amount) {
  const auto balance = BalanceOf(account);
  if (balance < amount) {
    throw util::InvalidState("debit " + account + ": balance " + std::to_string(balance) + " below " + std::to_string(amount));
  }
  PutU64(items::kBalances, kGlobalScope, balance - amount, account);
}

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------

uint64_t Ledger::TotalNetworks() const {
  return GetU64(items::kTotalNetworks, kGlobalScope);
}

void Ledger::SetTotalNetworks(uint64_t value) {
  PutU64(items::kTotalNetworks, kGlobalScope, value);
}

uint64_t Ledger::SubnetLimit() const {
  return GetU64(items::kSubnetLimit, kGlobalScope);
}

uint64_t Ledger::NetworkImmunityPeriod() const {
  return GetU64(items::kNetworkImmunityPeriod, kGlobalScope);
}

void Ledger::SetNetworkImmunityPeriod(uint64_t value) {
  PutU64(items::kNetworkImmunityPeriod, kGlobalScope, value);
}

uint16_t Ledger::OwnerCut() const {
  const auto cut = GetU64(items::kSubnetOwnerCut, kGlobalScope);
  return cut > model::kRatioDenominator ? model::kRatioDenominator : static_cast<uint16_t>(cut);
}

model::Balance Ledger::MinLockCost() const {
  return GetU64(items::kNetworkMinLockCost, kGlobalScope);
}

model::Balance Ledger::LastLockCost() const {
  return GetU64(items::kNetworkLastLockCost, kGlobalScope);
}

void Ledger::SetLastLockCost(model::Balance value) {
  PutU64(items::kNetworkLastLockCost, kGlobalScope, value);
}

model::BlockNumber Ledger::LastLockBlock() const {
  return GetU64(items::kNetworkLastLockBlock, kGlobalScope);
}

void Ledger::SetLastLockBlock(model::BlockNumber value) {
  PutU64(items::kNetworkLastLockBlock, kGlobalScope, value);
}

uint64_t Ledger::LockReductionInterval() const {
  return GetU64(items::kNetworkLockReductionInterval, kGlobalScope);
}

model::BlockNumber Ledger::CurrentBlock() const {
  return GetU64(items::kBlockNumber, kGlobalScope);
}

model::BlockNumber Ledger::AdvanceBlock(uint64_t blocks) {
  const auto next = util::SaturatingAdd(CurrentBlock(), blocks);
  PutU64(items::kBlockNumber, kGlobalScope, next);
  return next;
}

model::Balance Ledger::RecycledTao() const {
  return GetU64(items::kRecycledTao, kGlobalScope);
}

void Ledger::Recycle(model::Balance amount) {
  if (amount == 0) return;
  PutU64(items::kRecycledTao, kGlobalScope, util::SaturatingAdd(RecycledTao(), amount));
}

} // namespace subnet::storage
