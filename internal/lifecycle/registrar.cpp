#include "internal/lifecycle/registrar.hpp"

#include <limits>
#include <set>
#include <string>

#include "internal/economics/lock_cost.hpp"
#include "internal/lifecycle/eviction_selector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace subnet::lifecycle {

using subnet::manager::v1::StorageValue;

namespace items = storage::items;

namespace {

std::optional<model::NetworkId> LowestFreeId(const storage::Ledger& ledger) {
  const auto            live = ledger.Networks();
  std::set<model::NetworkId> used(live.begin(), live.end());
  for (uint32_t id = 1; id <= std::numeric_limits<model::NetworkId>::max(); ++id) {
    if (!used.contains(static_cast<model::NetworkId>(id))) return static_cast<model::NetworkId>(id);
  }
  return std::nullopt;
}

StorageValue U64List(uint64_t first) {
  StorageValue v;
  v.mutable_u64_list()->add_values(first);
  return v;
}

StorageValue BoolList(bool first) {
  StorageValue v;
  v.mutable_bool_list()->add_values(first);
  return v;
}

StorageValue EmptyWeights() {
  StorageValue v;
  v.mutable_weight_pairs();
  return v;
}

StorageValue EmptyEmission() {
  StorageValue v;
  v.mutable_u64_list();
  return v;
}

} // namespace

Registrar::Registrar(std::shared_ptr<SettlementEngine> settlement, storage::NetworkDefaults defaults)
    : settlement_(std::move(settlement)), defaults_(defaults) {
}

model::Balance Registrar::CurrentLockCost(const storage::Ledger& ledger) const {
  return economics::LockCost(economics::LockCostInputs{
      .last_lock          = ledger.LastLockCost(),
      .last_lock_block    = ledger.LastLockBlock(),
      .min_lock           = ledger.MinLockCost(),
      .reduction_interval = ledger.LockReductionInterval(),
      .now                = ledger.CurrentBlock(),
  });
}

RegistrationResult Registrar::Register(storage::Ledger& ledger, const model::AccountId& coldkey,
                                       const model::AccountId& hotkey) const {
  RegistrationResult result;
  result.lock_cost = CurrentLockCost(ledger);

  const auto balance = ledger.BalanceOf(coldkey);
  if (balance < result.lock_cost) {
    throw util::InsufficientLock("register network: balance " + std::to_string(balance) + " below lock cost " +
                                 std::to_string(result.lock_cost));
  }

  std::optional<model::NetworkId> netuid;
  if (ledger.TotalNetworks() < ledger.SubnetLimit()) {
    netuid = LowestFreeId(ledger);
  }
  if (!netuid) {
    const auto victim = NetworkToPrune(ledger);
    if (!victim) {
      throw util::SubnetLimitReached("register network: subnet limit reached and every network is immune");
    }
    result.pruned = settlement_->Dissolve(ledger, *victim);
    netuid        = *victim;

    SUBNET_LOG_INFO("network pruned for registration", {observability::NetworkField(*victim)});
  }
  result.netuid = *netuid;

  ledger.Debit(coldkey, result.lock_cost);
  ledger.SetSubnetLocked(result.netuid, result.lock_cost);
  ledger.SetLastLockCost(result.lock_cost);
  ledger.SetLastLockBlock(ledger.CurrentBlock());

  CreateNetwork(ledger, result.netuid, coldkey, hotkey, result.lock_cost);
  ledger.SetTotalNetworks(util::SaturatingAdd(ledger.TotalNetworks(), 1));

  SUBNET_LOG_INFO("network registered", {observability::NetworkField(result.netuid),
                                         observability::StringField("owner", coldkey),
                                         observability::StringField("hotkey", hotkey),
                                         observability::UintField("lock_cost", result.lock_cost),
                                         observability::BoolField("pruned", result.pruned.has_value())});
  return result;
}

void Registrar::CreateNetwork(storage::Ledger& ledger, model::NetworkId net, const model::AccountId& coldkey,
                              const model::AccountId& hotkey, model::Balance lock) const {
  const auto now = ledger.CurrentBlock();

  // Pool seeded 1:1 from the lock.
  ledger.SetSubnetTao(net, lock);
  ledger.SetAlphaIn(net, lock);
  ledger.SetAlphaOut(net, 0);

  ledger.Put(storage::Key(items::kSubnetOwner, net), storage::AccountValue(coldkey));
  ledger.Put(storage::Key(items::kSubnetOwnerHotkey, net), storage::AccountValue(hotkey));
  ledger.PutU64(items::kNetworkRegisteredAt, net, now);
  ledger.PutU64(items::kNetworkModality, net, 0);
  ledger.Put(storage::Key(items::kNetworksAdded, net), storage::FlagValue(true));
  ledger.Put(storage::Key(items::kEmission, net), EmptyEmission());

  ledger.PutU64(items::kTempo, net, defaults_.tempo);
  ledger.PutU64(items::kMaxAllowedUids, net, defaults_.max_allowed_uids);
  ledger.PutU64(items::kImmunityPeriod, net, defaults_.immunity_period);
  ledger.PutU64(items::kActivityCutoff, net, defaults_.activity_cutoff);
  ledger.PutU64(items::kDifficulty, net, defaults_.difficulty);
  ledger.PutU64(items::kKappa, net, defaults_.kappa);
  ledger.PutU64(items::kMaxWeightsLimit, net, defaults_.max_weights_limit);
  ledger.PutU64(items::kMinAllowedWeights, net, defaults_.min_allowed_weights);

  // Owner hotkey takes uid 0.
  const auto uid0 = storage::UidSubkey(0);
  ledger.Put(storage::Key(items::kKeys, net, uid0), storage::AccountValue(hotkey));
  ledger.Put(storage::Key(items::kIsNetworkMember, net, hotkey), storage::FlagValue(true));
  ledger.Put(storage::Key(items::kWeights, net, uid0), EmptyWeights());
  ledger.Put(storage::Key(items::kBonds, net, uid0), EmptyWeights());

  for (auto item : {items::kRank, items::kTrust, items::kIncentive, items::kConsensus, items::kDividends,
                    items::kPruningScores, items::kValidatorTrust}) {
    ledger.Put(storage::Key(item, net), U64List(0));
  }
  ledger.Put(storage::Key(items::kLastUpdate, net), U64List(now));
  ledger.Put(storage::Key(items::kActive, net), BoolList(true));
  ledger.Put(storage::Key(items::kValidatorPermit, net), BoolList(false));
  ledger.PutU64(items::kSubnetworkN, net, 1);
}

} // namespace subnet::lifecycle
