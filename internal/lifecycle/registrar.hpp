#pragma once

#include <memory>
#include <optional>

#include "internal/lifecycle/settlement_engine.hpp"
#include "internal/model/types.hpp"
#include "internal/storage/genesis.hpp"

namespace subnet::lifecycle {

struct RegistrationResult {
  model::NetworkId                netuid    = 0;
  model::Balance                  lock_cost = 0;
  std::optional<SettlementReport> pruned;
};

/*
  Admits new networks against the current lock cost.

  Order: price check, id allocation (evicting through the settlement engine
  when at capacity), charge, then network creation. Errors raised before the
  charge leave the caller's transaction untouched in effect; the caller
  discards it.
*/
class Registrar {
 public:
  Registrar(std::shared_ptr<SettlementEngine> settlement, storage::NetworkDefaults defaults);

  model::Balance CurrentLockCost(const storage::Ledger& ledger) const;

  RegistrationResult Register(storage::Ledger& ledger, const model::AccountId& coldkey, const model::AccountId& hotkey) const;

 private:
  void CreateNetwork(storage::Ledger& ledger, model::NetworkId net, const model::AccountId& coldkey,
                     const model::AccountId& hotkey, model::Balance lock) const;

  std::shared_ptr<SettlementEngine> settlement_;
  storage::NetworkDefaults          defaults_;
};

} // namespace subnet::lifecycle
