#pragma once

#include <memory>
#include <vector>

#include "internal/liquidity/liquidity_provider.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/types.hpp"

namespace subnet::storage {
class Ledger;
}

namespace subnet::lifecycle {

struct SettlementReport {
  model::NetworkId netuid = 0;
  model::AccountId owner_coldkey;

  model::Balance pot          = 0; // SubnetTAO after liquidation
  model::Balance distributed  = 0; // credited to stakers
  model::Balance owner_refund = 0;
  model::Balance recycled     = 0; // pot with no staker to receive it

  uint32_t stakers              = 0;
  uint32_t positions_liquidated = 0;

  model::SettlementState              state = model::SettlementState::kRequested;
  std::vector<model::SettlementState> transitions;
};

/*
  Dissolves one network inside the caller's transaction.

  Only the existence check can fail. Past that point every step is total:
  arithmetic saturates and teardown always completes.
*/
class SettlementEngine {
 public:
  explicit SettlementEngine(std::shared_ptr<liquidity::LiquidityProvider> liquidity);

  // Ends in kDone, or in kRejected with nothing written when the network is missing.
  SettlementReport TryDissolve(storage::Ledger& ledger, model::NetworkId net) const;

  // As TryDissolve, but a rejection throws util::NetworkDoesNotExist.
  SettlementReport Dissolve(storage::Ledger& ledger, model::NetworkId net) const;

 private:
  std::shared_ptr<liquidity::LiquidityProvider> liquidity_;
};

} // namespace subnet::lifecycle
