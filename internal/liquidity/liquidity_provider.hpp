#pragma once

#include <vector>

#include "internal/model/types.hpp"
#include "internal/util/fixed_point.hpp"

namespace subnet::storage {
class Ledger;
}

namespace subnet::liquidity {

// Amounts returned for one liquidated position, fees included.
struct FreedPosition {
  uint64_t           position_id = 0;
  model::AccountId   owner_coldkey;
  model::AccountId   owner_hotkey;
  model::Balance     tao   = 0;
  model::AlphaAmount alpha = 0;
};

struct LiquidationResult {
  model::Balance             total_tao   = 0;
  model::AlphaAmount         total_alpha = 0;
  std::vector<FreedPosition> positions;
};

/*
  Market collaborator of the settlement engine.

  LiquidateAll must leave no position, no pool liquidity and no fee, tick or
  initialisation bookkeeping behind for the network. It runs inside the
  caller's transaction and must not call back into the lifecycle code.
*/
class LiquidityProvider {
 public:
  virtual ~LiquidityProvider() = default;

  virtual LiquidationResult LiquidateAll(storage::Ledger& ledger, model::NetworkId net) = 0;

  // alpha -> TAO exchange rate; zero when the pool holds no alpha.
  virtual util::FixedU96F32 CurrentPrice(const storage::Ledger& ledger, model::NetworkId net) const = 0;
};

} // namespace subnet::liquidity
