#pragma once

#include "internal/liquidity/liquidity_provider.hpp"
#include "subnet/manager/v1/storage.pb.h"

namespace subnet::liquidity {

/*
  In-ledger book of range liquidity positions.

  Positions live under (network, coldkey/position id). Pool-wide accumulators
  (current liquidity, global fees, tick bitmap words) are maintained alongside
  so that liquidation has real bookkeeping to clear.
*/
class PositionBook final : public LiquidityProvider {
 public:
  // Assigns the next position id for the network and returns it.
  uint64_t AddPosition(storage::Ledger& ledger, model::NetworkId net, subnet::manager::v1::LiquidityPosition position);

  std::vector<subnet::manager::v1::LiquidityPosition> Positions(const storage::Ledger& ledger, model::NetworkId net) const;

  void EnableUserLiquidity(storage::Ledger& ledger, model::NetworkId net, bool enabled);

  LiquidationResult LiquidateAll(storage::Ledger& ledger, model::NetworkId net) override;

  util::FixedU96F32 CurrentPrice(const storage::Ledger& ledger, model::NetworkId net) const override;
};

} // namespace subnet::liquidity
