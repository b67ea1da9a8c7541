#include "internal/lifecycle/settlement_engine.hpp"

#include <string>

#include "internal/economics/apportion.hpp"
#include "internal/economics/owner_refund.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/ledger.hpp"
#include "internal/storage/storage_items.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace subnet::lifecycle {

using model::SettlementState;

namespace {

void Advance(SettlementReport& report, SettlementState next) {
  if (!model::CanTransition(report.state, next)) {
    throw util::InvalidState("settlement: illegal transition " + std::string(model::ToString(report.state)) + " -> " +
                             std::string(model::ToString(next)));
  }
  report.state = next;
  report.transitions.push_back(next);
}

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<liquidity::LiquidityProvider> liquidity) : liquidity_(std::move(liquidity)) {
}

SettlementReport SettlementEngine::Dissolve(storage::Ledger& ledger, model::NetworkId net) const {
  auto report = TryDissolve(ledger, net);
  if (report.state == SettlementState::kRejected) {
    throw util::NetworkDoesNotExist("dissolve network: network " + std::to_string(net) + " does not exist");
  }
  return report;
}

SettlementReport SettlementEngine::TryDissolve(storage::Ledger& ledger, model::NetworkId net) const {
  SettlementReport report;
  report.netuid = net;
  report.transitions.push_back(SettlementState::kRequested);

  if (!ledger.NetworkExists(net)) {
    Advance(report, SettlementState::kRejected);
    SUBNET_LOG_WARN("dissolution rejected", {observability::NetworkField(net),
                                             observability::StringField("state", model::ToString(report.state))});
    return report;
  }
  Advance(report, SettlementState::kValidated);

  // Refund inputs are read before liquidation moves collateral into the pool.
  report.owner_coldkey = ledger.Owner(net);
  economics::OwnerRefundInputs refund_inputs;
  refund_inputs.lock           = ledger.SubnetLocked(net);
  refund_inputs.total_emission = ledger.TotalEmission(net);
  refund_inputs.owner_cut      = ledger.OwnerCut();
  refund_inputs.price          = liquidity_->CurrentPrice(ledger, net);

  const auto freed = liquidity_->LiquidateAll(ledger, net);
  ledger.SetSubnetTao(net, util::SaturatingAdd(ledger.SubnetTao(net), freed.total_tao));
  for (const auto& position : freed.positions) {
    if (position.alpha > 0) {
      ledger.AddStake(position.owner_hotkey, position.owner_coldkey, net, position.alpha);
    }
  }
  report.positions_liquidated = static_cast<uint32_t>(freed.positions.size());
  Advance(report, SettlementState::kLiquidated);

  const auto stakes = ledger.StakePositions(net);
  std::vector<uint64_t> weights;
  weights.reserve(stakes.size());
  for (const auto& stake : stakes) {
    weights.push_back(stake.alpha);
  }

  report.pot     = ledger.SubnetTao(net);
  report.stakers = static_cast<uint32_t>(stakes.size());
  const auto shares = economics::Apportion(report.pot, weights);
  Advance(report, SettlementState::kApportioned);

  report.owner_refund = economics::OwnerRefund(refund_inputs);

  if (shares) {
    for (size_t i = 0; i < stakes.size(); ++i) {
      ledger.Credit(stakes[i].coldkey, (*shares)[i]);
      report.distributed = util::SaturatingAdd(report.distributed, (*shares)[i]);
    }
  } else {
    ledger.Recycle(report.pot);
    report.recycled = report.pot;
    if (report.pot > 0) {
      SUBNET_LOG_WARN("pot recycled without stakers", {observability::NetworkField(net),
                                                       observability::UintField("recycled", report.recycled)});
    }
  }
  ledger.Credit(report.owner_coldkey, report.owner_refund);
  Advance(report, SettlementState::kCredited);

  storage::ApplyTeardown(ledger, net, storage::NetworkTeardownRules());
  ledger.SetTotalNetworks(util::SaturatingSub(ledger.TotalNetworks(), 1));
  Advance(report, SettlementState::kPurged);

  Advance(report, SettlementState::kDone);

  SUBNET_LOG_INFO("network dissolved", {observability::NetworkField(net),
                                        observability::StringField("owner", report.owner_coldkey),
                                        observability::UintField("pot", report.pot),
                                        observability::UintField("distributed", report.distributed),
                                        observability::UintField("owner_refund", report.owner_refund),
                                        observability::UintField("recycled", report.recycled),
                                        observability::IntField("stakers", report.stakers),
                                        observability::IntField("positions", report.positions_liquidated)});
  return report;
}

} // namespace subnet::lifecycle
