#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/types.hpp"

namespace subnet::storage {

class Ledger;

namespace items {

// Network attributes
inline constexpr std::string_view kSubnetOwner        = "SubnetOwner";
inline constexpr std::string_view kSubnetOwnerHotkey  = "SubnetOwnerHotkey";
inline constexpr std::string_view kSubnetworkN        = "SubnetworkN";
inline constexpr std::string_view kNetworkModality    = "NetworkModality";
inline constexpr std::string_view kNetworksAdded      = "NetworksAdded";
inline constexpr std::string_view kNetworkRegisteredAt = "NetworkRegisteredAt";

// Per-UID vectors
inline constexpr std::string_view kRank           = "Rank";
inline constexpr std::string_view kTrust          = "Trust";
inline constexpr std::string_view kActive         = "Active";
inline constexpr std::string_view kEmission       = "Emission";
inline constexpr std::string_view kIncentive      = "Incentive";
inline constexpr std::string_view kConsensus      = "Consensus";
inline constexpr std::string_view kDividends      = "Dividends";
inline constexpr std::string_view kPruningScores  = "PruningScores";
inline constexpr std::string_view kLastUpdate     = "LastUpdate";
inline constexpr std::string_view kValidatorPermit = "ValidatorPermit";
inline constexpr std::string_view kValidatorTrust = "ValidatorTrust";

// Hyper-parameters
inline constexpr std::string_view kTempo              = "Tempo";
inline constexpr std::string_view kKappa              = "Kappa";
inline constexpr std::string_view kDifficulty         = "Difficulty";
inline constexpr std::string_view kMaxAllowedUids     = "MaxAllowedUids";
inline constexpr std::string_view kImmunityPeriod     = "ImmunityPeriod";
inline constexpr std::string_view kActivityCutoff     = "ActivityCutoff";
inline constexpr std::string_view kMaxWeightsLimit    = "MaxWeightsLimit";
inline constexpr std::string_view kMinAllowedWeights  = "MinAllowedWeights";
inline constexpr std::string_view kRegistrationsThisInterval     = "RegistrationsThisInterval";
inline constexpr std::string_view kPOWRegistrationsThisInterval  = "POWRegistrationsThisInterval";
inline constexpr std::string_view kBurnRegistrationsThisInterval = "BurnRegistrationsThisInterval";

// Pool
inline constexpr std::string_view kSubnetTAO              = "SubnetTAO";
inline constexpr std::string_view kSubnetAlphaIn          = "SubnetAlphaIn";
inline constexpr std::string_view kSubnetAlphaOut         = "SubnetAlphaOut";
inline constexpr std::string_view kSubnetAlphaInEmission  = "SubnetAlphaInEmission";
inline constexpr std::string_view kSubnetAlphaOutEmission = "SubnetAlphaOutEmission";
inline constexpr std::string_view kSubnetTaoInEmission    = "SubnetTaoInEmission";
inline constexpr std::string_view kSubnetVolume           = "SubnetVolume";
inline constexpr std::string_view kSubnetLocked           = "SubnetLocked";

// Keyed collections
inline constexpr std::string_view kKeys            = "Keys";
inline constexpr std::string_view kBonds           = "Bonds";
inline constexpr std::string_view kWeights         = "Weights";
inline constexpr std::string_view kIsNetworkMember = "IsNetworkMember";
inline constexpr std::string_view kAlpha           = "Alpha";

// Liquidity
inline constexpr std::string_view kPositions            = "Positions";
inline constexpr std::string_view kCurrentLiquidity     = "CurrentLiquidity";
inline constexpr std::string_view kFeeGlobalTao         = "FeeGlobalTao";
inline constexpr std::string_view kFeeGlobalAlpha       = "FeeGlobalAlpha";
inline constexpr std::string_view kTickIndexBitmapWords = "TickIndexBitmapWords";
inline constexpr std::string_view kSwapV3Initialized    = "SwapV3Initialized";
inline constexpr std::string_view kEnabledUserLiquidity = "EnabledUserLiquidity";
inline constexpr std::string_view kLastPositionId       = "LastPositionId";

// Global
inline constexpr std::string_view kTotalNetworks                = "TotalNetworks";
inline constexpr std::string_view kSubnetLimit                  = "SubnetLimit";
inline constexpr std::string_view kNetworkImmunityPeriod        = "NetworkImmunityPeriod";
inline constexpr std::string_view kSubnetOwnerCut               = "SubnetOwnerCut";
inline constexpr std::string_view kNetworkMinLockCost           = "NetworkMinLockCost";
inline constexpr std::string_view kNetworkLastLockCost          = "NetworkLastLockCost";
inline constexpr std::string_view kNetworkLastLockBlock         = "NetworkLastLockBlock";
inline constexpr std::string_view kNetworkLockReductionInterval = "NetworkLockReductionInterval";
inline constexpr std::string_view kBlockNumber                  = "BlockNumber";
inline constexpr std::string_view kRecycledTao                  = "RecycledTao";
inline constexpr std::string_view kBalances                     = "Balances";
inline constexpr std::string_view kHasMigrationRun              = "HasMigrationRun";

} // namespace items

/*
  Per-network teardown is a table, not code. Adding a per-network item means
  adding a row here; ApplyTeardown executes the rows uniformly.

  kRemove      - delete the plain (empty subkey) cell
  kZero        - keep the cell, write 0
  kClearPrefix - delete every subkey of the item under the network
*/
enum class TeardownAction {
  kRemove,
  kZero,
  kClearPrefix,
};

struct TeardownRule {
  std::string_view item;
  TeardownAction   action;
};

// Items owned by the network registry, stake ledger and consensus state.
const std::vector<TeardownRule>& NetworkTeardownRules();

// Items owned by the liquidity position book.
const std::vector<TeardownRule>& LiquidityTeardownRules();

void ApplyTeardown(Ledger& ledger, model::NetworkId net, const std::vector<TeardownRule>& rules);

// Subkey encodings shared by every backend. Ordering of encoded subkeys is the
// iteration order of scans.
std::string UidSubkey(model::Uid uid);
std::string StakeSubkey(const model::AccountId& hotkey, const model::AccountId& coldkey);
std::string PositionSubkey(const model::AccountId& coldkey, uint64_t position_id);

// Splits "hotkey/coldkey"; false when the separator is missing.
bool ParseStakeSubkey(const std::string& subkey, model::AccountId* hotkey, model::AccountId* coldkey);

} // namespace subnet::storage
