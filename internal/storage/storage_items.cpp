#include "internal/storage/storage_items.hpp"

#include <cstdio>

#include "internal/storage/ledger.hpp"

namespace subnet::storage {

using namespace items;

const std::vector<TeardownRule>& NetworkTeardownRules() {
  static const std::vector<TeardownRule> kRules = {
      // Network attributes
      {kSubnetOwner, TeardownAction::kRemove},
      {kSubnetOwnerHotkey, TeardownAction::kRemove},
      {kSubnetworkN, TeardownAction::kRemove},
      {kNetworkModality, TeardownAction::kRemove},
      {kNetworksAdded, TeardownAction::kRemove},
      {kNetworkRegisteredAt, TeardownAction::kRemove},

      // Per-UID vectors
      {kRank, TeardownAction::kRemove},
      {kTrust, TeardownAction::kRemove},
      {kActive, TeardownAction::kRemove},
      {kEmission, TeardownAction::kRemove},
      {kIncentive, TeardownAction::kRemove},
      {kConsensus, TeardownAction::kRemove},
      {kDividends, TeardownAction::kRemove},
      {kPruningScores, TeardownAction::kRemove},
      {kLastUpdate, TeardownAction::kRemove},
      {kValidatorPermit, TeardownAction::kRemove},
      {kValidatorTrust, TeardownAction::kRemove},

      // Hyper-parameters
      {kTempo, TeardownAction::kRemove},
      {kKappa, TeardownAction::kRemove},
      {kDifficulty, TeardownAction::kRemove},
      {kMaxAllowedUids, TeardownAction::kRemove},
      {kImmunityPeriod, TeardownAction::kRemove},
      {kActivityCutoff, TeardownAction::kRemove},
      {kMaxWeightsLimit, TeardownAction::kRemove},
      {kMinAllowedWeights, TeardownAction::kRemove},
      {kRegistrationsThisInterval, TeardownAction::kRemove},
      {kPOWRegistrationsThisInterval, TeardownAction::kRemove},
      {kBurnRegistrationsThisInterval, TeardownAction::kRemove},

      // Pool
      {kSubnetTAO, TeardownAction::kRemove},
      {kSubnetAlphaIn, TeardownAction::kZero},
      {kSubnetAlphaOut, TeardownAction::kZero},
      {kSubnetAlphaInEmission, TeardownAction::kRemove},
      {kSubnetAlphaOutEmission, TeardownAction::kRemove},
      {kSubnetTaoInEmission, TeardownAction::kRemove},
      {kSubnetVolume, TeardownAction::kRemove},
      {kSubnetLocked, TeardownAction::kRemove},

      // Keyed collections
      {kKeys, TeardownAction::kClearPrefix},
      {kBonds, TeardownAction::kClearPrefix},
      {kWeights, TeardownAction::kClearPrefix},
      {kIsNetworkMember, TeardownAction::kClearPrefix},
      {kAlpha, TeardownAction::kClearPrefix},
  };
  return kRules;
}

const std::vector<TeardownRule>& LiquidityTeardownRules() {
  static const std::vector<TeardownRule> kRules = {
      {kPositions, TeardownAction::kClearPrefix},
      {kCurrentLiquidity, TeardownAction::kRemove},
      {kFeeGlobalTao, TeardownAction::kRemove},
      {kFeeGlobalAlpha, TeardownAction::kRemove},
      {kTickIndexBitmapWords, TeardownAction::kClearPrefix},
      {kSwapV3Initialized, TeardownAction::kRemove},
      {kEnabledUserLiquidity, TeardownAction::kRemove},
      {kLastPositionId, TeardownAction::kRemove},
  };
  return kRules;
}

void ApplyTeardown(Ledger& ledger, model::NetworkId net, const std::vector<TeardownRule>& rules) {
  for (const auto& rule : rules) {
    switch (rule.action) {
      case TeardownAction::kRemove:
        ledger.Erase(Key(rule.item, net));
        break;
      case TeardownAction::kZero:
        ledger.PutU64(rule.item, net, 0);
        break;
      case TeardownAction::kClearPrefix:
        ledger.ErasePrefix(rule.item, net);
        break;
    }
  }
}

std::string UidSubkey(model::Uid uid) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%05u", static_cast<unsigned>(uid));
  return buf;
}

std::string StakeSubkey(const model::AccountId& hotkey, const model::AccountId& coldkey) {
  return hotkey + "/" + coldkey;
}

std::string PositionSubkey(const model::AccountId& coldkey, uint64_t position_id) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%020llu", static_cast<unsigned long long>(position_id));
  return coldkey + "/" + buf;
}

bool ParseStakeSubkey(const std::string& subkey, model::AccountId* hotkey, model::AccountId* coldkey) {
  const auto sep = subkey.find('/');
  if (sep == std::string::npos) return false;
  *hotkey  = subkey.substr(0, sep);
  *coldkey = subkey.substr(sep + 1);
  return true;
}

} // namespace subnet::storage
