#include "internal/lifecycle/eviction_selector.hpp"

#include <tuple>

#include "internal/storage/ledger.hpp"
#include "internal/util/saturating.hpp"

namespace subnet::lifecycle {

std::optional<model::NetworkId> SelectNetworkToPrune(const std::vector<PruneCandidate>& candidates, uint64_t immunity,
                                                     model::BlockNumber now) {
  const PruneCandidate* worst = nullptr;
  for (const auto& candidate : candidates) {
    if (util::SaturatingSub(now, candidate.registered_at) < immunity) {
      continue;
    }
    if (worst == nullptr ||
        std::tie(candidate.total_emission, candidate.registered_at, candidate.id) <
            std::tie(worst->total_emission, worst->registered_at, worst->id)) {
      worst = &candidate;
    }
  }

  if (worst == nullptr) return std::nullopt;
  return worst->id;
}

std::optional<model::NetworkId> NetworkToPrune(const storage::Ledger& ledger) {
  std::vector<PruneCandidate> candidates;
  for (auto net : ledger.Networks()) {
    candidates.push_back(PruneCandidate{
        .id             = net,
        .registered_at  = ledger.RegisteredAt(net),
        .total_emission = ledger.TotalEmission(net),
    });
  }
  return SelectNetworkToPrune(candidates, ledger.NetworkImmunityPeriod(), ledger.CurrentBlock());
}

} // namespace subnet::lifecycle
