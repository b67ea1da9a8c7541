#pragma once

#include <optional>
#include <vector>

#include "internal/model/types.hpp"

namespace subnet::storage {
class Ledger;
}

namespace subnet::lifecycle {

struct PruneCandidate {
  model::NetworkId   id             = 0;
  model::BlockNumber registered_at  = 0;
  uint64_t           total_emission = 0;
};

/*
  Networks younger than `immunity` blocks are never chosen. Among the rest the
  lowest total emission loses; on equal emission the earlier registration
  loses, then the lower id.
*/
std::optional<model::NetworkId> SelectNetworkToPrune(const std::vector<PruneCandidate>& candidates, uint64_t immunity,
                                                     model::BlockNumber now);

// Applies the selector to every live network in the ledger.
std::optional<model::NetworkId> NetworkToPrune(const storage::Ledger& ledger);

} // namespace subnet::lifecycle
