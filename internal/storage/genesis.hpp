#pragma once

#include <cstdint>

#include "internal/db/api/repository.hpp"

namespace subnet::runtime::config {
class NetworkConfig;
}

namespace subnet::storage {

inline constexpr uint64_t kDefaultSubnetLimit           = 128;
inline constexpr uint64_t kDefaultNetworkImmunityPeriod = 7200;
inline constexpr uint64_t kDefaultMinLockCost           = 1'000'000'000'000;
inline constexpr uint64_t kDefaultLockReductionInterval = 100'800;
inline constexpr uint16_t kDefaultOwnerCut              = 11'796;

/*
  Hyper-parameters written for every newly registered network.
*/
struct NetworkDefaults {
  uint64_t tempo               = 360;
  uint64_t max_allowed_uids    = 256;
  uint64_t immunity_period     = 4096;
  uint64_t activity_cutoff     = 5000;
  uint64_t difficulty          = 10'000'000;
  uint64_t kappa               = 32'767;
  uint64_t max_weights_limit   = 65'535;
  uint64_t min_allowed_weights = 1;
};

// Zero config values fall back to the built-in defaults.
NetworkDefaults DefaultsFromConfig(const subnet::runtime::config::NetworkConfig& config);

/*
  Writes global network parameters and opening balances not yet present. Returns the
  number of cells written; an initialised store yields 0. On an empty store every
  registered migration is also marked as run.
*/
int ApplyGenesis(db::Repository& repository, const subnet::runtime::config::NetworkConfig& config);

} // namespace subnet::storage
