#pragma once

#include "internal/model/types.hpp"

namespace subnet::economics {

struct LockCostInputs {
  model::Balance     last_lock          = 0;
  model::BlockNumber last_lock_block    = 0;
  model::Balance     min_lock           = 0;
  uint64_t           reduction_interval = 0;
  model::BlockNumber now                = 0;
};

/*
  Registration price. Doubles the previous lock, then decays linearly back
  over `reduction_interval` blocks; never below `min_lock`. Before the first
  registration (last_lock_block == 0) the multiplier is 1.
*/
model::Balance LockCost(const LockCostInputs& inputs);

} // namespace subnet::economics
