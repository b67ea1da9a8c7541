#include "internal/economics/lock_cost.hpp"

#include <algorithm>

#include "internal/util/saturating.hpp"

namespace subnet::economics {

model::Balance LockCost(const LockCostInputs& in) {
  const uint64_t multiplier = in.last_lock_block == 0 ? 1 : 2;
  const auto     doubled    = util::SaturatingMul(in.last_lock, multiplier);

  const uint64_t per_block = in.reduction_interval == 0 ? 0 : in.last_lock / in.reduction_interval;
  const auto     elapsed   = util::SaturatingSub(in.now, in.last_lock_block);
  const auto     reduction = util::SaturatingMul(per_block, elapsed);

  return std::max(in.min_lock, util::SaturatingSub(doubled, reduction));
}

} // namespace subnet::economics
