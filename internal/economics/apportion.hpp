#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/types.hpp"

namespace subnet::economics {

/*
  Largest remainder apportionment.

  Splits `pot` across claimants in proportion to `weights`:
    base_i  = floor(pot * w_i / W)
    leftover units (pot - sum(base)) go one each to the largest remainders
    (pot * w_i) mod W. Equal remainders keep input order.

  The result has one share per weight and always sums to `pot` exactly.
  Returns nullopt when the total weight is zero; the caller decides where such
  a pot goes.
*/
std::optional<std::vector<model::Balance>> Apportion(model::Balance pot, const std::vector<uint64_t>& weights);

} // namespace subnet::economics
