#pragma once

#include <cstdint>

#include "internal/model/types.hpp"
#include "internal/util/fixed_point.hpp"

namespace subnet::economics {

struct OwnerRefundInputs {
  model::Balance    lock           = 0; // owner's original deposit
  uint64_t          total_emission = 0; // alpha emitted since registration
  uint16_t          owner_cut      = 0; // numerator over kRatioDenominator
  util::FixedU96F32 price;              // alpha -> TAO
};

// owner_cut / 65535 as a fixed-point fraction in [0, 1].
util::FixedU96F32 OwnerCutFraction(uint16_t owner_cut);

/*
  Portion of the lock still owed to the owner:

    owner_alpha = floor(E * f)
    owner_value = floor(owner_alpha * price)
    refund      = lock - owner_value, clamped at 0

  Always within [0, lock].
*/
model::Balance OwnerRefund(const OwnerRefundInputs& inputs);

} // namespace subnet::economics
