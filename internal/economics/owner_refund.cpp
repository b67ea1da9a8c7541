#include "internal/economics/owner_refund.hpp"

#include "internal/util/saturating.hpp"

namespace subnet::economics {

using util::FixedU96F32;

FixedU96F32 OwnerCutFraction(uint16_t owner_cut) {
  return FixedU96F32::FromRatio(owner_cut, model::kRatioDenominator);
}

model::Balance OwnerRefund(const OwnerRefundInputs& inputs) {
  const auto fraction    = OwnerCutFraction(inputs.owner_cut);
  const auto owner_alpha = FixedU96F32::FromInt(inputs.total_emission).SaturatingMul(fraction).Floor();
  const auto owner_value = owner_alpha.SaturatingMul(inputs.price).SaturatingToU64();
  return util::SaturatingSub(inputs.lock, owner_value);
}

} // namespace subnet::economics
