#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace subnet::util {

using uint128_t = unsigned __int128;

/*
  Unsigned fixed-point number: 96 integer bits, 32 fractional bits.

  Every operation truncates toward zero and saturates at the representable
  maximum. Nothing here throws, so callers on the teardown path can rely on
  arithmetic being total.
*/
class FixedU96F32 {
 public:
  static constexpr unsigned kFracBits = 32;

  constexpr FixedU96F32() = default;

  static constexpr FixedU96F32 FromRaw(uint128_t raw) {
    FixedU96F32 value;
    value.raw_ = raw;
    return value;
  }

  static constexpr FixedU96F32 FromInt(uint64_t value) {
    return FromRaw(static_cast<uint128_t>(value) << kFracBits);
  }

  static constexpr FixedU96F32 Max() {
    return FromRaw(~uint128_t{0});
  }

  // numerator / denominator; zero when the denominator is zero.
  static FixedU96F32 FromRatio(uint64_t numerator, uint64_t denominator);

  constexpr uint128_t Raw() const {
    return raw_;
  }

  constexpr bool IsZero() const {
    return raw_ == 0;
  }

  FixedU96F32 SaturatingAdd(FixedU96F32 other) const;
  FixedU96F32 SaturatingSub(FixedU96F32 other) const;
  FixedU96F32 SaturatingMul(FixedU96F32 other) const;

  // Division by zero yields zero.
  FixedU96F32 SafeDiv(FixedU96F32 other) const;

  FixedU96F32 Floor() const;

  // Integer part, clamped to uint64 range.
  uint64_t SaturatingToU64() const;

  double      ToDouble() const;
  std::string ToString() const;

  constexpr auto operator<=>(const FixedU96F32&) const = default;

 private:
  uint128_t raw_ = 0;
};

} // namespace subnet::util
