#include "fixed_point.hpp"

#include <cstdio>
#include <limits>

namespace subnet::util {

namespace {

constexpr uint128_t kFracMask = (uint128_t{1} << FixedU96F32::kFracBits) - 1;

} // namespace

FixedU96F32 FixedU96F32::FromRatio(uint64_t numerator, uint64_t denominator) {
  return FromInt(numerator).SafeDiv(FromInt(denominator));
}

FixedU96F32 FixedU96F32::SaturatingAdd(FixedU96F32 other) const {
  uint128_t sum = 0;
  if (__builtin_add_overflow(raw_, other.raw_, &sum)) {
    return Max();
  }
  return FromRaw(sum);
}

FixedU96F32 FixedU96F32::SaturatingSub(FixedU96F32 other) const {
  return raw_ > other.raw_ ? FromRaw(raw_ - other.raw_) : FixedU96F32{};
}

FixedU96F32 FixedU96F32::SaturatingMul(FixedU96F32 other) const {
  // (a * b) >> 32 without a 256-bit intermediate:
  //   a_hi * b + a_lo * b_hi + ((a_lo * b_lo) >> 32)
  const uint128_t a_hi = raw_ >> kFracBits;
  const uint128_t a_lo = raw_ & kFracMask;
  const uint128_t b_hi = other.raw_ >> kFracBits;
  const uint128_t b_lo = other.raw_ & kFracMask;

  uint128_t high = 0;
  if (__builtin_mul_overflow(a_hi, other.raw_, &high)) {
    return Max();
  }
  const uint128_t middle = a_lo * b_hi;
  const uint128_t low    = (a_lo * b_lo) >> kFracBits;

  uint128_t sum = 0;
  if (__builtin_add_overflow(high, middle, &sum) || __builtin_add_overflow(sum, low, &sum)) {
    return Max();
  }
  return FromRaw(sum);
}

FixedU96F32 FixedU96F32::SafeDiv(FixedU96F32 other) const {
  if (other.raw_ == 0) {
    return FixedU96F32{};
  }

  const uint128_t quotient = raw_ / other.raw_;
  if ((quotient >> (128 - kFracBits)) != 0) {
    return Max();
  }

  // Long division for the fractional bits; the carry covers remainders >= 2^127.
  uint128_t remainder = raw_ % other.raw_;
  uint128_t fraction  = 0;
  for (unsigned i = 0; i < kFracBits; ++i) {
    const bool carry = (remainder >> 127) != 0;
    remainder <<= 1;
    fraction <<= 1;
    if (carry || remainder >= other.raw_) {
      remainder -= other.raw_;
      fraction |= 1;
    }
  }

  return FromRaw((quotient << kFracBits) | fraction);
}

FixedU96F32 FixedU96F32::Floor() const {
  return FromRaw(raw_ & ~kFracMask);
}

uint64_t FixedU96F32::SaturatingToU64() const {
  const uint128_t integer = raw_ >> kFracBits;
  if (integer > std::numeric_limits<uint64_t>::max()) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(integer);
}

double FixedU96F32::ToDouble() const {
  const auto integer  = static_cast<double>(raw_ >> kFracBits);
  const auto fraction = static_cast<double>(static_cast<uint64_t>(raw_ & kFracMask)) / 4294967296.0;
  return integer + fraction;
}

std::string FixedU96F32::ToString() const {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.9f", ToDouble());
  return buffer;
}

} // namespace subnet::util
