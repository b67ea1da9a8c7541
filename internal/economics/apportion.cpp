#include "internal/economics/apportion.hpp"

#include <algorithm>
#include <numeric>

#include "internal/util/fixed_point.hpp"

namespace subnet::economics {

using util::uint128_t;

std::optional<std::vector<model::Balance>> Apportion(model::Balance pot, const std::vector<uint64_t>& weights) {
  // n * 2^64 fits comfortably in 128 bits for any vector we can hold.
  uint128_t total = 0;
  for (auto w : weights) {
    total += w;
  }
  if (total == 0) {
    return std::nullopt;
  }

  std::vector<model::Balance> shares(weights.size(), 0);
  std::vector<uint128_t>      remainders(weights.size(), 0);

  uint128_t distributed = 0;
  for (size_t i = 0; i < weights.size(); ++i) {
    const uint128_t product = static_cast<uint128_t>(pot) * weights[i];
    // w_i <= total, so the quotient is at most pot.
    shares[i]     = static_cast<model::Balance>(product / total);
    remainders[i] = product % total;
    distributed += shares[i];
  }

  auto leftover = static_cast<uint64_t>(static_cast<uint128_t>(pot) - distributed);
  if (leftover == 0) {
    return shares;
  }

  std::vector<size_t> order(weights.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return remainders[a] > remainders[b]; });

  for (size_t k = 0; k < order.size() && leftover > 0; ++k, --leftover) {
    shares[order[k]] += 1;
  }
  return shares;
}

} // namespace subnet::economics
