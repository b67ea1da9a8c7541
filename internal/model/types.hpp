#pragma once

#include <cstdint>
#include <string>

namespace subnet::model {

using NetworkId   = std::uint16_t;
using Uid         = std::uint16_t;
using AccountId   = std::string;
using BlockNumber = std::uint64_t;

// Base currency ("TAO"), smallest unit.
using Balance = std::uint64_t;

// Network currency ("alpha"), smallest unit.
using AlphaAmount = std::uint64_t;

// Owner cut and other u16 ratios are expressed over this denominator.
inline constexpr std::uint16_t kRatioDenominator = 0xFFFF;

/*
  Stake held on behalf of a coldkey via a hotkey on one network.
  Keyed by (hotkey, coldkey, network).
*/
struct StakePosition {
  AccountId   hotkey;
  AccountId   coldkey;
  NetworkId   network = 0;
  AlphaAmount alpha   = 0;
};

struct NetworkSummary {
  NetworkId   id             = 0;
  AccountId   owner_coldkey;
  AccountId   owner_hotkey;
  BlockNumber registered_at  = 0;
  Balance     subnet_tao     = 0;
  AlphaAmount alpha_in       = 0;
  AlphaAmount alpha_out      = 0;
  Balance     locked         = 0;
  uint64_t    total_emission = 0;
  uint16_t    tempo          = 0;
  uint16_t    subnetwork_n   = 0;
};

} // namespace subnet::model
