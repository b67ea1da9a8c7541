#pragma once

#include <cstdint>
#include <string_view>

namespace subnet::model {

/*
  Settlement progression for one dissolved network.

  Requested -> Validated -> Liquidated -> Apportioned -> Credited -> Purged -> Done
  Rejected is reachable only from Requested and leaves storage untouched.
*/
enum class SettlementState : std::uint8_t {
  kRequested   = 0,
  kValidated   = 1,
  kLiquidated  = 2,
  kApportioned = 3,
  kCredited    = 4,
  kPurged      = 5,
  kDone        = 6,
  kRejected    = 7,
};

constexpr bool IsTerminal(SettlementState state) {
  return state == SettlementState::kDone || state == SettlementState::kRejected;
}

constexpr bool CanTransition(SettlementState from, SettlementState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SettlementState::kRejected) {
    return from == SettlementState::kRequested;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(SettlementState state) {
  switch (state) {
    case SettlementState::kRequested:
      return "requested";
    case SettlementState::kValidated:
      return "validated";
    case SettlementState::kLiquidated:
      return "liquidated";
    case SettlementState::kApportioned:
      return "apportioned";
    case SettlementState::kCredited:
      return "credited";
    case SettlementState::kPurged:
      return "purged";
    case SettlementState::kDone:
      return "done";
    case SettlementState::kRejected:
      return "rejected";
  }
  return "unknown";
}

} // namespace subnet::model
