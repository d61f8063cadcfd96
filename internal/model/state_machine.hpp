#pragma once

#include <cstdint>
#include <string_view>

namespace schemaflow::model {

/*
  Per-unit state during one run.

    forward:  Pending -> Applying  -> Applied
    backward: Pending -> Reverting -> Reverted
    failure:  Applying | Reverting -> Failed

  Failed is terminal for the run; nothing retries a unit automatically.
*/
enum class UnitState : std::uint8_t {
  kPending   = 0,
  kApplying  = 1,
  kReverting = 2,
  kApplied   = 3,
  kReverted  = 4,
  kFailed    = 5,
};

constexpr bool IsTerminal(UnitState state) {
  return state == UnitState::kApplied || state == UnitState::kReverted || state == UnitState::kFailed;
}

constexpr bool CanTransition(UnitState from, UnitState to) {
  switch (from) {
    case UnitState::kPending:
      return to == UnitState::kApplying || to == UnitState::kReverting;
    case UnitState::kApplying:
      return to == UnitState::kApplied || to == UnitState::kFailed;
    case UnitState::kReverting:
      return to == UnitState::kReverted || to == UnitState::kFailed;
    case UnitState::kApplied:
    case UnitState::kReverted:
    case UnitState::kFailed:
      return false;
  }
  return false;
}

constexpr std::string_view UnitStateName(UnitState state) {
  switch (state) {
    case UnitState::kPending:
      return "pending";
    case UnitState::kApplying:
      return "applying";
    case UnitState::kReverting:
      return "reverting";
    case UnitState::kApplied:
      return "applied";
    case UnitState::kReverted:
      return "reverted";
    case UnitState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace schemaflow::model
