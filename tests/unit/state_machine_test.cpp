#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using schemaflow::model::CanTransition;
using schemaflow::model::IsTerminal;
using schemaflow::model::UnitState;
using schemaflow::model::UnitStateName;

void TestForwardLifecycle() {
  assert(CanTransition(UnitState::kPending, UnitState::kApplying));
  assert(CanTransition(UnitState::kApplying, UnitState::kApplied));
  assert(CanTransition(UnitState::kApplying, UnitState::kFailed));
  assert(!CanTransition(UnitState::kApplying, UnitState::kReverted));
}

void TestBackwardLifecycle() {
  assert(CanTransition(UnitState::kPending, UnitState::kReverting));
  assert(CanTransition(UnitState::kReverting, UnitState::kReverted));
  assert(CanTransition(UnitState::kReverting, UnitState::kFailed));
  assert(!CanTransition(UnitState::kReverting, UnitState::kApplied));
}

void TestNoShortcuts() {
  assert(!CanTransition(UnitState::kPending, UnitState::kApplied));
  assert(!CanTransition(UnitState::kPending, UnitState::kReverted));
  assert(!CanTransition(UnitState::kPending, UnitState::kFailed));
}

void TestTerminalStatesAreFinal() {
  for (auto from : {UnitState::kApplied, UnitState::kReverted, UnitState::kFailed}) {
    assert(IsTerminal(from));
    for (auto to : {UnitState::kPending, UnitState::kApplying, UnitState::kReverting, UnitState::kApplied, UnitState::kReverted,
                    UnitState::kFailed}) {
      assert(!CanTransition(from, to));
    }
  }
  assert(!IsTerminal(UnitState::kPending));
  assert(!IsTerminal(UnitState::kApplying));
}

void TestNames() {
  static_assert(UnitStateName(UnitState::kApplied) == "applied");
  assert(UnitStateName(UnitState::kReverting) == "reverting");
  assert(UnitStateName(UnitState::kFailed) == "failed");
}

} // namespace

int main() {
  TestForwardLifecycle();
  TestBackwardLifecycle();
  TestNoShortcuts();
  TestTerminalStatesAreFinal();
  TestNames();

  std::cout << "schemaflow_unit_state_machine: pass\n";
  return 0;
}
