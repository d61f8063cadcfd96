#include "internal/cli/exit_codes.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using namespace schemaflow::cli;
using namespace schemaflow::util;

void TestGraphAndInputErrors() {
  assert(ToExitCode(GraphError(GraphErrorKind::kCycle, "a -> a")) == kExitGraph);
  assert(ToExitCode(GraphError(GraphErrorKind::kMultipleUnmergedHeads, "b1, b2")) == kExitGraph);
  assert(ToExitCode(UnitFormatError("bad.yaml: unit: missing 'id'")) == kExitGraph);
  assert(ToExitCode(ConfigError("migrations.directory is required")) == kExitGraph);
}

void TestLockContention() {
  assert(ToExitCode(LockError("another migration run holds the lock")) == kExitLock);
}

void TestExecutionFailures() {
  assert(ToExitCode(ExecutionError("3271f7f4e2f2", 2, "no such table: tradingorder")) == kExitExecution);
  assert(ToExitCode(OperationError("cannot open sqlite database")) == kExitExecution);
  assert(ToExitCode(IdempotencyConflict("add_column tradingorder.status")) == kExitExecution);
}

void TestCancellation() {
  assert(ToExitCode(Cancelled("cee392a8acc3")) == kExitCancelled);
}

void TestAnythingElseIsGeneric() {
  assert(ToExitCode(std::runtime_error("boom")) == kExitUsage);
  assert(ToExitCode(std::logic_error("bug")) == kExitUsage);
}

void TestExecutionErrorCarriesLocation() {
  ExecutionError e("3271f7f4e2f2", 1, "constraint failed");
  assert(e.UnitId() == "3271f7f4e2f2");
  assert(e.OperationIndex() == 1);
  assert(e.Cause() == "constraint failed");

  ExecutionError record("3271f7f4e2f2", ExecutionError::kStateRecord, "disk I/O error");
  assert(record.OperationIndex() == ExecutionError::kStateRecord);
}

} // namespace

int main() {
  TestGraphAndInputErrors();
  TestLockContention();
  TestExecutionFailures();
  TestCancellation();
  TestAnythingElseIsGeneric();
  TestExecutionErrorCarriesLocation();

  std::cout << "schemaflow_unit_exit_codes: pass\n";
  return 0;
}
