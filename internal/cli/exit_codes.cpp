#include "exit_codes.hpp"

namespace schemaflow::cli {

int ToExitCode(const std::exception& e) {
  using namespace schemaflow::util;

  if (dynamic_cast<const GraphError*>(&e) || dynamic_cast<const UnitFormatError*>(&e) || dynamic_cast<const ConfigError*>(&e)) {
    return kExitGraph;
  }
  if (dynamic_cast<const LockError*>(&e)) {
    return kExitLock;
  }
  if (dynamic_cast<const ExecutionError*>(&e) || dynamic_cast<const OperationError*>(&e) || dynamic_cast<const IdempotencyConflict*>(&e)) {
    return kExitExecution;
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return kExitCancelled;
  }

  return kExitUsage;
}

} // namespace schemaflow::cli
