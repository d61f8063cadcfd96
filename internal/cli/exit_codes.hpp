#pragma once

#include <exception>

#include "internal/util/errors.hpp"

namespace schemaflow::cli {

/*
  Process exit codes of the schemaflow command.
*/
enum ExitCode : int {
  kExitOk        = 0,
  kExitUsage     = 1,
  kExitGraph     = 2, // graph, unit format or config error
  kExitLock      = 3,
  kExitExecution = 4, // operation failure or idempotency conflict
  kExitCancelled = 5,
};

/*
  Converts internal exceptions into exit codes.
*/
int ToExitCode(const std::exception& e);

} // namespace schemaflow::cli
