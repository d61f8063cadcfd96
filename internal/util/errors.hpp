#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace schemaflow::util {

/*
  Central error types.

  These get translated later to CLI exit codes (internal/cli/exit_codes).
  Driver errors (sqlite3, pqxx) never cross the db::Connection boundary;
  they arrive here as OperationError.
*/

enum class GraphErrorKind {
  kDuplicateId,
  kDanglingParent,
  kCycle,
  kMultipleUnmergedHeads,
  kUnknownRevision,
  kNotAnAncestor,
};

std::string_view GraphErrorKindName(GraphErrorKind kind);

// Structural problem in the unit graph or in a revision reference.
// Always raised before any DDL executes.
class GraphError : public std::runtime_error {
 public:
  GraphError(GraphErrorKind kind, const std::string& msg)
      : std::runtime_error(std::string(GraphErrorKindName(kind)) + ": " + msg), kind_(kind) {
  }

  GraphErrorKind Kind() const {
    return kind_;
  }

 private:
  GraphErrorKind kind_;
};

class LockError : public std::runtime_error {
 public:
  explicit LockError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A DDL or catalog statement failed in the backend.
class OperationError : public std::runtime_error {
 public:
  explicit OperationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Live schema matches neither the pre- nor the post-condition of an operation.
class IdempotencyConflict : public std::runtime_error {
 public:
  explicit IdempotencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Failure of one unit during a run.

  operation_index is the position inside the unit's forward or backward
  list, or kStateRecord when every operation succeeded but recording the
  new version failed.
*/
class ExecutionError : public std::runtime_error {
 public:
  static constexpr std::size_t kStateRecord = static_cast<std::size_t>(-1);

  ExecutionError(std::string unit_id, std::size_t operation_index, std::string cause);

  const std::string& UnitId() const {
    return unit_id_;
  }
  std::size_t OperationIndex() const {
    return operation_index_;
  }
  const std::string& Cause() const {
    return cause_;
  }

 private:
  std::string unit_id_;
  std::size_t operation_index_;
  std::string cause_;
};

class UnitFormatError : public std::runtime_error {
 public:
  explicit UnitFormatError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Run stopped on request before the named unit was started.
class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(std::string unit_id) : std::runtime_error("run cancelled before unit " + unit_id), unit_id_(std::move(unit_id)) {
  }

  const std::string& UnitId() const {
    return unit_id_;
  }

 private:
  std::string unit_id_;
};

} // namespace schemaflow::util
