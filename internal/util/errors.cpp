#include "internal/util/errors.hpp"

namespace schemaflow::util {

std::string_view GraphErrorKindName(GraphErrorKind kind) {
  switch (kind) {
    case GraphErrorKind::kDuplicateId:
      return "DuplicateId";
    case GraphErrorKind::kDanglingParent:
      return "DanglingParent";
    case GraphErrorKind::kCycle:
      return "Cycle";
    case GraphErrorKind::kMultipleUnmergedHeads:
      return "MultipleUnmergedHeads";
    case GraphErrorKind::kUnknownRevision:
      return "UnknownRevision";
    case GraphErrorKind::kNotAnAncestor:
      return "NotAnAncestor";
  }
  return "GraphError";
}

static std::string FormatExecution(const std::string& unit_id, std::size_t index, const std::string& cause) {
  std::string where = index == ExecutionError::kStateRecord ? "version record" : "operation " + std::to_string(index);
  return "unit " + unit_id + " failed at " + where + ": " + cause;
}

ExecutionError::ExecutionError(std::string unit_id, std::size_t operation_index, std::string cause)
    : std::runtime_error(FormatExecution(unit_id, operation_index, cause)),
      unit_id_(std::move(unit_id)),
      operation_index_(operation_index),
      cause_(std::move(cause)) {
}

} // namespace schemaflow::util
