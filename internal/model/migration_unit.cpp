#include "internal/model/migration_unit.hpp"

namespace schemaflow::model {

std::string_view DirectionName(Direction direction) {
  return direction == Direction::kForward ? "upgrade" : "downgrade";
}

MigrationUnit::MigrationUnit(std::string id, std::vector<std::string> parent_ids, std::vector<SchemaOp> forward_ops,
                             std::vector<SchemaOp> backward_ops, std::string description, std::string source)
    : id_(std::move(id)),
      parent_ids_(std::move(parent_ids)),
      forward_ops_(std::move(forward_ops)),
      backward_ops_(std::move(backward_ops)),
      description_(std::move(description)),
      source_(std::move(source)) {
}

} // namespace schemaflow::model
