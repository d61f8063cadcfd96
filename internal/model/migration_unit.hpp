#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/schema_op.hpp"

namespace schemaflow::model {

enum class Direction : std::uint8_t {
  kForward,
  kBackward,
};

std::string_view DirectionName(Direction direction);

/*
  One versioned, reversible schema change step.

  parent_ids is an ordered set: empty for a root, one entry for a normal
  step, two or more for a merge node. Descriptors are immutable once
  constructed; the registry validates them as a whole graph.
*/
class MigrationUnit {
 public:
  MigrationUnit(std::string id, std::vector<std::string> parent_ids, std::vector<SchemaOp> forward_ops, std::vector<SchemaOp> backward_ops,
                std::string description = {}, std::string source = {});

  const std::string& Id() const {
    return id_;
  }
  const std::vector<std::string>& ParentIds() const {
    return parent_ids_;
  }
  const std::vector<SchemaOp>& ForwardOps() const {
    return forward_ops_;
  }
  const std::vector<SchemaOp>& BackwardOps() const {
    return backward_ops_;
  }
  const std::vector<SchemaOp>& Ops(Direction direction) const {
    return direction == Direction::kForward ? forward_ops_ : backward_ops_;
  }
  const std::string& Description() const {
    return description_;
  }
  // File the unit was loaded from; empty for units built in code.
  const std::string& Source() const {
    return source_;
  }

  bool IsRoot() const {
    return parent_ids_.empty();
  }
  bool IsMerge() const {
    return parent_ids_.size() > 1;
  }

 private:
  std::string              id_;
  std::vector<std::string> parent_ids_;
  std::vector<SchemaOp>    forward_ops_;
  std::vector<SchemaOp>    backward_ops_;
  std::string              description_;
  std::string              source_;
};

} // namespace schemaflow::model
