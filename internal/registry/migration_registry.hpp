#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/migration_unit.hpp"

namespace schemaflow::registry {

using UnitPtr = std::shared_ptr<const model::MigrationUnit>;
using IdSet   = std::set<std::string>;

/*
  Validated, immutable DAG of migration units.

  Edges point from a unit to its parents (prior versions). All iteration
  orders are by unit id, so every traversal built on top is deterministic.
*/
class RegisteredGraph {
 public:
  std::size_t Size() const {
    return units_.size();
  }

  bool Contains(std::string_view id) const {
    return units_.find(std::string(id)) != units_.end();
  }

  // nullptr for unknown ids.
  UnitPtr Find(std::string_view id) const;

  // Throws GraphError{UnknownRevision}.
  UnitPtr Get(std::string_view id) const;

  // Sorted by id.
  const std::vector<std::string>& Children(std::string_view id) const;

  std::vector<std::string> Ids() const;
  std::vector<std::string> Roots() const;
  std::vector<std::string> Heads() const;

  // Strict ancestors of the given units (the units themselves excluded
  // unless one is an ancestor of another).
  IdSet Ancestors(const IdSet& ids) const;

  // ids plus all their ancestors.
  IdSet Closure(const IdSet& ids) const;

  // Strict descendants of one unit.
  IdSet Descendants(std::string_view id) const;

  bool IsAncestor(std::string_view ancestor, std::string_view of) const;

  // Exact id or unique id prefix. Throws GraphError{UnknownRevision},
  // listing candidates when the prefix is ambiguous.
  std::string ResolveId(std::string_view ref) const;

 private:
  friend class MigrationRegistry;

  std::map<std::string, UnitPtr>                  units_;
  std::map<std::string, std::vector<std::string>> children_;
};

/*
  Loads a set of units into a RegisteredGraph.

  Validation, in order:
    - no duplicate id, no unit listing the same parent twice  (DuplicateId)
    - every parent id resolves to a loaded unit               (DanglingParent)
    - no unit is its own ancestor                             (Cycle)

  Pure: never touches the target store.
*/
class MigrationRegistry {
 public:
  static RegisteredGraph Load(std::vector<model::MigrationUnit> units);
};

} // namespace schemaflow::registry
