#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/migration_unit.hpp"
#include "internal/registry/migration_registry.hpp"

namespace schemaflow::graph {

struct PathStep {
  registry::UnitPtr unit;
  model::Direction  direction;
};

using Path = std::vector<PathStep>;

/*
  Turns the registered DAG plus the applied head set into an ordered
  execution path.

  Revision references:
    head      unique graph head reachable from every current head
    base      the empty state (downgrade only)
    <id>      full id or unique prefix
    +N / -N   N steps along the single-child / first-parent chain

  Forward order is a depth-first post-order over parents sorted by id:
  every unit follows all of its parents, and a merge node's missing
  parent branch is emitted in full before the merge node itself.
  Backward order is the exact reverse.
*/
class GraphResolver {
 public:
  static constexpr std::string_view kHead = "head";
  static constexpr std::string_view kBase = "base";

  explicit GraphResolver(const registry::RegisteredGraph& graph);

  // Units needed to reach target from the applied heads, forward.
  // A target already covered by the applied set yields an empty path.
  Path UpgradePath(const registry::IdSet& current, std::string_view target) const;

  // Applied units that descend from target ("base": all of them),
  // backward. Target must be applied already (NotAnAncestor otherwise).
  Path DowngradePath(const registry::IdSet& current, std::string_view target) const;

  // Path between two single versions ("base" allowed on either side);
  // direction follows from ancestry. from == to is an empty path.
  Path Between(std::string_view from, std::string_view to) const;

  // Target id for a reference; empty string for base.
  std::string ResolveUpgradeTarget(const registry::IdSet& current, std::string_view ref) const;
  std::string ResolveDowngradeTarget(const registry::IdSet& current, std::string_view ref) const;

  // Head set after one step of a path has been applied.
  registry::IdSet NextHeads(const registry::IdSet& current, const PathStep& step) const;

 private:
  std::string ResolveHead(const registry::IdSet& current) const;
  void        CheckKnown(const registry::IdSet& current) const;

  // Forward order of the given units; each unit after all its parents
  // that are also in the set.
  std::vector<std::string> TopologicalOrder(const registry::IdSet& units) const;

  const registry::RegisteredGraph& graph_;
};

} // namespace schemaflow::graph
