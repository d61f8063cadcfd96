#include "internal/registry/migration_registry.hpp"

#include <stack>
#include <utility>

#include "internal/util/errors.hpp"

namespace schemaflow::registry {

using util::GraphError;
using util::GraphErrorKind;

namespace {

const std::vector<std::string> kNoChildren;

enum class Mark : std::uint8_t { kWhite, kGray, kBlack };

} // namespace

// ------------------------------------------------------------
// RegisteredGraph
// ------------------------------------------------------------

UnitPtr RegisteredGraph::Find(std::string_view id) const {
  auto it = units_.find(std::string(id));
  return it == units_.end() ? nullptr : it->second;
}

UnitPtr RegisteredGraph::Get(std::string_view id) const {
  auto unit = Find(id);
  if (!unit) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "no unit with id '" + std::string(id) + "'");
  }
  return unit;
}

const std::vector<std::string>& RegisteredGraph::Children(std::string_view id) const {
  auto it = children_.find(std::string(id));
  return it == children_.end() ? kNoChildren : it->second;
}

std::vector<std::string> RegisteredGraph::Ids() const {
  std::vector<std::string> out;
  out.reserve(units_.size());
  for (const auto& [id, _] : units_) out.push_back(id);
  return out;
}

std::vector<std::string> RegisteredGraph::Roots() const {
  std::vector<std::string> out;
  for (const auto& [id, unit] : units_) {
    if (unit->IsRoot()) out.push_back(id);
  }
  return out;
}

std::vector<std::string> RegisteredGraph::Heads() const {
  std::vector<std::string> out;
  for (const auto& [id, _] : units_) {
    if (Children(id).empty()) out.push_back(id);
  }
  return out;
}

IdSet RegisteredGraph::Ancestors(const IdSet& ids) const {
  IdSet                   seen;
  std::stack<std::string> pending;
  for (const auto& id : ids) {
    for (const auto& parent : Get(id)->ParentIds()) pending.push(parent);
  }

  while (!pending.empty()) {
    auto id = std::move(pending.top());
    pending.pop();
    if (!seen.insert(id).second) continue;
    for (const auto& parent : Get(id)->ParentIds()) pending.push(parent);
  }
  return seen;
}

IdSet RegisteredGraph::Closure(const IdSet& ids) const {
  auto out = Ancestors(ids);
  out.insert(ids.begin(), ids.end());
  return out;
}

IdSet RegisteredGraph::Descendants(std::string_view id) const {
  IdSet                   seen;
  std::stack<std::string> pending;
  for (const auto& child : Children(id)) pending.push(child);

  while (!pending.empty()) {
    auto next = std::move(pending.top());
    pending.pop();
    if (!seen.insert(next).second) continue;
    for (const auto& child : Children(next)) pending.push(child);
  }
  return seen;
}

bool RegisteredGraph::IsAncestor(std::string_view ancestor, std::string_view of) const {
  return Ancestors({std::string(of)}).count(std::string(ancestor)) > 0;
}

std::string RegisteredGraph::ResolveId(std::string_view ref) const {
  if (Contains(ref)) return std::string(ref);

  std::vector<std::string> candidates;
  for (auto it = units_.lower_bound(std::string(ref)); it != units_.end() && it->first.compare(0, ref.size(), ref) == 0; ++it) {
    candidates.push_back(it->first);
  }

  if (candidates.size() == 1) return candidates.front();

  if (candidates.empty() || ref.empty()) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "unknown revision '" + std::string(ref) + "'");
  }

  std::string listed;
  for (const auto& c : candidates) {
    if (!listed.empty()) listed += ", ";
    listed += c;
  }
  throw GraphError(GraphErrorKind::kUnknownRevision, "ambiguous revision '" + std::string(ref) + "' matches " + listed);
}

// ------------------------------------------------------------
// MigrationRegistry
// ------------------------------------------------------------

RegisteredGraph MigrationRegistry::Load(std::vector<model::MigrationUnit> units) {
  RegisteredGraph graph;

  for (auto& unit : units) {
    IdSet parents;
    for (const auto& parent : unit.ParentIds()) {
      if (!parents.insert(parent).second) {
        throw GraphError(GraphErrorKind::kDuplicateId, "unit " + unit.Id() + " lists parent " + parent + " twice");
      }
    }

    auto id  = unit.Id();
    auto ptr = std::make_shared<const model::MigrationUnit>(std::move(unit));
    if (!graph.units_.emplace(id, std::move(ptr)).second) {
      throw GraphError(GraphErrorKind::kDuplicateId, "duplicate unit id " + id);
    }
  }

  for (const auto& [id, unit] : graph.units_) {
    for (const auto& parent : unit->ParentIds()) {
      if (parent == id) {
        throw GraphError(GraphErrorKind::kCycle, "unit " + id + " lists itself as parent");
      }
      if (!graph.Contains(parent)) {
        throw GraphError(GraphErrorKind::kDanglingParent, "unit " + id + " references unknown parent " + parent);
      }
      graph.children_[parent].push_back(id);
    }
  }
  // units_ iterates by id, so every children list is already sorted.

  // Iterative three-colour DFS along parent edges.
  std::map<std::string, Mark> marks;
  for (const auto& [id, _] : graph.units_) marks[id] = Mark::kWhite;

  for (const auto& [start, _] : graph.units_) {
    if (marks[start] != Mark::kWhite) continue;

    std::stack<std::pair<std::string, std::size_t>> frames;
    frames.emplace(start, 0);
    marks[start] = Mark::kGray;

    while (!frames.empty()) {
      auto& [id, next] = frames.top();
      const auto& parents = graph.units_.at(id)->ParentIds();

      if (next == parents.size()) {
        marks[id] = Mark::kBlack;
        frames.pop();
        continue;
      }

      const std::string parent = parents[next++];
      if (marks[parent] == Mark::kGray) {
        throw GraphError(GraphErrorKind::kCycle, "unit " + parent + " is its own ancestor (via " + id + ")");
      }
      if (marks[parent] == Mark::kWhite) {
        marks[parent] = Mark::kGray;
        frames.emplace(parent, 0);
      }
    }
  }

  return graph;
}

} // namespace schemaflow::registry
