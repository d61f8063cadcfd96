#include "internal/graph/graph_resolver.hpp"

#include <algorithm>
#include <charconv>
#include <stack>

#include "internal/util/errors.hpp"

namespace schemaflow::graph {

using registry::IdSet;
using util::GraphError;
using util::GraphErrorKind;

namespace {

std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ", ";
    out += id;
  }
  return out;
}

// "+3" -> 3, "-2" -> -2; 0 when ref is not relative.
int ParseRelative(std::string_view ref) {
  if (ref.size() < 2 || (ref[0] != '+' && ref[0] != '-')) return 0;
  int  steps = 0;
  auto res   = std::from_chars(ref.data() + 1, ref.data() + ref.size(), steps);
  if (res.ec != std::errc() || res.ptr != ref.data() + ref.size() || steps <= 0) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "bad relative revision '" + std::string(ref) + "'");
  }
  return ref[0] == '+' ? steps : -steps;
}

std::string SingleHead(const IdSet& current, std::string_view ref) {
  if (current.size() > 1) {
    throw GraphError(GraphErrorKind::kMultipleUnmergedHeads,
                     "'" + std::string(ref) + "' needs a single current head, have " + JoinIds({current.begin(), current.end()}));
  }
  return current.empty() ? std::string() : *current.begin();
}

} // namespace

GraphResolver::GraphResolver(const registry::RegisteredGraph& graph) : graph_(graph) {
}

void GraphResolver::CheckKnown(const IdSet& current) const {
  for (const auto& id : current) {
    if (!graph_.Contains(id)) {
      throw GraphError(GraphErrorKind::kUnknownRevision, "recorded version " + id + " is not in the migrations directory");
    }
  }
}

std::string GraphResolver::ResolveHead(const IdSet& current) const {
  std::vector<std::string> candidates;
  for (const auto& head : graph_.Heads()) {
    const auto closure = graph_.Closure({head});
    if (std::all_of(current.begin(), current.end(), [&](const std::string& id) { return closure.count(id) > 0; })) {
      candidates.push_back(head);
    }
  }

  if (candidates.size() == 1) return candidates.front();
  if (candidates.empty() && graph_.Size() == 0) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "no migration units registered");
  }

  const auto heads = candidates.empty() ? graph_.Heads() : candidates;
  throw GraphError(GraphErrorKind::kMultipleUnmergedHeads, "more than one head: " + JoinIds(heads));
}

std::string GraphResolver::ResolveUpgradeTarget(const IdSet& current, std::string_view ref) const {
  CheckKnown(current);

  if (ref == kHead) return ResolveHead(current);
  if (ref == kBase) return {};

  const int steps = ParseRelative(ref);
  if (steps < 0) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "'" + std::string(ref) + "' is a downgrade reference");
  }
  if (steps == 0) return graph_.ResolveId(ref);

  std::string at = SingleHead(current, ref);
  for (int i = 0; i < steps; ++i) {
    const auto next = at.empty() ? graph_.Roots() : graph_.Children(at);
    if (next.empty()) {
      throw GraphError(GraphErrorKind::kUnknownRevision, "'" + std::string(ref) + "' moves past head");
    }
    if (next.size() > 1) {
      throw GraphError(GraphErrorKind::kMultipleUnmergedHeads, "'" + std::string(ref) + "' is ambiguous at " + (at.empty() ? "base" : at) +
                                                                   ": " + JoinIds(next));
    }
    at = next.front();
  }
  return at;
}

std::string GraphResolver::ResolveDowngradeTarget(const IdSet& current, std::string_view ref) const {
  CheckKnown(current);

  if (ref == kBase) return {};
  if (ref == kHead) return ResolveHead(current);

  const int steps = ParseRelative(ref);
  if (steps > 0) {
    throw GraphError(GraphErrorKind::kUnknownRevision, "'" + std::string(ref) + "' is an upgrade reference");
  }
  if (steps == 0) return graph_.ResolveId(ref);

  std::string at = SingleHead(current, ref);
  for (int i = 0; i < -steps; ++i) {
    if (at.empty()) {
      throw GraphError(GraphErrorKind::kUnknownRevision, "'" + std::string(ref) + "' moves past base");
    }
    const auto& parents = graph_.Get(at)->ParentIds();
    at                  = parents.empty() ? std::string() : parents.front();
  }
  return at;
}

std::vector<std::string> GraphResolver::TopologicalOrder(const IdSet& units) const {
  std::vector<std::string> order;
  IdSet                    done;

  // Iterative post-order DFS along parent edges, parents visited by id.
  for (const auto& start : units) {
    if (done.count(start)) continue;

    std::stack<std::pair<std::string, std::vector<std::string>>> frames;
    auto                                                         parents_of = [&](const std::string& id) {
      auto parents = graph_.Get(id)->ParentIds();
      std::sort(parents.begin(), parents.end());
      // reversed so pop_back yields the smallest id first
      std::reverse(parents.begin(), parents.end());
      return parents;
    };
    frames.emplace(start, parents_of(start));
    done.insert(start);

    while (!frames.empty()) {
      auto& [id, pending] = frames.top();
      if (pending.empty()) {
        order.push_back(id);
        frames.pop();
        continue;
      }
      std::string parent = std::move(pending.back());
      pending.pop_back();
      if (!units.count(parent) || done.count(parent)) continue;
      done.insert(parent);
      frames.emplace(parent, parents_of(parent));
    }
  }
  return order;
}

Path GraphResolver::UpgradePath(const IdSet& current, std::string_view target) const {
  const auto target_id = ResolveUpgradeTarget(current, target);
  if (target_id.empty()) return {};

  const auto applied = graph_.Closure(current);
  IdSet      needed;
  for (const auto& id : graph_.Closure({target_id})) {
    if (!applied.count(id)) needed.insert(id);
  }

  Path path;
  for (const auto& id : TopologicalOrder(needed)) {
    path.push_back({graph_.Get(id), model::Direction::kForward});
  }
  return path;
}

Path GraphResolver::DowngradePath(const IdSet& current, std::string_view target) const {
  const auto target_id = ResolveDowngradeTarget(current, target);
  const auto applied   = graph_.Closure(current);

  IdSet revert;
  if (target_id.empty()) {
    revert = applied;
  } else {
    if (!applied.count(target_id)) {
      throw GraphError(GraphErrorKind::kNotAnAncestor, target_id + " is not applied; cannot downgrade to it");
    }
    for (const auto& id : graph_.Descendants(target_id)) {
      if (applied.count(id)) revert.insert(id);
    }
  }

  auto order = TopologicalOrder(revert);
  std::reverse(order.begin(), order.end());

  Path path;
  for (const auto& id : order) {
    path.push_back({graph_.Get(id), model::Direction::kBackward});
  }
  return path;
}

Path GraphResolver::Between(std::string_view from, std::string_view to) const {
  IdSet from_set;
  if (from != kBase) from_set.insert(graph_.ResolveId(from));

  const auto to_id = to == kBase ? std::string() : graph_.ResolveId(to);
  if (from_set.empty() && to_id.empty()) return {};
  if (!to_id.empty() && from_set.count(to_id)) return {};

  if (to_id.empty() || graph_.Closure(from_set).count(to_id)) {
    return DowngradePath(from_set, to_id.empty() ? kBase : std::string_view(to_id));
  }
  if (from_set.empty() || graph_.IsAncestor(*from_set.begin(), to_id)) {
    return UpgradePath(from_set, to_id);
  }
  throw GraphError(GraphErrorKind::kNotAnAncestor, std::string(from) + " and " + to_id + " are on different branches");
}

IdSet GraphResolver::NextHeads(const IdSet& current, const PathStep& step) const {
  const auto& id = step.unit->Id();

  if (step.direction == model::Direction::kForward) {
    const auto ancestors = graph_.Ancestors({id});
    IdSet      next;
    for (const auto& head : current) {
      if (!ancestors.count(head)) next.insert(head);
    }
    next.insert(id);
    return next;
  }

  IdSet next = current;
  next.erase(id);
  const auto covered = graph_.Closure(next);
  for (const auto& parent : step.unit->ParentIds()) {
    if (!covered.count(parent)) next.insert(parent);
  }
  return next;
}

} // namespace schemaflow::graph
