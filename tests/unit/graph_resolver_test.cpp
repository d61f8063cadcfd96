#include "internal/graph/graph_resolver.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using schemaflow::graph::GraphResolver;
using schemaflow::graph::Path;
using schemaflow::model::Direction;
using schemaflow::model::MigrationUnit;
using schemaflow::registry::IdSet;
using schemaflow::registry::MigrationRegistry;
using schemaflow::registry::RegisteredGraph;
using schemaflow::util::GraphError;
using schemaflow::util::GraphErrorKind;

MigrationUnit Unit(const std::string& id, std::vector<std::string> parents = {}) {
  return MigrationUnit(id, std::move(parents), {}, {});
}

std::vector<std::string> Ids(const Path& path) {
  std::vector<std::string> out;
  for (const auto& step : path) out.push_back(step.unit->Id());
  return out;
}

template <typename Fn>
GraphErrorKind FailureOf(Fn&& fn) {
  try {
    fn();
  } catch (const GraphError& e) {
    return e.Kind();
  }
  assert(false && "expected a GraphError");
  return GraphErrorKind::kUnknownRevision;
}

// Every unit appears after all of its parents that are on the path.
void AssertParentsFirst(const RegisteredGraph& graph, const Path& path) {
  std::map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < path.size(); ++i) position[path[i].unit->Id()] = i;
  for (const auto& step : path) {
    for (const auto& parent : graph.Get(step.unit->Id())->ParentIds()) {
      auto it = position.find(parent);
      if (it != position.end()) assert(it->second < position[step.unit->Id()]);
    }
  }
}

// A -> B -> C
RegisteredGraph Linear() {
  return MigrationRegistry::Load({Unit("a"), Unit("b", {"a"}), Unit("c", {"b"})});
}

// A -> {B1, B2} -> M
RegisteredGraph Diamond() {
  return MigrationRegistry::Load({Unit("a"), Unit("b1", {"a"}), Unit("b2", {"a"}), Unit("m", {"b1", "b2"})});
}

void TestLinearUpgradeFromBase() {
  auto          graph = Linear();
  GraphResolver resolver(graph);

  auto path = resolver.UpgradePath({}, GraphResolver::kHead);
  assert((Ids(path) == std::vector<std::string>{"a", "b", "c"}));
  for (const auto& step : path) assert(step.direction == Direction::kForward);
}

void TestLinearUpgradeFromMiddle() {
  auto          graph = Linear();
  GraphResolver resolver(graph);

  assert((Ids(resolver.UpgradePath({"a"}, "head")) == std::vector<std::string>{"b", "c"}));
  assert((Ids(resolver.UpgradePath({"a"}, "b")) == std::vector<std::string>{"b"}));
  assert(resolver.UpgradePath({"c"}, "head").empty());
  // Target already applied.
  assert(resolver.UpgradePath({"c"}, "a").empty());
}

void TestLinearDowngrade() {
  auto          graph = Linear();
  GraphResolver resolver(graph);

  auto path = resolver.DowngradePath({"c"}, "a");
  assert((Ids(path) == std::vector<std::string>{"c", "b"}));
  for (const auto& step : path) assert(step.direction == Direction::kBackward);

  assert((Ids(resolver.DowngradePath({"c"}, "base")) == std::vector<std::string>{"c", "b", "a"}));
  assert(resolver.DowngradePath({"c"}, "c").empty());
  assert(resolver.DowngradePath({}, "base").empty());
}

void TestDowngradeToUnappliedTargetFails() {
  auto          graph = Linear();
  GraphResolver resolver(graph);
  assert(FailureOf([&] { (void)resolver.DowngradePath({"a"}, "c"); }) == GraphErrorKind::kNotAnAncestor);
}

void TestMergeUpgradeOrder() {
  auto          graph = Diamond();
  GraphResolver resolver(graph);

  auto path = resolver.UpgradePath({}, "head");
  assert((Ids(path) == std::vector<std::string>{"a", "b1", "b2", "m"}));
  AssertParentsFirst(graph, path);

  // One branch applied: only the other branch and the merge remain.
  assert((Ids(resolver.UpgradePath({"b1"}, "head")) == std::vector<std::string>{"b2", "m"}));
  assert((Ids(resolver.UpgradePath({"b1", "b2"}, "head")) == std::vector<std::string>{"m"}));
}

void TestMergeDowngrade() {
  auto          graph = Diamond();
  GraphResolver resolver(graph);

  assert((Ids(resolver.DowngradePath({"m"}, "a")) == std::vector<std::string>{"m", "b2", "b1"}));
  assert((Ids(resolver.DowngradePath({"m"}, "b1")) == std::vector<std::string>{"m"}));
  assert((Ids(resolver.DowngradePath({"m"}, "base")) == std::vector<std::string>{"m", "b2", "b1", "a"}));
}

void TestForwardOrderPlacesParentsFirst() {
  // Two interleaved branches merging twice.
  auto graph = MigrationRegistry::Load({Unit("r"), Unit("x1", {"r"}), Unit("y1", {"r"}), Unit("x2", {"x1"}), Unit("m1", {"x2", "y1"}),
                                        Unit("y2", {"y1"}), Unit("m2", {"m1", "y2"})});
  GraphResolver resolver(graph);

  auto path = resolver.UpgradePath({}, "head");
  assert(path.size() == graph.Size());
  AssertParentsFirst(graph, path);
  assert(Ids(path).back() == "m2");

  auto back = resolver.DowngradePath({"m2"}, "base");
  auto ids  = Ids(back);
  auto fwd  = Ids(path);
  assert(std::vector<std::string>(fwd.rbegin(), fwd.rend()) == ids);
}

void TestHeadRequiresSingleHead() {
  auto          graph = MigrationRegistry::Load({Unit("a"), Unit("b1", {"a"}), Unit("b2", {"a"})});
  GraphResolver resolver(graph);

  assert(FailureOf([&] { (void)resolver.UpgradePath({}, "head"); }) == GraphErrorKind::kMultipleUnmergedHeads);
  // An explicit target is still fine.
  assert((Ids(resolver.UpgradePath({}, "b2")) == std::vector<std::string>{"a", "b2"}));
  // Current head on one branch picks that branch's head.
  assert(resolver.UpgradePath({"b1"}, "head").empty());
}

void TestUnknownRecordedVersionFails() {
  auto          graph = Linear();
  GraphResolver resolver(graph);
  assert(FailureOf([&] { (void)resolver.UpgradePath({"zzz"}, "head"); }) == GraphErrorKind::kUnknownRevision);
  assert(FailureOf([&] { (void)resolver.UpgradePath({}, "nope"); }) == GraphErrorKind::kUnknownRevision);
}

void TestRelativeReferences() {
  auto          graph = Linear();
  GraphResolver resolver(graph);

  assert((Ids(resolver.UpgradePath({}, "+2")) == std::vector<std::string>{"a", "b"}));
  assert((Ids(resolver.UpgradePath({"a"}, "+1")) == std::vector<std::string>{"b"}));
  assert((Ids(resolver.DowngradePath({"c"}, "-1")) == std::vector<std::string>{"c"}));
  assert((Ids(resolver.DowngradePath({"c"}, "-3")) == std::vector<std::string>{"c", "b", "a"}));

  assert(FailureOf([&] { (void)resolver.UpgradePath({"c"}, "+1"); }) == GraphErrorKind::kUnknownRevision);
  assert(FailureOf([&] { (void)resolver.DowngradePath({"a"}, "-2"); }) == GraphErrorKind::kUnknownRevision);
  assert(FailureOf([&] { (void)resolver.UpgradePath({}, "+x"); }) == GraphErrorKind::kUnknownRevision);

  auto          diamond = Diamond();
  GraphResolver branching(diamond);
  assert(FailureOf([&] { (void)branching.UpgradePath({"a"}, "+1"); }) == GraphErrorKind::kMultipleUnmergedHeads);
}

void TestBetween() {
  auto          graph = Linear();
  GraphResolver resolver(graph);

  assert((Ids(resolver.Between("base", "b")) == std::vector<std::string>{"a", "b"}));
  assert((Ids(resolver.Between("c", "a")) == std::vector<std::string>{"c", "b"}));
  assert(resolver.Between("b", "b").empty());

  auto          diamond = Diamond();
  GraphResolver branching(diamond);
  assert(FailureOf([&] { (void)branching.Between("b1", "b2"); }) == GraphErrorKind::kNotAnAncestor);
}

void TestNextHeads() {
  auto          graph = Diamond();
  GraphResolver resolver(graph);

  auto a  = graph.Get("a");
  auto b1 = graph.Get("b1");
  auto b2 = graph.Get("b2");
  auto m  = graph.Get("m");

  assert((resolver.NextHeads({}, {a, Direction::kForward}) == IdSet{"a"}));
  assert((resolver.NextHeads({"a"}, {b1, Direction::kForward}) == IdSet{"b1"}));
  // Sibling branch applied: both heads recorded.
  assert((resolver.NextHeads({"b1"}, {b2, Direction::kForward}) == IdSet{"b1", "b2"}));
  assert((resolver.NextHeads({"b1", "b2"}, {m, Direction::kForward}) == IdSet{"m"}));

  // Reverting the merge exposes both parents again.
  assert((resolver.NextHeads({"m"}, {m, Direction::kBackward}) == IdSet{"b1", "b2"}));
  assert((resolver.NextHeads({"b1", "b2"}, {b2, Direction::kBackward}) == IdSet{"b1"}));
  assert((resolver.NextHeads({"b1"}, {b1, Direction::kBackward}) == IdSet{"a"}));
  assert(resolver.NextHeads({"a"}, {a, Direction::kBackward}).empty());
}

} // namespace

int main() {
  TestLinearUpgradeFromBase();
  TestLinearUpgradeFromMiddle();
  TestLinearDowngrade();
  TestDowngradeToUnappliedTargetFails();
  TestMergeUpgradeOrder();
  TestMergeDowngrade();
  TestForwardOrderPlacesParentsFirst();
  TestHeadRequiresSingleHead();
  TestUnknownRecordedVersionFails();
  TestRelativeReferences();
  TestBetween();
  TestNextHeads();

  std::cout << "schemaflow_unit_graph_resolver: pass\n";
  return 0;
}
