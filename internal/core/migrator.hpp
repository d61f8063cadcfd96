#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/dialect/dialect_adapter.hpp"
#include "internal/engine/execution_engine.hpp"
#include "internal/graph/graph_resolver.hpp"
#include "internal/registry/migration_registry.hpp"
#include "internal/state/state_store.hpp"

namespace schemaflow::core {

struct MigratorOptions {
  std::string version_table = "schemaflow_version";
  std::string history_table = "schemaflow_history";
  bool        force_rebuild = false;
  bool        disable_transactional_ddl = false;
};

struct CheckReport {
  std::size_t              units = 0;
  std::vector<std::string> roots;
  std::vector<std::string> heads;
};

/*
  Command-level API over one target store and one registered graph.

  Upgrade, Downgrade and Stamp hold the run lock for their whole
  duration. Every command creates the state tables on first use.
*/
class Migrator {
 public:
  Migrator(std::unique_ptr<db::Connection> conn, registry::RegisteredGraph graph, MigratorOptions options = {});

  // resolver_ and engine_ refer to members.
  Migrator(const Migrator&)            = delete;
  Migrator& operator=(const Migrator&) = delete;
  Migrator(Migrator&&)                 = delete;
  Migrator& operator=(Migrator&&)      = delete;

  engine::RunReport Upgrade(std::string_view target = graph::GraphResolver::kHead, const std::atomic<bool>* cancel = nullptr);
  engine::RunReport Downgrade(std::string_view target, const std::atomic<bool>* cancel = nullptr);

  // Sets the pointer without running operations.
  void Stamp(std::string_view target);

  std::vector<state::HistoryEntry> History();
  registry::IdSet                  Current();
  std::vector<std::string>         Heads() const;
  CheckReport                      Check() const;

  // Live catalog without the state tables.
  model::SchemaSnapshot LiveSchema();

  const registry::RegisteredGraph& Graph() const {
    return graph_;
  }
  const db::Capabilities& Capabilities() const {
    return adapter_.Caps();
  }
  db::Connection& Connection() {
    return *conn_;
  }

 private:
  engine::RunReport Run(const graph::Path& path, std::string_view command, const std::atomic<bool>* cancel);

  std::unique_ptr<db::Connection> conn_;
  db::Capabilities                backend_caps_;
  registry::RegisteredGraph       graph_;
  graph::GraphResolver            resolver_;
  dialect::DialectAdapter         adapter_;
  state::StateStore               store_;
  engine::ExecutionEngine         engine_;
};

} // namespace schemaflow::core
