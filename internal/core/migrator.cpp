#include "internal/core/migrator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::core {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

db::Capabilities EffectiveCapabilities(db::Capabilities caps, const MigratorOptions& options) {
  if (options.disable_transactional_ddl) caps.transactional_ddl = false;
  return caps;
}

bool IsRelative(std::string_view ref) {
  return !ref.empty() && (ref[0] == '+' || ref[0] == '-');
}

} // namespace

Migrator::Migrator(std::unique_ptr<db::Connection> conn, registry::RegisteredGraph graph, MigratorOptions options)
    : conn_(std::move(conn)),
      backend_caps_(conn_->QueryCapabilities()),
      graph_(std::move(graph)),
      resolver_(graph_),
      // Without unit transactions, a rebuild still swaps atomically where the backend allows it.
      adapter_(*conn_, EffectiveCapabilities(backend_caps_, options), options.force_rebuild,
               backend_caps_.transactional_ddl && options.disable_transactional_ddl),
      store_(*conn_, options.version_table, options.history_table),
      engine_(*conn_, adapter_, store_, resolver_, adapter_.Caps().transactional_ddl) {
  const auto& caps = adapter_.Caps();
  SCHEMAFLOW_LOG_DEBUG("store capabilities", {BoolField("transactional_ddl", caps.transactional_ddl), BoolField("drop_column", caps.drop_column),
                                              BoolField("rename_column", caps.rename_column), BoolField("alter_column", caps.alter_column),
                                              BoolField("force_rebuild", options.force_rebuild)});
}

engine::RunReport Migrator::Run(const graph::Path& path, std::string_view command, const std::atomic<bool>* cancel) {
  SCHEMAFLOW_LOG_INFO("planned", {StringField("command", command), IntField("units", static_cast<int64_t>(path.size()))});
  auto report = engine_.Apply(path, cancel);
  SCHEMAFLOW_LOG_INFO("finished", {StringField("command", command), IntField("completed", static_cast<int64_t>(report.Completed())),
                                   IntField("skipped_operations", static_cast<int64_t>(report.SkippedOperations()))});
  return report;
}

engine::RunReport Migrator::Upgrade(std::string_view target, const std::atomic<bool>* cancel) {
  auto lock = engine_.AcquireLock();
  store_.EnsureTables();
  return Run(resolver_.UpgradePath(store_.GetCurrent(), target), "upgrade", cancel);
}

engine::RunReport Migrator::Downgrade(std::string_view target, const std::atomic<bool>* cancel) {
  auto lock = engine_.AcquireLock();
  store_.EnsureTables();
  return Run(resolver_.DowngradePath(store_.GetCurrent(), target), "downgrade", cancel);
}

void Migrator::Stamp(std::string_view target) {
  auto lock = engine_.AcquireLock();
  store_.EnsureTables();

  // Absolute references ignore the recorded pointer, which may be the
  // very thing being repaired.
  const registry::IdSet basis = IsRelative(target) ? store_.GetCurrent() : registry::IdSet{};
  const auto            id    = resolver_.ResolveUpgradeTarget(basis, target);

  registry::IdSet heads;
  if (!id.empty()) heads.insert(id);

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = conn_->Begin();
  } catch (const std::exception& e) {
    throw util::OperationError(std::string("stamp: begin transaction: ") + e.what());
  }
  store_.Stamp(heads);
  try {
    tx->Commit();
  } catch (const std::exception& e) {
    throw util::OperationError(std::string("stamp: commit: ") + e.what());
  }
  SCHEMAFLOW_LOG_INFO("stamped", {StringField("version", id.empty() ? "base" : id)});
}

std::vector<state::HistoryEntry> Migrator::History() {
  store_.EnsureTables();
  return store_.History();
}

registry::IdSet Migrator::Current() {
  store_.EnsureTables();
  return store_.GetCurrent();
}

std::vector<std::string> Migrator::Heads() const {
  return graph_.Heads();
}

CheckReport Migrator::Check() const {
  CheckReport report;
  report.units = graph_.Size();
  report.roots = graph_.Roots();
  report.heads = graph_.Heads();
  return report;
}

model::SchemaSnapshot Migrator::LiveSchema() {
  model::SchemaSnapshot live;
  auto                  r = conn_->Snapshot(live);
  if (!r) {
    throw util::OperationError("schema introspection failed: " + r.message);
  }
  return live.WithoutTables(store_.ReservedTables());
}

} // namespace schemaflow::core
