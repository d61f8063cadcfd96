#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/registry/unit_loader.hpp"
#include "internal/util/errors.hpp"
#if SCHEMAFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_connection.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if SCHEMAFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_connection.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace schemaflow::factory {

using observability::IntField;
using observability::StringField;

std::unique_ptr<db::Connection> BuildConnection(const schemaflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SCHEMAFLOW_DB_SQLITE
    std::shared_ptr<db::sqlite::SqliteDB> sqlite_db;
    try {
      sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    } catch (const std::runtime_error& e) {
      throw util::OperationError("cannot open sqlite database " + database.sqlite().path() + ": " + e.what());
    }
    SCHEMAFLOW_LOG_DEBUG("sqlite store opened", {StringField("path", database.sqlite().path())});
    return std::make_unique<db::sqlite::SqliteConnection>(std::move(sqlite_db));
#else
    throw util::ConfigError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SCHEMAFLOW_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    try {
      auto conn = std::make_unique<db::postgres::PgConnection>(std::move(pool), database.postgres().lock_key());
      SCHEMAFLOW_LOG_DEBUG("postgres store opened", {IntField("lock_key", database.postgres().lock_key())});
      return conn;
    } catch (const pqxx::failure& e) {
      throw util::OperationError(std::string("cannot connect to postgres: ") + e.what());
    }
#else
    throw util::ConfigError("postgres backend requested but not enabled at build time");
#endif
  }

  throw util::ConfigError("no database backend configured");
}

registry::RegisteredGraph LoadGraph(const schemaflow::runtime::config::RuntimeConfig& config) {
  const auto& dir   = config.migrations().directory();
  auto        units = registry::UnitLoader::LoadDirectory(dir);
  SCHEMAFLOW_LOG_DEBUG("migration units loaded", {StringField("directory", dir), IntField("units", static_cast<int64_t>(units.size()))});
  return registry::MigrationRegistry::Load(std::move(units));
}

/*
    Build full migrator dependency graph
*/
std::unique_ptr<core::Migrator> BuildMigrator(const schemaflow::runtime::config::RuntimeConfig& config) {
  // Validate units before touching the store.
  auto graph = LoadGraph(config);

  core::MigratorOptions options;
  options.version_table             = config.migrations().version_table();
  options.history_table             = config.migrations().history_table();
  options.force_rebuild             = config.capabilities().force_rebuild();
  options.disable_transactional_ddl = config.capabilities().disable_transactional_ddl();

  return std::make_unique<core::Migrator>(BuildConnection(config), std::move(graph), std::move(options));
}

} // namespace schemaflow::factory
