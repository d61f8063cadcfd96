#include "internal/dialect/rebuild_strategy.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_connection.hpp"
#include "internal/dialect/dialect_adapter.hpp"
#include "internal/util/errors.hpp"

namespace {

using schemaflow::db::sqlite::SqliteConnection;
using schemaflow::db::sqlite::SqliteDB;
using schemaflow::dialect::DialectAdapter;
using schemaflow::dialect::RebuildStrategy;
using schemaflow::dialect::SqlRenderer;
namespace model = schemaflow::model;

std::unique_ptr<SqliteConnection> Seeded() {
  auto conn = std::make_unique<SqliteConnection>(std::make_shared<SqliteDB>(":memory:"));
  const char* statements[] = {
      R"(CREATE TABLE "accountdefinition" ("id" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, "name" VARCHAR(64) NOT NULL);)",
      R"(CREATE TABLE "tradingorder" ("id" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT, "symbol" VARCHAR(16) NOT NULL,)"
      R"( "status" VARCHAR(32), "account_id" INTEGER);)",
      R"(CREATE INDEX "ix_tradingorder_symbol" ON "tradingorder" ("symbol");)",
      R"(INSERT INTO "accountdefinition" ("name") VALUES ('paper'), ('live');)",
      R"(INSERT INTO "tradingorder" ("symbol", "status", "account_id") VALUES ('AAPL', 'FILLED', 1), ('MSFT', NULL, 2), ('NVDA', 'OPEN', 1);)",
  };
  for (const auto* sql : statements) {
    auto r = conn->Exec(sql);
    assert(r && "seed statement failed");
  }
  return conn;
}

model::SchemaSnapshot Snapshot(SqliteConnection& conn) {
  model::SchemaSnapshot live;
  auto                  r = conn.Snapshot(live);
  assert(r);
  return live;
}

int64_t Count(SqliteConnection& conn, const std::string& sql) {
  int64_t n = 0;
  auto    r = conn.Query(sql, {}, [&](const schemaflow::db::sql::Row& row) { n = row.GetInt64(0); });
  assert(r);
  return n;
}

void TestRunSwapsInTargetDefinition() {
  auto            conn = Seeded();
  SqlRenderer     renderer(conn->Kind());
  RebuildStrategy rebuild(*conn, renderer);

  const auto live   = *Snapshot(*conn).FindTable("tradingorder");
  auto       target = live;
  target.FindColumn("status")->type = {model::ColumnType::kString, 64};
  target.FindColumn("symbol")->name = "ticker";
  target.indexes.front().columns    = {"ticker"};

  rebuild.Run(live, target, {{"ticker", "symbol"}});

  const auto after = Snapshot(*conn);
  assert(!after.HasTable(RebuildStrategy::ShadowName("tradingorder")));

  const auto* table = after.FindTable("tradingorder");
  assert(table);
  assert(model::SameTable(*table, target));
  assert(table->FindColumn("id")->autoincrement);
  assert((table->FindColumn("status")->type == model::TypeSpec{model::ColumnType::kString, 64}));

  assert(Count(*conn, R"(SELECT COUNT(*) FROM "tradingorder";)") == 3);
  assert(Count(*conn, R"(SELECT COUNT(*) FROM "tradingorder" WHERE "ticker" = 'MSFT' AND "status" IS NULL AND "account_id" = 2;)") == 1);

  // Ids keep counting from where the original left off.
  auto r = conn->Exec(R"(INSERT INTO "tradingorder" ("ticker") VALUES ('TSLA');)");
  assert(r);
  assert(Count(*conn, R"(SELECT "id" FROM "tradingorder" WHERE "ticker" = 'TSLA';)") == 4);
}

void TestRunRejectsMissingSourceColumn() {
  auto            conn = Seeded();
  SqlRenderer     renderer(conn->Kind());
  RebuildStrategy rebuild(*conn, renderer);

  const auto live = *Snapshot(*conn).FindTable("tradingorder");
  bool       threw = false;
  try {
    rebuild.Run(live, live, {{"symbol", "no_such_column"}});
  } catch (const schemaflow::util::OperationError&) {
    threw = true;
  }
  assert(threw);
  assert(!Snapshot(*conn).HasTable(RebuildStrategy::ShadowName("tradingorder")));
}

void TestRecoverDiscardsUnfinishedShadow() {
  auto            conn = Seeded();
  SqlRenderer     renderer(conn->Kind());
  RebuildStrategy rebuild(*conn, renderer);

  auto r = conn->Exec(R"(CREATE TABLE "_sf_shadow_tradingorder" ("id" INTEGER);)");
  assert(r);

  assert(rebuild.Recover("tradingorder"));
  const auto after = Snapshot(*conn);
  assert(!after.HasTable("_sf_shadow_tradingorder"));
  assert(after.FindTable("tradingorder")->columns.size() == 4);

  // Nothing left to do the second time.
  assert(!rebuild.Recover("tradingorder"));
}

void TestRecoverRefusesShadowWithoutOriginal() {
  auto            conn = Seeded();
  SqlRenderer     renderer(conn->Kind());
  RebuildStrategy rebuild(*conn, renderer);

  auto r = conn->Exec(R"(ALTER TABLE "tradingorder" RENAME TO "_sf_shadow_tradingorder";)");
  assert(r);

  bool threw = false;
  try {
    rebuild.Recover("tradingorder");
  } catch (const schemaflow::util::OperationError& e) {
    threw = std::string(e.what()).find("_sf_shadow_tradingorder") != std::string::npos;
  }
  assert(threw);
  // The rows stay where they are.
  assert(Count(*conn, R"(SELECT COUNT(*) FROM "_sf_shadow_tradingorder";)") == 3);
  assert(!Snapshot(*conn).HasTable("tradingorder"));
}

void TestRunWithOwnSwapTransaction() {
  auto            conn = Seeded();
  SqlRenderer     renderer(conn->Kind());
  RebuildStrategy rebuild(*conn, renderer, true);

  const auto live   = *Snapshot(*conn).FindTable("tradingorder");
  auto       target = live;
  target.FindColumn("status")->nullable = true;
  target.columns.pop_back();

  rebuild.Run(live, target, {});

  const auto after = Snapshot(*conn);
  assert(!after.HasTable(RebuildStrategy::ShadowName("tradingorder")));
  assert(!after.FindTable("tradingorder")->FindColumn("account_id"));
  assert(after.FindIndex("ix_tradingorder_symbol"));
  assert(Count(*conn, R"(SELECT COUNT(*) FROM "tradingorder";)") == 3);

  // The swap transaction is closed; the connection can open another.
  auto tx = conn->Begin();
  tx->Commit();
}

void TestAdapterRebuildsWhatSqliteCannotAlter() {
  auto           conn = Seeded();
  DialectAdapter adapter(*conn, conn->QueryCapabilities());

  model::AlterColumn widen;
  widen.table    = "tradingorder";
  widen.column   = "status";
  widen.type     = model::TypeSpec{model::ColumnType::kString, 64};
  widen.nullable = false;
  // One NULL status row would violate NOT NULL.
  auto r = conn->Exec(R"(UPDATE "tradingorder" SET "status" = 'NEW' WHERE "status" IS NULL;)");
  assert(r);
  adapter.Execute(widen, Snapshot(*conn));

  model::ForeignKeyDef fk{"fk_tradingorder_account_id", {"account_id"}, "accountdefinition", {"id"}, "CASCADE"};
  adapter.Execute(model::AddForeignKey{"tradingorder", fk}, Snapshot(*conn));

  auto        live  = Snapshot(*conn);
  const auto* table = live.FindTable("tradingorder");
  assert(!table->FindColumn("status")->nullable);
  assert(table->FindColumn("status")->type.length == 64);
  assert(table->FindForeignKey("fk_tradingorder_account_id"));
  assert(table->FindIndex("ix_tradingorder_symbol"));

  adapter.Execute(model::DropForeignKey{"tradingorder", "fk_tradingorder_account_id"}, Snapshot(*conn));
  assert(Snapshot(*conn).FindTable("tradingorder")->foreign_keys.empty());

  // Indexed column: the covering index goes with it.
  adapter.Execute(model::DropColumn{"tradingorder", "symbol"}, Snapshot(*conn));
  live = Snapshot(*conn);
  assert(!live.FindTable("tradingorder")->FindColumn("symbol"));
  assert(!live.FindIndex("ix_tradingorder_symbol"));
  assert(Count(*conn, R"(SELECT COUNT(*) FROM "tradingorder";)") == 3);
}

void TestAdapterForcedRebuildRenamesColumn() {
  auto           conn = Seeded();
  DialectAdapter adapter(*conn, conn->QueryCapabilities(), true);

  adapter.Execute(model::RenameColumn{"tradingorder", "symbol", "ticker"}, Snapshot(*conn));

  const auto live = Snapshot(*conn);
  assert(live.FindTable("tradingorder")->FindColumn("ticker"));
  assert((live.FindIndex("ix_tradingorder_symbol")->columns == std::vector<std::string>{"ticker"}));
  assert(Count(*conn, R"(SELECT COUNT(*) FROM "tradingorder" WHERE "ticker" = 'NVDA';)") == 1);
}

void TestAdapterWrapsBackendErrors() {
  auto           conn = Seeded();
  DialectAdapter adapter(*conn, conn->QueryCapabilities());

  bool threw = false;
  try {
    adapter.Execute(model::ExecuteSql{"UPDATE nowhere SET x = 1"}, Snapshot(*conn));
  } catch (const schemaflow::util::OperationError& e) {
    threw = std::string(e.what()).find("UPDATE nowhere") != std::string::npos;
  }
  assert(threw && "operation errors carry the statement");
}

} // namespace

int main() {
  TestRunSwapsInTargetDefinition();
  TestRunRejectsMissingSourceColumn();
  TestRecoverDiscardsUnfinishedShadow();
  TestRecoverRefusesShadowWithoutOriginal();
  TestRunWithOwnSwapTransaction();
  TestAdapterRebuildsWhatSqliteCannotAlter();
  TestAdapterForcedRebuildRenamesColumn();
  TestAdapterWrapsBackendErrors();

  std::cout << "schemaflow_unit_rebuild_strategy: pass\n";
  return 0;
}
