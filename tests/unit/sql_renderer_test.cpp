#include "internal/dialect/sql_renderer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/sql/type_mapping.hpp"
#include "internal/dialect/dialect_adapter.hpp"

namespace {

using schemaflow::db::Capabilities;
using schemaflow::db::Dialect;
using schemaflow::dialect::SqlRenderer;
using schemaflow::dialect::Strategy;
using schemaflow::dialect::StrategyFor;
namespace model = schemaflow::model;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

model::TableSchema LlmUsage() {
  model::TableSchema table;
  table.name = "llmusage";

  model::ColumnDef id;
  id.name          = "id";
  id.type          = {model::ColumnType::kInteger, 0};
  id.primary_key   = true;
  id.autoincrement = true;
  id.nullable      = false;

  model::ColumnDef account;
  account.name = "account_id";
  account.type = {model::ColumnType::kInteger, 0};

  model::ColumnDef model_name;
  model_name.name          = "model";
  model_name.type          = {model::ColumnType::kString, 128};
  model_name.nullable      = false;
  model_name.default_value = "'unknown'";

  table.columns = {id, account, model_name};
  table.foreign_keys.push_back({"fk_llmusage_account", {"account_id"}, "accountdefinition", {"id"}, "SET NULL"});
  table.indexes.push_back({"ix_llmusage_account_id", "llmusage", {"account_id"}, false});
  return table;
}

void TestCreateTableSqlite() {
  SqlRenderer renderer(Dialect::kSqlite);
  const auto  sql = renderer.CreateTable(LlmUsage());

  assert(Contains(sql, R"(CREATE TABLE "llmusage" ()"));
  assert(Contains(sql, R"("id" INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT)"));
  assert(Contains(sql, R"("account_id" INTEGER,)"));
  assert(Contains(sql, R"("model" VARCHAR(128) NOT NULL DEFAULT 'unknown')"));
  assert(Contains(sql, R"(CONSTRAINT "fk_llmusage_account" FOREIGN KEY ("account_id") REFERENCES "accountdefinition" ("id") ON DELETE SET NULL)"));
  // Indexes are separate statements.
  assert(!Contains(sql, "ix_llmusage_account_id"));

  const auto shadow = renderer.CreateTable(LlmUsage(), "_sf_shadow_llmusage");
  assert(Contains(shadow, R"(CREATE TABLE "_sf_shadow_llmusage" ()"));
}

void TestCreateTablePostgres() {
  SqlRenderer renderer(Dialect::kPostgres);
  const auto  sql = renderer.CreateTable(LlmUsage());

  assert(Contains(sql, R"("id" INTEGER GENERATED BY DEFAULT AS IDENTITY NOT NULL PRIMARY KEY)"));
  assert(!Contains(sql, "AUTOINCREMENT"));
}

void TestCompositePrimaryKey() {
  model::TableSchema table;
  table.name = "expertsetting";

  model::ColumnDef expert;
  expert.name        = "expert_id";
  expert.type        = {model::ColumnType::kInteger, 0};
  expert.primary_key = true;

  model::ColumnDef key = expert;
  key.name             = "key";
  key.type             = {model::ColumnType::kString, 64};

  table.columns = {expert, key};

  const auto sql = SqlRenderer(Dialect::kSqlite).CreateTable(table);
  assert(Contains(sql, R"("expert_id" INTEGER NOT NULL,)"));
  assert(Contains(sql, R"(PRIMARY KEY ("expert_id", "key"))"));
}

void TestColumnStatements() {
  SqlRenderer sqlite(Dialect::kSqlite);
  SqlRenderer pg(Dialect::kPostgres);

  model::ColumnDef comment;
  comment.name = "comment";
  comment.type = {model::ColumnType::kText, 0};

  assert(sqlite.AddColumn("tradingorder", comment) == R"(ALTER TABLE "tradingorder" ADD COLUMN "comment" TEXT;)");
  assert(sqlite.DropColumn("tradingorder", "comment") == R"(ALTER TABLE "tradingorder" DROP COLUMN "comment";)");
  assert(sqlite.RenameColumn("smartriskmanagerjob", "initial_portfolio_value", "initial_portfolio_equity") ==
         R"(ALTER TABLE "smartriskmanagerjob" RENAME COLUMN "initial_portfolio_value" TO "initial_portfolio_equity";)");

  model::TypeSpec wide{model::ColumnType::kString, 64};
  bool            nullable = false;
  const auto      alter    = pg.AlterColumn("tradingorder", "status", &wide, &nullable);
  assert(alter.size() == 2);
  assert(alter[0] == R"(ALTER TABLE "tradingorder" ALTER COLUMN "status" TYPE VARCHAR(64) USING "status"::VARCHAR(64);)");
  assert(alter[1] == R"(ALTER TABLE "tradingorder" ALTER COLUMN "status" SET NOT NULL;)");
  assert(pg.AlterColumn("tradingorder", "status", nullptr, nullptr).empty());
}

void TestIdentifiersAreQuoted() {
  SqlRenderer renderer(Dialect::kSqlite);
  assert(renderer.DropTable(R"(we"ird)") == R"(DROP TABLE "we""ird";)");
  assert(renderer.RenameTable("_sf_shadow_t", "t") == R"(ALTER TABLE "_sf_shadow_t" RENAME TO "t";)");
}

void TestIndexAndCopyStatements() {
  SqlRenderer renderer(Dialect::kSqlite);

  model::IndexDef index{"ix_tradingorder_symbol", "tradingorder", {"symbol", "status"}, true};
  assert(renderer.CreateIndex(index) == R"(CREATE UNIQUE INDEX "ix_tradingorder_symbol" ON "tradingorder" ("symbol", "status");)");
  assert(Contains(renderer.CreateIndex(index, "_sf_shadow_tradingorder"), R"(ON "_sf_shadow_tradingorder")"));
  assert(renderer.DropIndex("ix_tradingorder_symbol") == R"(DROP INDEX "ix_tradingorder_symbol";)");

  assert(renderer.CopyRows("t", "_sf_shadow_t", {{"id", "id"}, {"equity", "value"}}) ==
         R"(INSERT INTO "_sf_shadow_t" ("id", "equity") SELECT "id", "value" FROM "t";)");
}

void TestAfterSwap() {
  assert(SqlRenderer(Dialect::kSqlite).AfterSwap(LlmUsage(), "_sf_shadow_llmusage").empty());

  const auto fixups = SqlRenderer(Dialect::kPostgres).AfterSwap(LlmUsage(), "_sf_shadow_llmusage");
  assert(fixups.size() == 3);
  assert(Contains(fixups[0], R"(RENAME CONSTRAINT "_sf_shadow_llmusage_pkey" TO "llmusage_pkey")"));
  assert(Contains(fixups[1], R"(ALTER SEQUENCE "_sf_shadow_llmusage_id_seq" RENAME TO "llmusage_id_seq")"));
  assert(Contains(fixups[2], "setval"));
}

void TestTypeMapping() {
  using schemaflow::db::sql::ParseType;
  using schemaflow::db::sql::RenderType;

  assert(RenderType(Dialect::kSqlite, {model::ColumnType::kFloat, 0}) == "FLOAT");
  assert(RenderType(Dialect::kPostgres, {model::ColumnType::kFloat, 0}) == "DOUBLE PRECISION");
  assert(RenderType(Dialect::kPostgres, {model::ColumnType::kDateTime, 0}) == "TIMESTAMP");

  assert((ParseType(Dialect::kSqlite, "varchar(32)") == model::TypeSpec{model::ColumnType::kString, 32}));
  assert((ParseType(Dialect::kSqlite, "DATETIME") == model::TypeSpec{model::ColumnType::kDateTime, 0}));
  assert(ParseType(Dialect::kSqlite, "NUMERIC(10,2)").type == model::ColumnType::kUnknown);
  assert((ParseType(Dialect::kPostgres, "character varying", 64) == model::TypeSpec{model::ColumnType::kString, 64}));
  assert(ParseType(Dialect::kPostgres, "jsonb").type == model::ColumnType::kJson);
}

void TestStrategySelection() {
  Capabilities sqlite;
  sqlite.transactional_ddl = true;
  sqlite.rename_column     = true;
  sqlite.drop_column       = true;

  assert(StrategyFor(model::OpKind::kRenameColumn, sqlite) == Strategy::kDirect);
  assert(StrategyFor(model::OpKind::kDropColumn, sqlite) == Strategy::kDirect);
  assert(StrategyFor(model::OpKind::kAlterColumn, sqlite) == Strategy::kRebuild);
  assert(StrategyFor(model::OpKind::kAddForeignKey, sqlite) == Strategy::kRebuild);
  assert(StrategyFor(model::OpKind::kDropForeignKey, sqlite) == Strategy::kRebuild);
  assert(StrategyFor(model::OpKind::kAddColumn, sqlite) == Strategy::kDirect);
  assert(StrategyFor(model::OpKind::kRebuildTable, sqlite) == Strategy::kRebuild);

  Capabilities old_sqlite;
  assert(StrategyFor(model::OpKind::kRenameColumn, old_sqlite) == Strategy::kRebuild);

  // Forcing never affects operations with no in-place/rebuild choice.
  assert(StrategyFor(model::OpKind::kRenameColumn, sqlite, true) == Strategy::kRebuild);
  assert(StrategyFor(model::OpKind::kCreateTable, sqlite, true) == Strategy::kDirect);
  assert(StrategyFor(model::OpKind::kExecuteSql, sqlite, true) == Strategy::kDirect);
}

} // namespace

int main() {
  TestCreateTableSqlite();
  TestCreateTablePostgres();
  TestCompositePrimaryKey();
  TestColumnStatements();
  TestIdentifiersAreQuoted();
  TestIndexAndCopyStatements();
  TestAfterSwap();
  TestTypeMapping();
  TestStrategySelection();

  std::cout << "schemaflow_unit_sql_renderer: pass\n";
  return 0;
}
