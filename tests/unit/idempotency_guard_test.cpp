#include "internal/guard/idempotency_guard.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/dialect/rebuild_strategy.hpp"
#include "internal/util/errors.hpp"

namespace {

using schemaflow::guard::IdempotencyGuard;
using schemaflow::util::IdempotencyConflict;
namespace model = schemaflow::model;

model::ColumnDef Column(const std::string& name, model::ColumnType type, bool nullable = true, int length = 0) {
  model::ColumnDef column;
  column.name     = name;
  column.type     = {type, length};
  column.nullable = nullable;
  return column;
}

model::TableSchema TradingOrder() {
  model::TableSchema table;
  table.name = "tradingorder";

  auto id        = Column("id", model::ColumnType::kInteger, false);
  id.primary_key = true;
  table.columns  = {id, Column("symbol", model::ColumnType::kString, false, 16), Column("status", model::ColumnType::kString, true, 32),
                    Column("account_id", model::ColumnType::kInteger)};

  table.foreign_keys.push_back({"fk_tradingorder_account_id", {"account_id"}, "accountdefinition", {"id"}, "CASCADE"});
  table.indexes.push_back({"ix_tradingorder_symbol", "tradingorder", {"symbol"}, false});
  return table;
}

model::SchemaSnapshot Live() {
  model::SchemaSnapshot live;
  live.tables.emplace("tradingorder", TradingOrder());
  return live;
}

bool Conflicts(const model::SchemaOp& op, const model::SchemaSnapshot& live) {
  try {
    (void)IdempotencyGuard::ShouldApply(op, live);
  } catch (const IdempotencyConflict&) {
    return true;
  }
  return false;
}

void TestAddColumn() {
  const auto live = Live();

  assert(IdempotencyGuard::ShouldApply(model::AddColumn{"tradingorder", Column("comment", model::ColumnType::kString)}, live));
  // Same shape already present: no-op.
  assert(!IdempotencyGuard::ShouldApply(model::AddColumn{"tradingorder", Column("status", model::ColumnType::kString, true, 32)}, live));
  // Present with another type or nullability.
  assert(Conflicts(model::AddColumn{"tradingorder", Column("status", model::ColumnType::kText)}, live));
  assert(Conflicts(model::AddColumn{"tradingorder", Column("status", model::ColumnType::kString, false, 32)}, live));
  // Missing table.
  assert(Conflicts(model::AddColumn{"missing", Column("c", model::ColumnType::kText)}, live));
}

void TestDropColumn() {
  const auto live = Live();
  assert(IdempotencyGuard::ShouldApply(model::DropColumn{"tradingorder", "status"}, live));
  assert(!IdempotencyGuard::ShouldApply(model::DropColumn{"tradingorder", "open_type"}, live));
}

void TestRenameColumn() {
  const auto live = Live();
  assert(IdempotencyGuard::ShouldApply(model::RenameColumn{"tradingorder", "status", "state"}, live));
  assert(!IdempotencyGuard::ShouldApply(model::RenameColumn{"tradingorder", "old_status", "status"}, live));
  assert(Conflicts(model::RenameColumn{"tradingorder", "symbol", "status"}, live));
  assert(Conflicts(model::RenameColumn{"tradingorder", "a", "b"}, live));
}

void TestAlterColumn() {
  const auto live = Live();

  model::AlterColumn widen;
  widen.table         = "tradingorder";
  widen.column        = "status";
  widen.type          = model::TypeSpec{model::ColumnType::kString, 64};
  widen.existing_type = model::TypeSpec{model::ColumnType::kString, 32};
  assert(IdempotencyGuard::ShouldApply(widen, live));

  // Already at the target.
  auto narrow          = widen;
  narrow.type          = model::TypeSpec{model::ColumnType::kString, 32};
  narrow.existing_type = model::TypeSpec{model::ColumnType::kString, 64};
  assert(!IdempotencyGuard::ShouldApply(narrow, live));

  // Matches neither side.
  auto other          = widen;
  other.existing_type = model::TypeSpec{model::ColumnType::kText, 0};
  assert(Conflicts(other, live));

  // No pre-state given: anything not at the target applies.
  model::AlterColumn not_null;
  not_null.table    = "tradingorder";
  not_null.column   = "status";
  not_null.nullable = false;
  assert(IdempotencyGuard::ShouldApply(not_null, live));

  not_null.column = "missing";
  assert(Conflicts(not_null, live));
}

void TestCreateAndDropTable() {
  const auto live = Live();

  assert(!IdempotencyGuard::ShouldApply(model::CreateTable{TradingOrder()}, live));

  auto different = TradingOrder();
  different.columns.pop_back();
  assert(Conflicts(model::CreateTable{different}, live));

  auto fresh = TradingOrder();
  fresh.name = "tradingorder_archive";
  assert(IdempotencyGuard::ShouldApply(model::CreateTable{fresh}, live));

  assert(IdempotencyGuard::ShouldApply(model::DropTable{"tradingorder"}, live));
  assert(!IdempotencyGuard::ShouldApply(model::DropTable{"tradingorder_archive"}, live));
}

void TestForeignKeys() {
  const auto live = Live();

  model::ForeignKeyDef same{"fk_tradingorder_account_id", {"account_id"}, "accountdefinition", {"id"}, "CASCADE"};
  assert(!IdempotencyGuard::ShouldApply(model::AddForeignKey{"tradingorder", same}, live));

  auto elsewhere      = same;
  elsewhere.ref_table = "expertinstance";
  assert(Conflicts(model::AddForeignKey{"tradingorder", elsewhere}, live));

  auto fresh = same;
  fresh.name = "fk_other";
  assert(IdempotencyGuard::ShouldApply(model::AddForeignKey{"tradingorder", fresh}, live));

  assert(IdempotencyGuard::ShouldApply(model::DropForeignKey{"tradingorder", "fk_tradingorder_account_id"}, live));
  assert(!IdempotencyGuard::ShouldApply(model::DropForeignKey{"tradingorder", "fk_other"}, live));
}

void TestIndexes() {
  const auto live = Live();

  model::IndexDef same{"ix_tradingorder_symbol", "tradingorder", {"symbol"}, false};
  assert(!IdempotencyGuard::ShouldApply(model::CreateIndex{same}, live));

  auto unique   = same;
  unique.unique = true;
  assert(Conflicts(model::CreateIndex{unique}, live));

  auto fresh = same;
  fresh.name = "ix_tradingorder_status";
  assert(IdempotencyGuard::ShouldApply(model::CreateIndex{fresh}, live));

  auto orphan  = fresh;
  orphan.table = "missing";
  assert(Conflicts(model::CreateIndex{orphan}, live));

  assert(IdempotencyGuard::ShouldApply(model::DropIndex{"tradingorder", "ix_tradingorder_symbol"}, live));
  assert(!IdempotencyGuard::ShouldApply(model::DropIndex{"tradingorder", "ix_tradingorder_status"}, live));
}

void TestRebuildTable() {
  auto live = Live();

  assert(!IdempotencyGuard::ShouldApply(model::RebuildTable{TradingOrder(), {}}, live));

  auto target = TradingOrder();
  target.columns.push_back(Column("comment", model::ColumnType::kText));
  assert(IdempotencyGuard::ShouldApply(model::RebuildTable{target, {}}, live));

  // A leftover shadow means the previous attempt did not finish.
  live.tables.emplace(schemaflow::dialect::RebuildStrategy::ShadowName("tradingorder"), TradingOrder());
  assert(IdempotencyGuard::ShouldApply(model::RebuildTable{TradingOrder(), {}}, live));

  assert(Conflicts(model::RebuildTable{[] {
                                         auto t = TradingOrder();
                                         t.name = "missing";
                                         return t;
                                       }(),
                                       {}},
                   live));
}

void TestExecuteAlwaysRuns() {
  assert(IdempotencyGuard::ShouldApply(model::ExecuteSql{"UPDATE tradingorder SET status = 'OPEN'"}, Live()));
}

} // namespace

int main() {
  TestAddColumn();
  TestDropColumn();
  TestRenameColumn();
  TestAlterColumn();
  TestCreateAndDropTable();
  TestForeignKeys();
  TestIndexes();
  TestRebuildTable();
  TestExecuteAlwaysRuns();

  std::cout << "schemaflow_unit_idempotency_guard: pass\n";
  return 0;
}
