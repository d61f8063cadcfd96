#include "internal/dialect/dialect_adapter.hpp"

#include <algorithm>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::dialect {

using model::OpKind;
using observability::StringField;
using util::OperationError;

namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void RenameIn(std::vector<std::string>& names, const std::string& from, const std::string& to) {
  std::replace(names.begin(), names.end(), from, to);
}

} // namespace

std::string_view StrategyName(Strategy strategy) {
  return strategy == Strategy::kRebuild ? "rebuild" : "direct";
}

Strategy StrategyFor(OpKind kind, const db::Capabilities& caps, bool force_rebuild) {
  auto direct_if = [&](bool supported) { return supported && !force_rebuild ? Strategy::kDirect : Strategy::kRebuild; };

  switch (kind) {
    case OpKind::kDropColumn:
      return direct_if(caps.drop_column);
    case OpKind::kRenameColumn:
      return direct_if(caps.rename_column);
    case OpKind::kAlterColumn:
      return direct_if(caps.alter_column);
    case OpKind::kAddForeignKey:
      return direct_if(caps.add_foreign_key);
    case OpKind::kDropForeignKey:
      return direct_if(caps.drop_foreign_key);
    case OpKind::kRebuildTable:
      return Strategy::kRebuild;
    case OpKind::kAddColumn:
    case OpKind::kCreateTable:
    case OpKind::kDropTable:
    case OpKind::kCreateIndex:
    case OpKind::kDropIndex:
    case OpKind::kExecuteSql:
      return Strategy::kDirect;
  }
  return Strategy::kDirect;
}

DialectAdapter::DialectAdapter(db::Connection& conn, db::Capabilities caps, bool force_rebuild, bool swap_in_transaction)
    : conn_(conn), caps_(caps), force_rebuild_(force_rebuild), renderer_(conn.Kind()), rebuild_(conn, renderer_, swap_in_transaction) {
}

void DialectAdapter::Exec(const std::string& sql) {
  auto r = conn_.Exec(sql);
  if (!r) {
    throw OperationError(r.message + " [" + sql + "]");
  }
}

const model::TableSchema& DialectAdapter::LiveTable(const model::SchemaSnapshot& live, const std::string& table) const {
  const auto* found = live.FindTable(table);
  if (!found) {
    throw OperationError("table " + table + " does not exist");
  }
  return *found;
}

void DialectAdapter::Rebuild(const model::TableSchema& live, const model::TableSchema& target,
                             const std::map<std::string, std::string>& source_columns) {
  rebuild_.Run(live, target, source_columns);
}

bool DialectAdapter::Recover(const model::SchemaOp& op) {
  const auto table = model::TargetTable(op);
  if (table.empty()) return false;
  return rebuild_.Recover(table);
}

void DialectAdapter::Execute(const model::SchemaOp& op, const model::SchemaSnapshot& live) {
  SCHEMAFLOW_LOG_DEBUG("executing operation",
                       {StringField("op", model::Describe(op)), StringField("strategy", StrategyName(StrategyFor(model::KindOf(op))))});
  std::visit([&](const auto& alternative) { Apply(alternative, live); }, op);
}

void DialectAdapter::Apply(const model::AddColumn& op, const model::SchemaSnapshot&) {
  Exec(renderer_.AddColumn(op.table, op.column));
}

void DialectAdapter::Apply(const model::DropColumn& op, const model::SchemaSnapshot& live) {
  const auto& table = LiveTable(live, op.table);

  bool keyed = Contains(table.PrimaryKey(), op.column);
  for (const auto& fk : table.foreign_keys) {
    keyed = keyed || Contains(fk.columns, op.column);
  }

  // SQLite refuses DROP COLUMN on key columns and indexed columns.
  if (StrategyFor(OpKind::kDropColumn) == Strategy::kDirect && !(keyed && conn_.Kind() == db::Dialect::kSqlite)) {
    if (conn_.Kind() == db::Dialect::kSqlite) {
      for (const auto& index : table.indexes) {
        if (Contains(index.columns, op.column)) Exec(renderer_.DropIndex(index.name));
      }
    }
    Exec(renderer_.DropColumn(op.table, op.column));
    return;
  }

  model::TableSchema target = table;
  target.columns.erase(std::remove_if(target.columns.begin(), target.columns.end(), [&](const auto& c) { return c.name == op.column; }),
                       target.columns.end());
  target.foreign_keys.erase(std::remove_if(target.foreign_keys.begin(), target.foreign_keys.end(),
                                           [&](const auto& fk) { return Contains(fk.columns, op.column); }),
                            target.foreign_keys.end());
  target.indexes.erase(
      std::remove_if(target.indexes.begin(), target.indexes.end(), [&](const auto& index) { return Contains(index.columns, op.column); }),
      target.indexes.end());
  if (target.columns.empty()) {
    throw OperationError("cannot drop the last column of " + op.table);
  }
  Rebuild(table, target);
}

void DialectAdapter::Apply(const model::RenameColumn& op, const model::SchemaSnapshot& live) {
  if (StrategyFor(OpKind::kRenameColumn) == Strategy::kDirect) {
    Exec(renderer_.RenameColumn(op.table, op.from, op.to));
    return;
  }

  const auto& table  = LiveTable(live, op.table);
  auto        target = table;
  if (auto* column = target.FindColumn(op.from)) column->name = op.to;
  for (auto& fk : target.foreign_keys) RenameIn(fk.columns, op.from, op.to);
  for (auto& index : target.indexes) RenameIn(index.columns, op.from, op.to);
  Rebuild(table, target, {{op.to, op.from}});
}

void DialectAdapter::Apply(const model::AlterColumn& op, const model::SchemaSnapshot& live) {
  if (StrategyFor(OpKind::kAlterColumn) == Strategy::kDirect) {
    const bool* nullable = op.nullable ? &*op.nullable : nullptr;
    for (const auto& sql : renderer_.AlterColumn(op.table, op.column, op.type ? &*op.type : nullptr, nullable)) {
      Exec(sql);
    }
    return;
  }

  const auto& table  = LiveTable(live, op.table);
  auto        target = table;
  auto*       column = target.FindColumn(op.column);
  if (!column) {
    throw OperationError("column " + op.table + "." + op.column + " does not exist");
  }
  if (op.type) column->type = *op.type;
  if (op.nullable) column->nullable = *op.nullable;
  Rebuild(table, target);
}

void DialectAdapter::Apply(const model::CreateTable& op, const model::SchemaSnapshot&) {
  Exec(renderer_.CreateTable(op.table));
  for (const auto& index : op.table.indexes) {
    Exec(renderer_.CreateIndex(index, op.table.name));
  }
}

void DialectAdapter::Apply(const model::DropTable& op, const model::SchemaSnapshot&) {
  Exec(renderer_.DropTable(op.table));
}

void DialectAdapter::Apply(const model::AddForeignKey& op, const model::SchemaSnapshot& live) {
  if (StrategyFor(OpKind::kAddForeignKey) == Strategy::kDirect) {
    Exec(renderer_.AddForeignKey(op.table, op.foreign_key));
    return;
  }

  const auto& table  = LiveTable(live, op.table);
  auto        target = table;
  target.foreign_keys.push_back(op.foreign_key);
  Rebuild(table, target);
}

void DialectAdapter::Apply(const model::DropForeignKey& op, const model::SchemaSnapshot& live) {
  if (StrategyFor(OpKind::kDropForeignKey) == Strategy::kDirect) {
    Exec(renderer_.DropForeignKey(op.table, op.name));
    return;
  }

  const auto& table  = LiveTable(live, op.table);
  auto        target = table;
  auto        before = target.foreign_keys.size();
  target.foreign_keys.erase(
      std::remove_if(target.foreign_keys.begin(), target.foreign_keys.end(), [&](const auto& fk) { return fk.name == op.name; }),
      target.foreign_keys.end());
  if (target.foreign_keys.size() == before) {
    throw OperationError("foreign key " + op.name + " not found on " + op.table);
  }
  Rebuild(table, target);
}

void DialectAdapter::Apply(const model::CreateIndex& op, const model::SchemaSnapshot&) {
  Exec(renderer_.CreateIndex(op.index));
}

void DialectAdapter::Apply(const model::DropIndex& op, const model::SchemaSnapshot&) {
  Exec(renderer_.DropIndex(op.name));
}

void DialectAdapter::Apply(const model::RebuildTable& op, const model::SchemaSnapshot& live) {
  Rebuild(LiveTable(live, op.target.name), op.target, op.source_columns);
}

void DialectAdapter::Apply(const model::ExecuteSql& op, const model::SchemaSnapshot&) {
  Exec(op.sql);
}

} // namespace schemaflow::dialect
