#include "internal/guard/idempotency_guard.hpp"

#include <variant>

#include "internal/dialect/rebuild_strategy.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::guard {

using util::IdempotencyConflict;

namespace {

struct ShouldApplyVisitor {
  const model::SchemaSnapshot& live;

  const model::TableSchema& Table(const std::string& name, const model::SchemaOp& op) const {
    const auto* table = live.FindTable(name);
    if (!table) {
      throw IdempotencyConflict(model::Describe(op) + ": table " + name + " does not exist");
    }
    return *table;
  }

  [[noreturn]] static void Conflict(const model::SchemaOp& op, const std::string& what) {
    throw IdempotencyConflict(model::Describe(op) + ": " + what);
  }

  bool operator()(const model::AddColumn& o) const {
    const auto& table = Table(o.table, o);
    const auto* have  = table.FindColumn(o.column.name);
    if (!have) return true;
    if (model::SameShape(*have, o.column)) return false;
    Conflict(o, "column exists as " + model::DescribeType(have->type) + (have->nullable ? " NULL" : " NOT NULL"));
  }

  bool operator()(const model::DropColumn& o) const {
    return Table(o.table, o).FindColumn(o.column) != nullptr;
  }

  bool operator()(const model::RenameColumn& o) const {
    const auto& table    = Table(o.table, o);
    const bool  has_from = table.FindColumn(o.from) != nullptr;
    const bool  has_to   = table.FindColumn(o.to) != nullptr;
    if (has_from && !has_to) return true;
    if (!has_from && has_to) return false;
    Conflict(o, has_from ? "both columns exist" : "neither column exists");
  }

  bool operator()(const model::AlterColumn& o) const {
    const auto* column = Table(o.table, o).FindColumn(o.column);
    if (!column) Conflict(o, "column does not exist");

    const bool at_target = (!o.type || column->type == *o.type) && (!o.nullable || column->nullable == *o.nullable);
    if (at_target) return false;

    const bool at_source =
        (!o.existing_type || column->type == *o.existing_type) && (!o.existing_nullable || column->nullable == *o.existing_nullable);
    if (at_source) return true;

    Conflict(o, "live column is " + model::DescribeType(column->type) + (column->nullable ? " NULL" : " NOT NULL"));
  }

  bool operator()(const model::CreateTable& o) const {
    const auto* have = live.FindTable(o.table.name);
    if (!have) return true;
    if (model::SameColumns(*have, o.table)) return false;
    Conflict(o, "table exists with different columns");
  }

  bool operator()(const model::DropTable& o) const {
    return live.HasTable(o.table);
  }

  bool operator()(const model::AddForeignKey& o) const {
    const auto& table = Table(o.table, o);
    if (const auto* have = table.FindForeignKey(o.foreign_key.name)) {
      if (model::SameTarget(*have, o.foreign_key)) return false;
      Conflict(o, "constraint exists with a different target");
    }
    return true;
  }

  bool operator()(const model::DropForeignKey& o) const {
    return Table(o.table, o).FindForeignKey(o.name) != nullptr;
  }

  bool operator()(const model::CreateIndex& o) const {
    Table(o.index.table, o);
    const auto* have = live.FindIndex(o.index.name);
    if (!have) return true;
    if (model::SameShape(*have, o.index)) return false;
    Conflict(o, "index exists with a different definition");
  }

  bool operator()(const model::DropIndex& o) const {
    return live.FindIndex(o.name) != nullptr;
  }

  bool operator()(const model::RebuildTable& o) const {
    const auto& table = Table(o.target.name, o);
    if (live.HasTable(dialect::RebuildStrategy::ShadowName(o.target.name))) return true;
    return !model::SameTable(table, o.target);
  }

  bool operator()(const model::ExecuteSql&) const {
    return true;
  }
};

} // namespace

bool IdempotencyGuard::ShouldApply(const model::SchemaOp& op, const model::SchemaSnapshot& live) {
  return std::visit(ShouldApplyVisitor{live}, op);
}

} // namespace schemaflow::guard
