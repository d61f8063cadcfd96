#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/table_schema.hpp"

namespace schemaflow::model {

/*
  Closed set of schema operations a migration unit can carry.

  Every alternative names its target table and carries enough payload to
  be executed directly, executed through a rebuild, or checked by the
  idempotency guard against the live catalog.
*/

enum class OpKind : std::uint8_t {
  kAddColumn,
  kDropColumn,
  kRenameColumn,
  kAlterColumn,
  kCreateTable,
  kDropTable,
  kAddForeignKey,
  kDropForeignKey,
  kCreateIndex,
  kDropIndex,
  kRebuildTable,
  kExecuteSql,
};

struct AddColumn {
  std::string table;
  ColumnDef   column;
};

struct DropColumn {
  std::string table;
  std::string column;
};

struct RenameColumn {
  std::string table;
  std::string from;
  std::string to;
};

// Unset fields are left unchanged. existing_* describe the expected
// pre-state; when given, a live column matching neither side is a conflict.
struct AlterColumn {
  std::string             table;
  std::string             column;
  std::optional<TypeSpec> type;
  std::optional<bool>     nullable;
  std::optional<TypeSpec> existing_type;
  std::optional<bool>     existing_nullable;
};

struct CreateTable {
  TableSchema table;
};

struct DropTable {
  std::string table;
};

struct AddForeignKey {
  std::string   table;
  ForeignKeyDef foreign_key;
};

struct DropForeignKey {
  std::string table;
  std::string name;
};

struct CreateIndex {
  IndexDef index;
};

struct DropIndex {
  std::string table;
  std::string name;
};

// Copy-and-swap to an explicit target definition. Target columns are
// filled from the source column of the same name unless source_columns
// maps them elsewhere; target columns with no source take their default.
struct RebuildTable {
  TableSchema                        target;
  std::map<std::string, std::string> source_columns;
};

// Raw data fix. Has no structural pre/post-condition.
struct ExecuteSql {
  std::string sql;
};

using SchemaOp = std::variant<AddColumn, DropColumn, RenameColumn, AlterColumn, CreateTable, DropTable, AddForeignKey, DropForeignKey,
                              CreateIndex, DropIndex, RebuildTable, ExecuteSql>;

OpKind           KindOf(const SchemaOp& op);
std::string_view OpKindName(OpKind kind);

// Table the operation touches; empty for ExecuteSql.
std::string TargetTable(const SchemaOp& op);

// One-line human readable summary for logs and reports.
std::string Describe(const SchemaOp& op);

} // namespace schemaflow::model
