#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemaflow::model {

/*
  Portable column types.

  Each dialect renders these to its own spelling and parses its catalog
  back into them. kUnknown marks a live column whose declared type has
  no portable equivalent; it never matches a desired definition.
*/
enum class ColumnType : std::uint8_t {
  kUnknown = 0,
  kInteger,
  kBigInt,
  kFloat,
  kText,
  kString,
  kBoolean,
  kDateTime,
  kJson,
  kBlob,
};

std::string_view            ColumnTypeName(ColumnType type);
std::optional<ColumnType>   ParseColumnTypeName(std::string_view name);

struct TypeSpec {
  ColumnType type   = ColumnType::kText;
  int        length = 0; // kString only

  bool operator==(const TypeSpec& other) const {
    return type == other.type && (type != ColumnType::kString || length == other.length);
  }
  bool operator!=(const TypeSpec& other) const {
    return !(*this == other);
  }
};

std::string DescribeType(const TypeSpec& spec);

struct ColumnDef {
  std::string                name;
  TypeSpec                   type;
  bool                       nullable = true;
  std::optional<std::string> default_value; // raw SQL expression
  bool                       primary_key   = false;
  bool                       autoincrement = false;
};

// Structural match used by the idempotency guard. Defaults are not
// compared: backends echo them back in their own normalized spelling.
bool SameShape(const ColumnDef& a, const ColumnDef& b);

struct ForeignKeyDef {
  std::string              name; // may be empty for live SQLite keys declared without CONSTRAINT
  std::vector<std::string> columns;
  std::string              ref_table;
  std::vector<std::string> ref_columns;
  std::string              on_delete; // "", "CASCADE", "SET NULL", "RESTRICT", ...
};

bool SameTarget(const ForeignKeyDef& a, const ForeignKeyDef& b);

struct IndexDef {
  std::string              name;
  std::string              table;
  std::vector<std::string> columns;
  bool                     unique = false;
};

bool SameShape(const IndexDef& a, const IndexDef& b);

struct TableSchema {
  std::string                name;
  std::vector<ColumnDef>     columns;
  std::vector<ForeignKeyDef> foreign_keys;
  std::vector<IndexDef>      indexes;

  const ColumnDef*     FindColumn(std::string_view column) const;
  ColumnDef*           FindColumn(std::string_view column);
  const ForeignKeyDef* FindForeignKey(std::string_view fk_name) const;
  const IndexDef*      FindIndex(std::string_view index_name) const;

  std::vector<std::string> PrimaryKey() const;
};

// Same column names with the same shape; declaration order is ignored.
bool SameColumns(const TableSchema& a, const TableSchema& b);

} // namespace schemaflow::model
