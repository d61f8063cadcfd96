#include "internal/model/table_schema.hpp"

#include <algorithm>

namespace schemaflow::model {

std::string_view ColumnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::kInteger:
      return "integer";
    case ColumnType::kBigInt:
      return "bigint";
    case ColumnType::kFloat:
      return "float";
    case ColumnType::kText:
      return "text";
    case ColumnType::kString:
      return "string";
    case ColumnType::kBoolean:
      return "boolean";
    case ColumnType::kDateTime:
      return "datetime";
    case ColumnType::kJson:
      return "json";
    case ColumnType::kBlob:
      return "blob";
    case ColumnType::kUnknown:
      break;
  }
  return "unknown";
}

std::optional<ColumnType> ParseColumnTypeName(std::string_view name) {
  static constexpr ColumnType kAll[] = {ColumnType::kInteger, ColumnType::kBigInt,   ColumnType::kFloat,
                                        ColumnType::kText,    ColumnType::kString,   ColumnType::kBoolean,
                                        ColumnType::kDateTime, ColumnType::kJson,    ColumnType::kBlob};
  for (auto type : kAll) {
    if (ColumnTypeName(type) == name) return type;
  }
  return std::nullopt;
}

std::string DescribeType(const TypeSpec& spec) {
  std::string out(ColumnTypeName(spec.type));
  if (spec.type == ColumnType::kString && spec.length > 0) {
    out += "(" + std::to_string(spec.length) + ")";
  }
  return out;
}

bool SameShape(const ColumnDef& a, const ColumnDef& b) {
  return a.name == b.name && a.type == b.type && a.nullable == b.nullable;
}

bool SameTarget(const ForeignKeyDef& a, const ForeignKeyDef& b) {
  return a.columns == b.columns && a.ref_table == b.ref_table && a.ref_columns == b.ref_columns;
}

bool SameShape(const IndexDef& a, const IndexDef& b) {
  return a.table == b.table && a.columns == b.columns && a.unique == b.unique;
}

const ColumnDef* TableSchema::FindColumn(std::string_view column) const {
  auto it = std::find_if(columns.begin(), columns.end(), [&](const ColumnDef& c) { return c.name == column; });
  return it == columns.end() ? nullptr : &*it;
}

ColumnDef* TableSchema::FindColumn(std::string_view column) {
  auto it = std::find_if(columns.begin(), columns.end(), [&](const ColumnDef& c) { return c.name == column; });
  return it == columns.end() ? nullptr : &*it;
}

const ForeignKeyDef* TableSchema::FindForeignKey(std::string_view fk_name) const {
  auto it = std::find_if(foreign_keys.begin(), foreign_keys.end(), [&](const ForeignKeyDef& fk) { return fk.name == fk_name; });
  return it == foreign_keys.end() ? nullptr : &*it;
}

const IndexDef* TableSchema::FindIndex(std::string_view index_name) const {
  auto it = std::find_if(indexes.begin(), indexes.end(), [&](const IndexDef& idx) { return idx.name == index_name; });
  return it == indexes.end() ? nullptr : &*it;
}

std::vector<std::string> TableSchema::PrimaryKey() const {
  std::vector<std::string> out;
  for (const auto& column : columns) {
    if (column.primary_key) out.push_back(column.name);
  }
  return out;
}

bool SameColumns(const TableSchema& a, const TableSchema& b) {
  if (a.columns.size() != b.columns.size()) return false;
  for (const auto& column : a.columns) {
    const auto* other = b.FindColumn(column.name);
    if (!other || !SameShape(column, *other)) return false;
  }
  return true;
}

} // namespace schemaflow::model
