#include "internal/model/schema_snapshot.hpp"

#include <algorithm>

namespace schemaflow::model {

const IndexDef* SchemaSnapshot::FindIndex(std::string_view index_name) const {
  for (const auto& [_, table] : tables) {
    if (const auto* index = table.FindIndex(index_name)) return index;
  }
  return nullptr;
}

SchemaSnapshot SchemaSnapshot::WithoutTables(const std::vector<std::string>& names) const {
  SchemaSnapshot out = *this;
  for (const auto& name : names) {
    out.tables.erase(name);
  }
  return out;
}

static bool SameForeignKeys(const TableSchema& a, const TableSchema& b) {
  if (a.foreign_keys.size() != b.foreign_keys.size()) return false;
  return std::all_of(a.foreign_keys.begin(), a.foreign_keys.end(), [&](const ForeignKeyDef& fk) {
    return std::any_of(b.foreign_keys.begin(), b.foreign_keys.end(),
                       [&](const ForeignKeyDef& other) { return SameTarget(fk, other) && fk.on_delete == other.on_delete; });
  });
}

static bool SameIndexes(const TableSchema& a, const TableSchema& b) {
  if (a.indexes.size() != b.indexes.size()) return false;
  return std::all_of(a.indexes.begin(), a.indexes.end(), [&](const IndexDef& index) {
    const auto* other = b.FindIndex(index.name);
    return other && SameShape(index, *other);
  });
}

bool SameTable(const TableSchema& a, const TableSchema& b) {
  return SameColumns(a, b) && SameForeignKeys(a, b) && SameIndexes(a, b);
}

bool StructurallyEqual(const SchemaSnapshot& a, const SchemaSnapshot& b) {
  if (a.tables.size() != b.tables.size()) return false;
  for (const auto& [name, table] : a.tables) {
    const auto* other = b.FindTable(name);
    if (!other || !SameTable(table, *other)) return false;
  }
  return true;
}

} // namespace schemaflow::model
