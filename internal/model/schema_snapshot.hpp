#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/table_schema.hpp"

namespace schemaflow::model {

/*
  Point-in-time view of the live catalog, as reported by a db::Connection.

  Reserved tables (version/history, rebuild shadows) are included; callers
  that compare snapshots filter them with WithoutTables().
*/
struct SchemaSnapshot {
  std::map<std::string, TableSchema> tables;

  bool HasTable(std::string_view name) const {
    return tables.find(std::string(name)) != tables.end();
  }

  const TableSchema* FindTable(std::string_view name) const {
    auto it = tables.find(std::string(name));
    return it == tables.end() ? nullptr : &it->second;
  }

  // Index names are global in SQLite and per-schema in PostgreSQL.
  const IndexDef* FindIndex(std::string_view index_name) const;

  SchemaSnapshot WithoutTables(const std::vector<std::string>& names) const;
};

// Columns, foreign keys (by target) and indexes (by name) agree.
bool SameTable(const TableSchema& a, const TableSchema& b);

// Column sets, types, nullability, foreign keys and indexes all agree.
bool StructurallyEqual(const SchemaSnapshot& a, const SchemaSnapshot& b);

} // namespace schemaflow::model
