#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/model/table_schema.hpp"

namespace schemaflow::dialect {

/*
  Renders structural statements for one dialect.

  All identifiers are quoted. Primary key columns are always NOT NULL
  (SQLite would otherwise report INTEGER PRIMARY KEY as nullable).
  Autoincrement renders as AUTOINCREMENT on SQLite and as an identity
  column on PostgreSQL.
*/
class SqlRenderer {
 public:
  explicit SqlRenderer(db::Dialect dialect) : dialect_(dialect) {
  }

  db::Dialect Kind() const {
    return dialect_;
  }

  std::string Column(const model::ColumnDef& column, bool inline_primary_key) const;

  // name overrides table.name (used for rebuild shadows). Indexes are
  // not part of the statement; see CreateIndex.
  std::string CreateTable(const model::TableSchema& table, std::string_view name = {}) const;
  std::string DropTable(std::string_view table) const;
  std::string RenameTable(std::string_view from, std::string_view to) const;

  std::string AddColumn(std::string_view table, const model::ColumnDef& column) const;
  std::string DropColumn(std::string_view table, std::string_view column) const;
  std::string RenameColumn(std::string_view table, std::string_view from, std::string_view to) const;

  // PostgreSQL only; one statement per changed attribute.
  std::vector<std::string> AlterColumn(std::string_view table, std::string_view column, const model::TypeSpec* type, const bool* nullable) const;

  // PostgreSQL only.
  std::string AddForeignKey(std::string_view table, const model::ForeignKeyDef& fk) const;
  std::string DropForeignKey(std::string_view table, std::string_view name) const;

  std::string CreateIndex(const model::IndexDef& index, std::string_view table = {}) const;
  std::string DropIndex(std::string_view name) const;

  // INSERT INTO to (targets...) SELECT sources... FROM from
  std::string CopyRows(std::string_view from, std::string_view to, const std::vector<std::pair<std::string, std::string>>& target_to_source) const;
  std::string CountRows(std::string_view table) const;

  // After a shadow was renamed to table: PostgreSQL keeps the shadow's
  // primary key and identity sequence names and the sequence position.
  // Empty for SQLite, which renames both along with the table.
  std::vector<std::string> AfterSwap(const model::TableSchema& target, std::string_view shadow) const;

 private:
  std::string ForeignKeyClause(const model::ForeignKeyDef& fk) const;

  db::Dialect dialect_;
};

} // namespace schemaflow::dialect
