#include "internal/dialect/sql_renderer.hpp"

#include "internal/db/sql/type_mapping.hpp"

namespace schemaflow::dialect {

namespace {

std::string Quote(std::string_view name) {
  return db::Connection::QuoteIdentifier(name);
}

std::string QuoteList(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += Quote(name);
  }
  return out;
}

} // namespace

std::string SqlRenderer::Column(const model::ColumnDef& column, bool inline_primary_key) const {
  const bool pg = dialect_ == db::Dialect::kPostgres;

  std::string out = Quote(column.name) + " " + db::sql::RenderType(dialect_, column.type);
  if (column.autoincrement && pg) out += " GENERATED BY DEFAULT AS IDENTITY";
  if (!column.nullable || column.primary_key) out += " NOT NULL";
  if (column.primary_key && inline_primary_key) {
    out += " PRIMARY KEY";
    if (column.autoincrement && !pg) out += " AUTOINCREMENT";
  }
  if (column.default_value) out += " DEFAULT " + *column.default_value;
  return out;
}

std::string SqlRenderer::ForeignKeyClause(const model::ForeignKeyDef& fk) const {
  std::string out;
  if (!fk.name.empty()) out += "CONSTRAINT " + Quote(fk.name) + " ";
  out += "FOREIGN KEY (" + QuoteList(fk.columns) + ") REFERENCES " + Quote(fk.ref_table) + " (" + QuoteList(fk.ref_columns) + ")";
  if (!fk.on_delete.empty()) out += " ON DELETE " + fk.on_delete;
  return out;
}

std::string SqlRenderer::CreateTable(const model::TableSchema& table, std::string_view name) const {
  const auto pk        = table.PrimaryKey();
  const bool inline_pk = pk.size() == 1;

  std::string body;
  for (const auto& column : table.columns) {
    if (!body.empty()) body += ", ";
    body += Column(column, inline_pk);
  }
  if (pk.size() > 1) body += ", PRIMARY KEY (" + QuoteList(pk) + ")";
  for (const auto& fk : table.foreign_keys) {
    body += ", " + ForeignKeyClause(fk);
  }

  return "CREATE TABLE " + Quote(name.empty() ? std::string_view(table.name) : name) + " (" + body + ");";
}

std::string SqlRenderer::DropTable(std::string_view table) const {
  return "DROP TABLE " + Quote(table) + ";";
}

std::string SqlRenderer::RenameTable(std::string_view from, std::string_view to) const {
  return "ALTER TABLE " + Quote(from) + " RENAME TO " + Quote(to) + ";";
}

std::string SqlRenderer::AddColumn(std::string_view table, const model::ColumnDef& column) const {
  return "ALTER TABLE " + Quote(table) + " ADD COLUMN " + Column(column, true) + ";";
}

std::string SqlRenderer::DropColumn(std::string_view table, std::string_view column) const {
  return "ALTER TABLE " + Quote(table) + " DROP COLUMN " + Quote(column) + ";";
}

std::string SqlRenderer::RenameColumn(std::string_view table, std::string_view from, std::string_view to) const {
  return "ALTER TABLE " + Quote(table) + " RENAME COLUMN " + Quote(from) + " TO " + Quote(to) + ";";
}

std::vector<std::string> SqlRenderer::AlterColumn(std::string_view table, std::string_view column, const model::TypeSpec* type,
                                                  const bool* nullable) const {
  const std::string prefix = "ALTER TABLE " + Quote(table) + " ALTER COLUMN " + Quote(column);

  std::vector<std::string> out;
  if (type) {
    const auto rendered = db::sql::RenderType(dialect_, *type);
    out.push_back(prefix + " TYPE " + rendered + " USING " + Quote(column) + "::" + rendered + ";");
  }
  if (nullable) {
    out.push_back(prefix + (*nullable ? " DROP NOT NULL;" : " SET NOT NULL;"));
  }
  return out;
}

std::string SqlRenderer::AddForeignKey(std::string_view table, const model::ForeignKeyDef& fk) const {
  return "ALTER TABLE " + Quote(table) + " ADD " + ForeignKeyClause(fk) + ";";
}

std::string SqlRenderer::DropForeignKey(std::string_view table, std::string_view name) const {
  return "ALTER TABLE " + Quote(table) + " DROP CONSTRAINT " + Quote(name) + ";";
}

std::string SqlRenderer::CreateIndex(const model::IndexDef& index, std::string_view table) const {
  return std::string("CREATE ") + (index.unique ? "UNIQUE " : "") + "INDEX " + Quote(index.name) + " ON " +
         Quote(table.empty() ? std::string_view(index.table) : table) + " (" + QuoteList(index.columns) + ");";
}

std::string SqlRenderer::DropIndex(std::string_view name) const {
  return "DROP INDEX " + Quote(name) + ";";
}

std::string SqlRenderer::CopyRows(std::string_view from, std::string_view to,
                                  const std::vector<std::pair<std::string, std::string>>& target_to_source) const {
  std::string targets;
  std::string sources;
  for (const auto& [target, source] : target_to_source) {
    if (!targets.empty()) {
      targets += ", ";
      sources += ", ";
    }
    targets += Quote(target);
    sources += Quote(source);
  }
  return "INSERT INTO " + Quote(to) + " (" + targets + ") SELECT " + sources + " FROM " + Quote(from) + ";";
}

std::string SqlRenderer::CountRows(std::string_view table) const {
  return "SELECT COUNT(*) FROM " + Quote(table) + ";";
}

std::vector<std::string> SqlRenderer::AfterSwap(const model::TableSchema& target, std::string_view shadow) const {
  std::vector<std::string> out;
  if (dialect_ != db::Dialect::kPostgres) return out;

  const std::string table = Quote(target.name);
  if (!target.PrimaryKey().empty()) {
    out.push_back("ALTER TABLE " + table + " RENAME CONSTRAINT " + Quote(std::string(shadow) + "_pkey") + " TO " + Quote(target.name + "_pkey") +
                  ";");
  }
  for (const auto& column : target.columns) {
    if (!column.autoincrement) continue;
    const std::string sequence = target.name + "_" + column.name + "_seq";
    out.push_back("ALTER SEQUENCE " + Quote(std::string(shadow) + "_" + column.name + "_seq") + " RENAME TO " + Quote(sequence) + ";");
    out.push_back("SELECT setval(pg_get_serial_sequence('" + table + "', '" + column.name + "'), COALESCE(MAX(" + Quote(column.name) +
                  "), 0) + 1, false) FROM " + table + ";");
  }
  return out;
}

} // namespace schemaflow::dialect
