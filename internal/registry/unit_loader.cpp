#include "internal/registry/unit_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <functional>
#include <map>
#include <set>

#include "internal/util/errors.hpp"

namespace schemaflow::registry {

using util::UnitFormatError;

namespace {

// Field access with errors that name the unit file and the offending key.
class Reader {
 public:
  Reader(const YAML::Node& node, std::string source, std::string where)
      : node_(node), source_(std::move(source)), where_(std::move(where)) {
    if (!node_.IsMap()) Fail("expected a mapping");
  }

  [[noreturn]] void Fail(const std::string& what) const {
    throw UnitFormatError(source_ + ": " + where_ + ": " + what);
  }

  bool Has(const char* key) const {
    return node_[key].IsDefined() && !node_[key].IsNull();
  }

  YAML::Node Node(const char* key) const {
    return node_[key];
  }

  std::string RequiredString(const char* key) const {
    if (!Has(key)) Fail(std::string("missing '") + key + "'");
    return Scalar<std::string>(key);
  }

  std::string OptionalString(const char* key, std::string fallback = {}) const {
    return Has(key) ? Scalar<std::string>(key) : std::move(fallback);
  }

  bool OptionalBool(const char* key, bool fallback) const {
    return Has(key) ? Scalar<bool>(key) : fallback;
  }

  int OptionalInt(const char* key, int fallback) const {
    return Has(key) ? Scalar<int>(key) : fallback;
  }

  std::vector<std::string> StringList(const char* key, bool required) const {
    if (!Has(key)) {
      if (required) Fail(std::string("missing '") + key + "'");
      return {};
    }
    auto node = node_[key];
    if (node.IsScalar()) return {node.as<std::string>()};
    if (!node.IsSequence()) Fail(std::string("'") + key + "' must be a string or a list");
    std::vector<std::string> out;
    for (const auto& item : node) {
      if (!item.IsScalar()) Fail(std::string("'") + key + "' entries must be strings");
      out.push_back(item.as<std::string>());
    }
    return out;
  }

  Reader Child(const char* key) const {
    if (!Has(key)) Fail(std::string("missing '") + key + "'");
    return Reader(node_[key], source_, where_ + "." + key);
  }

  Reader At(const YAML::Node& node, const std::string& where) const {
    return Reader(node, source_, where_ + where);
  }

  const std::string& Source() const {
    return source_;
  }

 private:
  template <typename T>
  T Scalar(const char* key) const {
    auto node = node_[key];
    if (!node.IsScalar()) Fail(std::string("'") + key + "' must be a scalar");
    try {
      return node.as<T>();
    } catch (const YAML::BadConversion&) {
      Fail(std::string("'") + key + "' has the wrong type");
    }
  }

  YAML::Node  node_;
  std::string source_;
  std::string where_;
};

model::TypeSpec ParseTypeSpec(const Reader& r, const char* type_key, const char* length_key) {
  const auto name = r.RequiredString(type_key);
  auto       type = model::ParseColumnTypeName(name);
  if (!type) r.Fail("unknown column type '" + name + "'");
  return {*type, r.OptionalInt(length_key, 0)};
}

model::ColumnDef ParseColumn(const Reader& r) {
  model::ColumnDef column;
  column.name          = r.RequiredString("name");
  column.type          = ParseTypeSpec(r, "type", "length");
  column.primary_key   = r.OptionalBool("primary_key", false);
  column.autoincrement = r.OptionalBool("autoincrement", false);
  column.nullable      = r.OptionalBool("nullable", !column.primary_key);
  if (column.primary_key) column.nullable = false;
  if (r.Has("default")) column.default_value = r.OptionalString("default");
  if (column.autoincrement && (!column.primary_key || column.type.type != model::ColumnType::kInteger)) {
    r.Fail("autoincrement requires an integer primary_key column");
  }
  return column;
}

model::ForeignKeyDef ParseForeignKey(const Reader& r) {
  model::ForeignKeyDef fk;
  fk.name        = r.RequiredString("name");
  fk.columns     = r.StringList("columns", true);
  fk.ref_table   = r.RequiredString("ref_table");
  fk.ref_columns = r.StringList("ref_columns", true);
  fk.on_delete   = r.OptionalString("on_delete");
  std::transform(fk.on_delete.begin(), fk.on_delete.end(), fk.on_delete.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (fk.columns.size() != fk.ref_columns.size()) r.Fail("columns and ref_columns differ in length");
  return fk;
}

model::IndexDef ParseIndex(const Reader& r, const std::string& table) {
  model::IndexDef index;
  index.name    = r.RequiredString("name");
  index.table   = table.empty() ? r.RequiredString("table") : table;
  index.columns = r.StringList("columns", true);
  index.unique  = r.OptionalBool("unique", false);
  return index;
}

template <typename T, typename Fn>
std::vector<T> ParseList(const Reader& r, const char* key, Fn&& parse_item) {
  std::vector<T> out;
  if (!r.Has(key)) return out;
  auto node = r.Node(key);
  if (!node.IsSequence()) r.Fail(std::string("'") + key + "' must be a list");
  for (std::size_t i = 0; i < node.size(); ++i) {
    out.push_back(parse_item(r.At(node[i], std::string(".") + key + "[" + std::to_string(i) + "]")));
  }
  return out;
}

model::TableSchema ParseTable(const Reader& r) {
  model::TableSchema table;
  table.name         = r.RequiredString("name");
  table.columns      = ParseList<model::ColumnDef>(r, "columns", ParseColumn);
  table.foreign_keys = ParseList<model::ForeignKeyDef>(r, "foreign_keys", ParseForeignKey);
  table.indexes      = ParseList<model::IndexDef>(r, "indexes", [&](const Reader& item) { return ParseIndex(item, table.name); });

  if (table.columns.empty()) r.Fail("table " + table.name + " has no columns");
  std::set<std::string> names;
  for (const auto& c : table.columns) {
    if (!names.insert(c.name).second) r.Fail("duplicate column " + c.name);
  }
  return table;
}

using OpParser = std::function<model::SchemaOp(const Reader&)>;

const std::map<std::string, OpParser>& OpParsers() {
  static const std::map<std::string, OpParser> kParsers = {
      {"add_column",
       [](const Reader& r) -> model::SchemaOp {
         return model::AddColumn{r.RequiredString("table"), ParseColumn(r.Child("column"))};
       }},
      {"drop_column",
       [](const Reader& r) -> model::SchemaOp {
         return model::DropColumn{r.RequiredString("table"), r.RequiredString("column")};
       }},
      {"rename_column",
       [](const Reader& r) -> model::SchemaOp {
         return model::RenameColumn{r.RequiredString("table"), r.RequiredString("from"), r.RequiredString("to")};
       }},
      {"alter_column",
       [](const Reader& r) -> model::SchemaOp {
         model::AlterColumn op;
         op.table  = r.RequiredString("table");
         op.column = r.RequiredString("column");
         if (r.Has("type")) op.type = ParseTypeSpec(r, "type", "length");
         if (r.Has("nullable")) op.nullable = r.OptionalBool("nullable", true);
         if (r.Has("existing_type")) op.existing_type = ParseTypeSpec(r, "existing_type", "existing_length");
         if (r.Has("existing_nullable")) op.existing_nullable = r.OptionalBool("existing_nullable", true);
         if (!op.type && !op.nullable) r.Fail("alter_column changes nothing");
         return op;
       }},
      {"create_table",
       [](const Reader& r) -> model::SchemaOp {
         return model::CreateTable{ParseTable(r)};
       }},
      {"drop_table",
       [](const Reader& r) -> model::SchemaOp {
         return model::DropTable{r.RequiredString("table")};
       }},
      {"add_foreign_key",
       [](const Reader& r) -> model::SchemaOp {
         return model::AddForeignKey{r.RequiredString("table"), ParseForeignKey(r)};
       }},
      {"drop_foreign_key",
       [](const Reader& r) -> model::SchemaOp {
         return model::DropForeignKey{r.RequiredString("table"), r.RequiredString("name")};
       }},
      {"create_index",
       [](const Reader& r) -> model::SchemaOp {
         return model::CreateIndex{ParseIndex(r, {})};
       }},
      {"drop_index",
       [](const Reader& r) -> model::SchemaOp {
         return model::DropIndex{r.RequiredString("table"), r.RequiredString("name")};
       }},
      {"rebuild_table",
       [](const Reader& r) -> model::SchemaOp {
         model::RebuildTable op;
         op.target = ParseTable(r);
         if (r.Has("source_columns")) {
           auto node = r.Node("source_columns");
           if (!node.IsMap()) r.Fail("'source_columns' must be a mapping");
           for (auto it : node) {
             if (!it.first.IsScalar() || !it.second.IsScalar()) r.Fail("'source_columns' maps column names to column names");
             op.source_columns[it.first.as<std::string>()] = it.second.as<std::string>();
           }
         }
         return op;
       }},
  };
  return kParsers;
}

model::SchemaOp ParseOp(const Reader& list, const YAML::Node& entry, const std::string& where) {
  if (!entry.IsMap() || entry.size() != 1) list.Fail(where + ": each operation is a single-key mapping");

  auto it = entry.begin();
  if (!it->first.IsScalar()) list.Fail(where + ": operation kind must be a string");
  const auto kind = it->first.as<std::string>();
  const auto body = it->second;

  // execute takes either a bare string or {sql: ...}
  if (kind == "execute") {
    if (body.IsScalar()) return model::ExecuteSql{body.as<std::string>()};
    return model::ExecuteSql{list.At(body, where + ".execute").RequiredString("sql")};
  }

  const auto& parsers = OpParsers();
  auto        parser  = parsers.find(kind);
  if (parser == parsers.end()) list.Fail(where + ": unknown operation '" + kind + "'");
  return parser->second(list.At(body, where + "." + kind));
}

std::vector<model::SchemaOp> ParseOps(const Reader& doc, const char* key) {
  std::vector<model::SchemaOp> ops;
  if (!doc.Has(key)) return ops;
  auto node = doc.Node(key);
  if (!node.IsSequence()) doc.Fail(std::string("'") + key + "' must be a list");
  for (std::size_t i = 0; i < node.size(); ++i) {
    ops.push_back(ParseOp(doc, node[i], std::string(".") + key + "[" + std::to_string(i) + "]"));
  }
  return ops;
}

} // namespace

model::MigrationUnit UnitLoader::Parse(const YAML::Node& doc, const std::string& source) {
  Reader r(doc, source, "unit");

  const auto id = r.RequiredString("id");
  if (id.empty()) r.Fail("empty id");

  if (r.Has("down_revision") && r.Has("parents")) r.Fail("give either 'down_revision' or 'parents'");
  auto parents = r.StringList(r.Has("parents") ? "parents" : "down_revision", false);

  return model::MigrationUnit(id, std::move(parents), ParseOps(r, "upgrade"), ParseOps(r, "downgrade"), r.OptionalString("description"),
                              source);
}

model::MigrationUnit UnitLoader::LoadString(const std::string& yaml, const std::string& source) {
  YAML::Node doc;
  try {
    doc = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw UnitFormatError(source + ": malformed YAML: " + e.what());
  }
  return Parse(doc, source);
}

model::MigrationUnit UnitLoader::LoadFile(const std::string& path) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw UnitFormatError(path + ": malformed YAML: " + e.what());
  }
  return Parse(doc, path);
}

std::vector<model::MigrationUnit> UnitLoader::LoadDirectory(const std::string& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    throw UnitFormatError(dir + ": not a migrations directory");
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const auto ext = entry.path().extension();
    if (ext == ".yaml" || ext == ".yml") files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<model::MigrationUnit> units;
  units.reserve(files.size());
  for (const auto& file : files) {
    units.push_back(LoadFile(file.string()));
  }
  return units;
}

} // namespace schemaflow::registry
