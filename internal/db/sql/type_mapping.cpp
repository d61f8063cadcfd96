#include "internal/db/sql/type_mapping.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace schemaflow::db::sql {

using model::ColumnType;
using model::TypeSpec;

namespace {

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

TypeSpec ParseSqlite(const std::string& declared) {
  std::string upper = Upper(Trim(declared));
  std::string base  = Trim(upper.substr(0, upper.find('(')));

  if (base == "INTEGER" || base == "INT") return {ColumnType::kInteger, 0};
  if (base == "BIGINT") return {ColumnType::kBigInt, 0};
  if (base == "FLOAT" || base == "REAL" || base == "DOUBLE" || base == "DOUBLE PRECISION") return {ColumnType::kFloat, 0};
  if (base == "TEXT") return {ColumnType::kText, 0};
  if (base == "VARCHAR" || base == "CHARACTER VARYING") {
    int  length = 0;
    auto open   = upper.find('(');
    if (open != std::string::npos) length = std::atoi(upper.c_str() + open + 1);
    return {ColumnType::kString, length};
  }
  if (base == "BOOLEAN" || base == "BOOL") return {ColumnType::kBoolean, 0};
  if (base == "DATETIME" || base == "TIMESTAMP") return {ColumnType::kDateTime, 0};
  if (base == "JSON") return {ColumnType::kJson, 0};
  if (base == "BLOB") return {ColumnType::kBlob, 0};
  return {ColumnType::kUnknown, 0};
}

TypeSpec ParsePostgres(const std::string& data_type, int length) {
  if (data_type == "integer") return {ColumnType::kInteger, 0};
  if (data_type == "bigint") return {ColumnType::kBigInt, 0};
  if (data_type == "double precision" || data_type == "real") return {ColumnType::kFloat, 0};
  if (data_type == "text") return {ColumnType::kText, 0};
  if (data_type == "character varying") return {ColumnType::kString, length};
  if (data_type == "boolean") return {ColumnType::kBoolean, 0};
  if (data_type == "timestamp without time zone") return {ColumnType::kDateTime, 0};
  if (data_type == "jsonb" || data_type == "json") return {ColumnType::kJson, 0};
  if (data_type == "bytea") return {ColumnType::kBlob, 0};
  return {ColumnType::kUnknown, 0};
}

} // namespace

std::string RenderType(Dialect dialect, const TypeSpec& spec) {
  const bool pg = dialect == Dialect::kPostgres;
  switch (spec.type) {
    case ColumnType::kInteger:
      return "INTEGER";
    case ColumnType::kBigInt:
      return "BIGINT";
    case ColumnType::kFloat:
      return pg ? "DOUBLE PRECISION" : "FLOAT";
    case ColumnType::kText:
      return "TEXT";
    case ColumnType::kString:
      return spec.length > 0 ? "VARCHAR(" + std::to_string(spec.length) + ")" : "VARCHAR";
    case ColumnType::kBoolean:
      return "BOOLEAN";
    case ColumnType::kDateTime:
      return pg ? "TIMESTAMP" : "DATETIME";
    case ColumnType::kJson:
      return pg ? "JSONB" : "JSON";
    case ColumnType::kBlob:
      return pg ? "BYTEA" : "BLOB";
    case ColumnType::kUnknown:
      break;
  }
  return "TEXT";
}

TypeSpec ParseType(Dialect dialect, const std::string& declared, int length) {
  return dialect == Dialect::kPostgres ? ParsePostgres(declared, length) : ParseSqlite(declared);
}

} // namespace schemaflow::db::sql
