#include "pg_connection.hpp"

#include <map>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/db/sql/type_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::db::postgres {

namespace {

class PgRow final : public sql::Row {
 public:
  explicit PgRow(const pqxx::row& row) : row_(row) {
  }

  std::string GetText(int col) const override {
    return row_[col].is_null() ? "" : row_[col].c_str();
  }
  int GetInt(int col) const override {
    if (row_[col].is_null()) return 0;
    // booleans arrive as 't'/'f'
    std::string_view v = row_[col].c_str();
    if (v == "t") return 1;
    if (v == "f") return 0;
    return row_[col].as<int>();
  }
  int64_t GetInt64(int col) const override {
    return row_[col].is_null() ? 0 : row_[col].as<int64_t>();
  }
  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

 private:
  const pqxx::row& row_;
};

class PgRunLock final : public RunLock {
 public:
  PgRunLock(std::shared_ptr<pqxx::connection> conn, int64_t key) : conn_(std::move(conn)), key_(key) {
  }
  ~PgRunLock() override {
    try {
      pqxx::nontransaction ntx(*conn_);
      ntx.exec_prepared("sf_advisory_unlock", key_);
    } catch (const std::exception& e) {
      SCHEMAFLOW_LOG_WARN("advisory unlock failed", {observability::StringField("error", e.what())});
    }
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  int64_t                           key_;
};

pqxx::params ToParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

std::string DeleteRule(const std::string& code) {
  if (code == "c") return "CASCADE";
  if (code == "n") return "SET NULL";
  if (code == "d") return "SET DEFAULT";
  if (code == "r") return "RESTRICT";
  return "";
}

constexpr const char* kListTables =
    "SELECT table_name FROM information_schema.tables"
    " WHERE table_schema = current_schema() AND table_type = 'BASE TABLE' ORDER BY table_name;";

constexpr const char* kListColumns =
    "SELECT c.column_name, c.data_type, c.character_maximum_length, c.is_nullable, c.column_default, c.is_identity,"
    " EXISTS (SELECT 1 FROM information_schema.table_constraints tc"
    "   JOIN information_schema.key_column_usage k ON k.constraint_name = tc.constraint_name AND k.table_schema = tc.table_schema"
    "   WHERE tc.constraint_type = 'PRIMARY KEY' AND tc.table_schema = c.table_schema AND tc.table_name = c.table_name"
    "   AND k.column_name = c.column_name)"
    " FROM information_schema.columns c"
    " WHERE c.table_schema = current_schema() AND c.table_name = $1 ORDER BY c.ordinal_position;";

constexpr const char* kListForeignKeys =
    "SELECT c.conname, a.attname, rt.relname, ra.attname, c.confdeltype"
    " FROM pg_constraint c"
    " JOIN pg_class t ON t.oid = c.conrelid"
    " JOIN pg_namespace n ON n.oid = t.relnamespace"
    " JOIN pg_class rt ON rt.oid = c.confrelid"
    " CROSS JOIN LATERAL unnest(c.conkey, c.confkey) WITH ORDINALITY AS k(attnum, refnum, ord)"
    " JOIN pg_attribute a ON a.attrelid = c.conrelid AND a.attnum = k.attnum"
    " JOIN pg_attribute ra ON ra.attrelid = c.confrelid AND ra.attnum = k.refnum"
    " WHERE c.contype = 'f' AND n.nspname = current_schema() AND t.relname = $1"
    " ORDER BY c.conname, k.ord;";

constexpr const char* kListIndexes =
    "SELECT i.relname, ix.indisunique, a.attname"
    " FROM pg_index ix"
    " JOIN pg_class t ON t.oid = ix.indrelid"
    " JOIN pg_class i ON i.oid = ix.indexrelid"
    " JOIN pg_namespace n ON n.oid = t.relnamespace"
    " CROSS JOIN LATERAL unnest(ix.indkey::int2[]) WITH ORDINALITY AS k(attnum, ord)"
    " JOIN pg_attribute a ON a.attrelid = t.oid AND a.attnum = k.attnum"
    " WHERE n.nspname = current_schema() AND t.relname = $1 AND NOT ix.indisprimary"
    " AND NOT EXISTS (SELECT 1 FROM pg_constraint con WHERE con.conindid = ix.indexrelid)"
    " ORDER BY i.relname, k.ord;";

} // namespace

PgConnection::PgConnection(std::shared_ptr<PgPool> pool, int64_t lock_key) : pool_(std::move(pool)), lock_key_(lock_key) {
  conn_ = pool_->Acquire();
}

Result PgConnection::Translate(const std::exception& e) {
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql_error->sqlstate();
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "42P07" || state == "42701" || state == "42710") return Result::Err(ErrorCode::AlreadyExists, e.what());
    if (state == "42P01" || state == "42703" || state == "42704") return Result::Err(ErrorCode::NotFound, e.what());
    if (state == "55P03" || state == "40001" || state == "40P01") return Result::Err(ErrorCode::Busy, e.what());
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Capabilities PgConnection::QueryCapabilities() {
  Capabilities caps;
  caps.transactional_ddl = true;
  caps.drop_column       = true;
  caps.rename_column     = true;
  caps.alter_column      = true;
  caps.add_foreign_key   = true;
  caps.drop_foreign_key  = true;
  return caps;
}

std::unique_ptr<Transaction> PgConnection::Begin() {
  auto tx = std::make_unique<PgTransaction>(conn_, [this] { active_ = nullptr; });
  active_ = tx.get();
  return tx;
}

Result PgConnection::Exec(const std::string& sql) {
  try {
    if (active_) {
      active_->Work().exec(sql);
    } else {
      pqxx::nontransaction ntx(*conn_);
      ntx.exec(sql);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgConnection::Exec(const std::string& sql, const sql::Params& params) {
  return Query(sql, params, [](const sql::Row&) {});
}

Result PgConnection::Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  try {
    pqxx::result res;
    if (active_) {
      res = active_->Work().exec_params(sql, ToParams(params));
    } else {
      pqxx::nontransaction ntx(*conn_);
      res = ntx.exec_params(sql, ToParams(params));
    }
    for (const auto& row : res) {
      on_row(PgRow(row));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgConnection::DescribeTable(const std::string& name, model::TableSchema& out) {
  out      = {};
  out.name = name;

  auto r = Query(kListColumns, {name}, [&](const sql::Row& row) {
    model::ColumnDef column;
    column.name          = row.GetText(0);
    column.type          = sql::ParseType(Dialect::kPostgres, row.GetText(1), row.IsNull(2) ? 0 : row.GetInt(2));
    column.nullable      = row.GetText(3) == "YES";
    column.autoincrement = row.GetText(5) == "YES";
    column.primary_key   = row.GetBool(6);
    if (!row.IsNull(4)) column.default_value = row.GetText(4);
    out.columns.push_back(std::move(column));
  });
  if (!r) return r;

  std::map<std::string, model::ForeignKeyDef> by_name;
  r = Query(kListForeignKeys, {name}, [&](const sql::Row& row) {
    auto& fk     = by_name[row.GetText(0)];
    fk.name      = row.GetText(0);
    fk.ref_table = row.GetText(2);
    fk.columns.push_back(row.GetText(1));
    fk.ref_columns.push_back(row.GetText(3));
    fk.on_delete = DeleteRule(row.GetText(4));
  });
  if (!r) return r;
  for (auto& [_, fk] : by_name) out.foreign_keys.push_back(std::move(fk));

  std::map<std::string, model::IndexDef> indexes;
  r = Query(kListIndexes, {name}, [&](const sql::Row& row) {
    auto& index  = indexes[row.GetText(0)];
    index.name   = row.GetText(0);
    index.table  = name;
    index.unique = row.GetBool(1);
    index.columns.push_back(row.GetText(2));
  });
  if (!r) return r;
  for (auto& [_, index] : indexes) out.indexes.push_back(std::move(index));

  return Result::Ok();
}

Result PgConnection::Snapshot(model::SchemaSnapshot& out) {
  out = {};

  std::vector<std::string> tables;
  auto r = Query(kListTables, {}, [&](const sql::Row& row) { tables.push_back(row.GetText(0)); });
  if (!r) return r;

  for (const auto& name : tables) {
    model::TableSchema table;
    r = DescribeTable(name, table);
    if (!r) return r;
    out.tables.emplace(name, std::move(table));
  }
  return Result::Ok();
}

std::unique_ptr<RunLock> PgConnection::TryLock() {
  try {
    auto                 lock_conn = pool_->Acquire();
    pqxx::nontransaction ntx(*lock_conn);
    auto                 res = ntx.exec_prepared("sf_try_advisory_lock", lock_key_);
    if (res.empty() || !res[0][0].as<bool>()) return nullptr;
    return std::make_unique<PgRunLock>(std::move(lock_conn), lock_key_);
  } catch (const pqxx::failure& e) {
    throw util::LockError("advisory lock query failed: " + Translate(e).message);
  }
}

} // namespace schemaflow::db::postgres
