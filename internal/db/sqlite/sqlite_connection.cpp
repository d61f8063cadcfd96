#include "sqlite_connection.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "internal/db/sql/type_mapping.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::db::sqlite {

namespace {

class SqliteRow final : public sql::Row {
 public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {
  }

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  int GetInt(int col) const override {
    return sqlite3_column_int(st_, col);
  }
  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }
  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

 private:
  sqlite3_stmt* st_;
};

class FileRunLock final : public RunLock {
 public:
  explicit FileRunLock(int fd) : fd_(fd) {
  }
  ~FileRunLock() override {
    flock(fd_, LOCK_UN);
    close(fd_);
  }

 private:
  int fd_;
};

class MemoryRunLock final : public RunLock {
 public:
  explicit MemoryRunLock(std::shared_ptr<std::atomic<bool>> held) : held_(std::move(held)) {
  }
  ~MemoryRunLock() override {
    held_->store(false);
  }

 private:
  std::shared_ptr<std::atomic<bool>> held_;
};

struct StmtGuard {
  sqlite3_stmt* st = nullptr;
  ~StmtGuard() {
    if (st) sqlite3_finalize(st);
  }
};

int Bind(sqlite3_stmt* st, int idx, const sql::Param& p) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return sqlite3_bind_int(st, idx, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(st, idx, v);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        } else {
          return sqlite3_bind_text(st, idx, v.c_str(), -1, SQLITE_TRANSIENT);
        }
      },
      p);
}

std::string StripIdentifier(std::string s) {
  s.erase(std::remove_if(s.begin(), s.end(), [](char c) { return c == '"' || c == '`' || c == '[' || c == ']' || std::isspace(static_cast<unsigned char>(c)); }),
          s.end());
  return s;
}

std::vector<std::string> SplitColumns(const std::string& list) {
  std::vector<std::string> out;
  std::string              current;
  for (char c : list) {
    if (c == ',') {
      out.push_back(StripIdentifier(current));
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty()) out.push_back(StripIdentifier(current));
  return out;
}

// PRAGMA foreign_key_list has no constraint names; recover the ones
// declared with CONSTRAINT <name> FOREIGN KEY (...) from the table DDL.
std::map<std::vector<std::string>, std::string> ForeignKeyNames(const std::string& create_sql) {
  static const std::regex kNamed(R"re(CONSTRAINT\s+["`\[]?(\w+)["`\]]?\s+FOREIGN\s+KEY\s*\(([^)]*)\))re", std::regex::icase);

  std::map<std::vector<std::string>, std::string> out;
  for (auto it = std::sregex_iterator(create_sql.begin(), create_sql.end(), kNamed); it != std::sregex_iterator(); ++it) {
    out[SplitColumns((*it)[2].str())] = (*it)[1].str();
  }
  return out;
}

std::string NormalizeAction(std::string action) {
  std::transform(action.begin(), action.end(), action.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return action == "NO ACTION" ? "" : action;
}

bool ContainsAutoincrement(const std::string& create_sql) {
  static const std::regex kAuto(R"(\bAUTOINCREMENT\b)", std::regex::icase);
  return std::regex_search(create_sql, kAuto);
}

} // namespace

SqliteConnection::SqliteConnection(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), memory_lock_(std::make_shared<std::atomic<bool>>(false)) {
}

Result SqliteConnection::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Capabilities SqliteConnection::QueryCapabilities() {
  const int version = sqlite3_libversion_number();

  Capabilities caps;
  caps.transactional_ddl = true;
  caps.rename_column     = version >= 3025000;
  caps.drop_column       = version >= 3035000;
  caps.alter_column      = false;
  caps.add_foreign_key   = false;
  caps.drop_foreign_key  = false;
  return caps;
}

std::unique_ptr<Transaction> SqliteConnection::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteConnection::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_->Handle(), sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    auto result = Translate(db_->Handle(), rc);
    if (err) {
      result.message = err;
      sqlite3_free(err);
    }
    return result;
  }
  return Result::Ok();
}

Result SqliteConnection::Exec(const std::string& sql, const sql::Params& params) {
  return Query(sql, params, [](const sql::Row&) {});
}

Result SqliteConnection::Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) {
  auto* db = db_->Handle();

  StmtGuard guard;
  int       rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &guard.st, nullptr);
  if (rc != SQLITE_OK) return Translate(db, rc);

  for (std::size_t i = 0; i < params.size(); ++i) {
    rc = Bind(guard.st, static_cast<int>(i + 1), params[i]);
    if (rc != SQLITE_OK) return Translate(db, rc);
  }

  SqliteRow row(guard.st);
  while ((rc = sqlite3_step(guard.st)) == SQLITE_ROW) {
    on_row(row);
  }
  return Translate(db, rc);
}

Result SqliteConnection::DescribeTable(const std::string& name, const std::string& create_sql, model::TableSchema& out) {
  out      = {};
  out.name = name;

  const bool autoincrement = ContainsAutoincrement(create_sql);

  auto r = Query(R"(SELECT name, type, "notnull", dflt_value, pk FROM pragma_table_info($1) ORDER BY cid;)", {name}, [&](const sql::Row& row) {
    model::ColumnDef column;
    column.name        = row.GetText(0);
    column.type        = sql::ParseType(Dialect::kSqlite, row.GetText(1));
    column.nullable    = !row.GetBool(2);
    column.primary_key = row.GetInt(4) > 0;
    if (!row.IsNull(3)) column.default_value = row.GetText(3);
    out.columns.push_back(std::move(column));
  });
  if (!r) return r;

  // AUTOINCREMENT is only legal on a single INTEGER PRIMARY KEY column.
  if (autoincrement) {
    auto pk = out.PrimaryKey();
    if (pk.size() == 1) out.FindColumn(pk.front())->autoincrement = true;
  }

  auto                               names = ForeignKeyNames(create_sql);
  std::map<int, model::ForeignKeyDef> by_id;
  r = Query(R"(SELECT id, "table", "from", "to", on_delete FROM pragma_foreign_key_list($1) ORDER BY id, seq;)", {name},
            [&](const sql::Row& row) {
              auto& fk     = by_id[row.GetInt(0)];
              fk.ref_table = row.GetText(1);
              fk.columns.push_back(row.GetText(2));
              fk.ref_columns.push_back(row.GetText(3));
              fk.on_delete = NormalizeAction(row.GetText(4));
            });
  if (!r) return r;

  for (auto& [_, fk] : by_id) {
    auto it = names.find(fk.columns);
    if (it != names.end()) fk.name = it->second;
    out.foreign_keys.push_back(std::move(fk));
  }

  std::vector<model::IndexDef> indexes;
  r = Query(R"(SELECT name, "unique", origin FROM pragma_index_list($1) ORDER BY name;)", {name}, [&](const sql::Row& row) {
    // Only explicit CREATE INDEX; 'pk' and 'u' come from table constraints.
    if (row.GetText(2) != "c") return;
    model::IndexDef index;
    index.name   = row.GetText(0);
    index.table  = name;
    index.unique = row.GetBool(1);
    indexes.push_back(std::move(index));
  });
  if (!r) return r;

  for (auto& index : indexes) {
    r = Query("SELECT name FROM pragma_index_info($1) ORDER BY seqno;", {index.name},
              [&](const sql::Row& row) { index.columns.push_back(row.GetText(0)); });
    if (!r) return r;
    out.indexes.push_back(std::move(index));
  }

  return Result::Ok();
}

Result SqliteConnection::Snapshot(model::SchemaSnapshot& out) {
  out = {};

  std::vector<std::pair<std::string, std::string>> tables;
  auto r = Query("SELECT name, sql FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name;", {},
                 [&](const sql::Row& row) { tables.emplace_back(row.GetText(0), row.GetText(1)); });
  if (!r) return r;

  for (const auto& [name, create_sql] : tables) {
    model::TableSchema table;
    r = DescribeTable(name, create_sql, table);
    if (!r) return r;
    out.tables.emplace(name, std::move(table));
  }
  return Result::Ok();
}

std::unique_ptr<RunLock> SqliteConnection::TryLock() {
  if (db_->IsInMemory()) {
    bool expected = false;
    if (!memory_lock_->compare_exchange_strong(expected, true)) return nullptr;
    return std::make_unique<MemoryRunLock>(memory_lock_);
  }

  const std::string lock_path = db_->Path() + ".lock";
  int               fd        = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw util::LockError("cannot open lock file " + lock_path);
  }
  if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
    close(fd);
    return nullptr;
  }
  return std::make_unique<FileRunLock>(fd);
}

} // namespace schemaflow::db::sqlite
