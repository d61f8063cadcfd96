#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/capabilities.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/run_lock.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/model/schema_snapshot.hpp"

namespace schemaflow::db {

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Connection to the one target store of a run.

  CRITICAL GUARANTEES:

  - Exec/Query issued while a Transaction from Begin() is open run
    inside that transaction
  - Snapshot() observes uncommitted DDL of the open transaction
  - At most one transaction is open at a time
  - Backend errors come back as Result codes, never as driver exceptions

  Parameters are written $1, $2, ... in order of appearance; SQLite binds
  them positionally, PostgreSQL natively.
*/
class Connection {
 public:
  using RowCallback = std::function<void(const sql::Row&)>;

  virtual ~Connection() = default;

  virtual Dialect Kind() const = 0;

  virtual Capabilities QueryCapabilities() = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result Exec(const std::string& sql) = 0;

  virtual Result Exec(const std::string& sql, const sql::Params& params) = 0;

  virtual Result Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) = 0;

  // Live catalog: tables, columns, foreign keys, indexes.
  virtual Result Snapshot(model::SchemaSnapshot& out) = 0;

  // nullptr when another run holds the lock.
  virtual std::unique_ptr<RunLock> TryLock() = 0;

  static std::string QuoteIdentifier(std::string_view name) {
    std::string out = "\"";
    for (char c : name) {
      if (c == '"') out += '"';
      out += c;
    }
    out += '"';
    return out;
  }
};

} // namespace schemaflow::db
