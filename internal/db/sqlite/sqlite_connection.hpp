#pragma once

#include <atomic>
#include <memory>

#include "internal/db/api/connection.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace schemaflow::db::sqlite {

/*
  db::Connection over a single SqliteDB handle.

  Capabilities follow the linked library version:
    RENAME COLUMN  >= 3.25.0
    DROP COLUMN    >= 3.35.0
  Column type changes and foreign key changes always need a rebuild.

  The run lock is a non-blocking flock(2) on "<path>.lock"; in-memory
  databases are private to this handle and use an in-process flag.
*/
class SqliteConnection final : public db::Connection {
 public:
  explicit SqliteConnection(std::shared_ptr<SqliteDB> db);

  Dialect Kind() const override {
    return Dialect::kSqlite;
  }

  Capabilities QueryCapabilities() override;

  std::unique_ptr<Transaction> Begin() override;

  Result Exec(const std::string& sql) override;
  Result Exec(const std::string& sql, const sql::Params& params) override;
  Result Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;

  Result Snapshot(model::SchemaSnapshot& out) override;

  std::unique_ptr<RunLock> TryLock() override;

  const std::shared_ptr<SqliteDB>& Database() const {
    return db_;
  }

 private:
  static Result Translate(sqlite3* db, int rc);

  Result DescribeTable(const std::string& name, const std::string& create_sql, model::TableSchema& out);

  std::shared_ptr<SqliteDB>          db_;
  std::shared_ptr<std::atomic<bool>> memory_lock_;
};

} // namespace schemaflow::db::sqlite
