#pragma once

#include <cstdint>
#include <memory>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/connection.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace schemaflow::db::postgres {

/*
  db::Connection over one PostgreSQL session.

  Everything is direct in PostgreSQL: transactional DDL, in-place column
  drop/rename/type change, named foreign key constraints. Introspection
  is limited to current_schema().

  The run lock is pg_try_advisory_lock(lock_key) held on a second
  session from the pool, so it survives the work session's transactions.
*/
class PgConnection final : public db::Connection {
 public:
  PgConnection(std::shared_ptr<PgPool> pool, int64_t lock_key);

  Dialect Kind() const override {
    return Dialect::kPostgres;
  }

  Capabilities QueryCapabilities() override;

  std::unique_ptr<Transaction> Begin() override;

  Result Exec(const std::string& sql) override;
  Result Exec(const std::string& sql, const sql::Params& params) override;
  Result Query(const std::string& sql, const sql::Params& params, const RowCallback& on_row) override;

  Result Snapshot(model::SchemaSnapshot& out) override;

  std::unique_ptr<RunLock> TryLock() override;

 private:
  static Result Translate(const std::exception& e);

  Result DescribeTable(const std::string& name, model::TableSchema& out);

  std::shared_ptr<PgPool>           pool_;
  std::shared_ptr<pqxx::connection> conn_;
  int64_t                           lock_key_;
  PgTransaction*                    active_ = nullptr;
};

} // namespace schemaflow::db::postgres
