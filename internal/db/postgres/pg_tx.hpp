#pragma once

#include <functional>
#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"

namespace schemaflow::db::postgres {

/*
  PostgreSQL transaction wrapper.

  DDL is transactional in PostgreSQL: everything executed through Work()
  is discarded by Rollback() or by destruction without Commit().
  on_finish lets the owning PgConnection stop routing statements here.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<pqxx::connection> conn, std::function<void()> on_finish);
  ~PgTransaction();

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  void Finish();

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  std::function<void()> on_finish_;
  bool finished_ = false;
};

}
