#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace schemaflow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<pqxx::connection> conn, std::function<void()> on_finish)
    : conn_(std::move(conn)), on_finish_(std::move(on_finish))
{
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try { tx_->abort(); }
    catch (const std::exception& e) {
      SCHEMAFLOW_LOG_WARN("postgres rollback on scope exit failed", {observability::StringField("error", e.what())});
    }
    Finish();
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  Finish();
}

void PgTransaction::Rollback() {
  Finish();
  tx_->abort();
}

void PgTransaction::Finish() {
  finished_ = true;
  if (on_finish_) {
    on_finish_();
    on_finish_ = nullptr;
  }
}

}
