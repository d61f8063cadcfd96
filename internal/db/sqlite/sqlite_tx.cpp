#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace schemaflow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  // SQLite may already have rolled back on its own after certain errors.
  if (!finished_ && !sqlite3_get_autocommit(db_->Handle())) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      SCHEMAFLOW_LOG_WARN("sqlite rollback on scope exit failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  if (!sqlite3_get_autocommit(db_->Handle())) db_->Exec("ROLLBACK;");
}

} // namespace schemaflow::db::sqlite
