#pragma once

#include <string>

#include "internal/db/api/connection.hpp"

namespace schemaflow::db::sql {

/*
  Canonical SQL used by the state store.

  IMPORTANT:
  Table names come from configuration and are quoted here; values are
  always bound as $N parameters so the same text runs on both engines.
  Only the history table DDL differs per dialect (row id generation).
*/

inline std::string CreateVersionTable(const std::string& table) {
  return "CREATE TABLE IF NOT EXISTS " + Connection::QuoteIdentifier(table) + " (version_id VARCHAR(64) NOT NULL PRIMARY KEY);";
}

inline std::string CreateHistoryTable(const std::string& table, Dialect dialect) {
  const char* seq = dialect == Dialect::kPostgres ? "seq BIGSERIAL PRIMARY KEY" : "seq INTEGER PRIMARY KEY AUTOINCREMENT";
  return "CREATE TABLE IF NOT EXISTS " + Connection::QuoteIdentifier(table) + " (" + seq +
         ", version_id TEXT NOT NULL"
         ", direction VARCHAR(16) NOT NULL"
         ", heads TEXT NOT NULL"
         ", applied_at_ms BIGINT NOT NULL);";
}

inline std::string SelectCurrent(const std::string& table) {
  return "SELECT version_id FROM " + Connection::QuoteIdentifier(table) + " ORDER BY version_id;";
}

inline std::string DeleteAllCurrent(const std::string& table) {
  return "DELETE FROM " + Connection::QuoteIdentifier(table) + ";";
}

inline std::string InsertCurrent(const std::string& table) {
  return "INSERT INTO " + Connection::QuoteIdentifier(table) + " (version_id) VALUES ($1);";
}

inline std::string InsertHistory(const std::string& table) {
  return "INSERT INTO " + Connection::QuoteIdentifier(table) + " (version_id, direction, heads, applied_at_ms) VALUES ($1, $2, $3, $4);";
}

inline std::string SelectHistory(const std::string& table) {
  return "SELECT seq, version_id, direction, heads, applied_at_ms FROM " + Connection::QuoteIdentifier(table) + " ORDER BY seq;";
}

} // namespace schemaflow::db::sql
