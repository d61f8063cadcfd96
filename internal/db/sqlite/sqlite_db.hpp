#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace schemaflow::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = false);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // ":memory:" and empty paths have no file to lock.
  bool IsInMemory() const;

  // Execute a SQL string (used for pragmas and transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs for schema work.
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace schemaflow::db::sqlite
