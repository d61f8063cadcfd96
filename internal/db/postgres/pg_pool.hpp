#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace schemaflow::db::postgres {

/*
  PgPool

  Connection factory used by PgConnection.

  Design notes:
  -------------
  - A run needs two sessions: one for DDL and state writes, one that
    holds the session-level advisory lock for the whole run.
  - libpqxx connections are NOT thread-safe → do not share.
  - Prepared statements are installed per connection.

  Lifetime:
    PgConnection owns shared_ptr<PgPool>
    Work session and lock session each hold shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 2);

  // Acquire a new ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace schemaflow::db::postgres
