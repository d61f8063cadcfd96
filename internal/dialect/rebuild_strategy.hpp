#pragma once

#include <map>
#include <string>
#include <string_view>

#include "internal/db/api/connection.hpp"
#include "internal/dialect/sql_renderer.hpp"
#include "internal/model/table_schema.hpp"

namespace schemaflow::dialect {

/*
  Copy-and-swap of one table to a new definition.

    1. CREATE TABLE _sf_shadow_<t> with the target columns and keys
    2. copy every row, then compare row counts
    3. DROP TABLE <t>
    4. create the target indexes on the shadow
    5. ALTER TABLE _sf_shadow_<t> RENAME TO <t>

  The original is dropped in place rather than renamed aside: renaming
  it would carry inbound foreign keys along to the old name.

  Steps 3-5 and the dialect's post-swap fixups always commit together.
  With swap_in_transaction set, Run() opens its own transaction around
  them; otherwise the caller must already hold one. A crash therefore
  leaves either the finished table or the original next to a shadow.

  Shadow existence is the checkpoint. Recover() is run before any
  operation on a table:
    shadow + <t>      copy never finished; drop the shadow
    shadow, no <t>    not produced by Run(); refused, since the target
                      indexes and keys cannot be recovered from it
*/
class RebuildStrategy {
 public:
  static constexpr std::string_view kShadowPrefix = "_sf_shadow_";

  RebuildStrategy(db::Connection& conn, const SqlRenderer& renderer, bool swap_in_transaction = false);

  static std::string ShadowName(std::string_view table);

  // True when a leftover was found and dealt with.
  bool Recover(std::string_view table);

  // source_columns maps target column -> live column; unmapped target
  // columns copy from the live column of the same name, if any.
  void Run(const model::TableSchema& live, const model::TableSchema& target, const std::map<std::string, std::string>& source_columns);

 private:
  void    Exec(const std::string& sql);
  int64_t CountRows(std::string_view table);

  void    Swap(const std::string& table, const model::TableSchema& target);

  db::Connection&    conn_;
  const SqlRenderer& renderer_;
  bool               swap_in_transaction_;
};

} // namespace schemaflow::dialect
