#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/registry/migration_registry.hpp"
#include "internal/util/time.hpp"

namespace schemaflow::state {

struct HistoryEntry {
  int64_t                  seq = 0;
  std::string              version_id;
  std::string              direction; // upgrade | downgrade | stamp
  std::vector<std::string> heads;     // pointer set after this entry
  util::TimePoint          applied_at;
};

/*
  Applied-version pointer(s) persisted inside the target store.

    <version_table>  one row per current head
    <history_table>  append-only log, one row per recorded transition

  Writes go through the connection as-is: inside the unit transaction
  when the caller has one open. Record() and Stamp() replace the whole
  pointer set; callers that need atomicity wrap them in a transaction.
  Failures raise util::OperationError.
*/
class StateStore {
 public:
  static constexpr std::string_view kStampDirection = "stamp";

  StateStore(db::Connection& conn, std::string version_table, std::string history_table);

  void EnsureTables();

  registry::IdSet GetCurrent();

  void Record(const std::string& version_id, std::string_view direction, const registry::IdSet& heads);

  void Stamp(const registry::IdSet& heads);

  std::vector<HistoryEntry> History();

  std::vector<std::string> ReservedTables() const {
    return {version_table_, history_table_};
  }

 private:
  void Check(const db::Result& r, const std::string& what) const;
  void ReplaceCurrent(const registry::IdSet& heads);

  db::Connection& conn_;
  std::string     version_table_;
  std::string     history_table_;
};

} // namespace schemaflow::state
