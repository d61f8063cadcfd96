#include "internal/state/state_store.hpp"

#include <sstream>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::state {

namespace {

std::string JoinHeads(const registry::IdSet& heads) {
  std::string out;
  for (const auto& id : heads) {
    if (!out.empty()) out += ',';
    out += id;
  }
  return out;
}

std::vector<std::string> SplitHeads(const std::string& text) {
  std::vector<std::string> out;
  std::stringstream        in(text);
  std::string              id;
  while (std::getline(in, id, ',')) {
    if (!id.empty()) out.push_back(id);
  }
  return out;
}

} // namespace

StateStore::StateStore(db::Connection& conn, std::string version_table, std::string history_table)
    : conn_(conn), version_table_(std::move(version_table)), history_table_(std::move(history_table)) {
}

void StateStore::Check(const db::Result& r, const std::string& what) const {
  if (!r) {
    throw util::OperationError("state store: " + what + ": " + r.message);
  }
}

void StateStore::EnsureTables() {
  Check(conn_.Exec(db::sql::CreateVersionTable(version_table_)), "create " + version_table_);
  Check(conn_.Exec(db::sql::CreateHistoryTable(history_table_, conn_.Kind())), "create " + history_table_);
}

registry::IdSet StateStore::GetCurrent() {
  registry::IdSet current;
  Check(conn_.Query(db::sql::SelectCurrent(version_table_), {}, [&](const db::sql::Row& row) { current.insert(row.GetText(0)); }),
        "read current version");
  return current;
}

void StateStore::ReplaceCurrent(const registry::IdSet& heads) {
  Check(conn_.Exec(db::sql::DeleteAllCurrent(version_table_)), "clear current version");
  for (const auto& id : heads) {
    Check(conn_.Exec(db::sql::InsertCurrent(version_table_), {id}), "write current version");
  }
}

void StateStore::Record(const std::string& version_id, std::string_view direction, const registry::IdSet& heads) {
  ReplaceCurrent(heads);

  const auto now = static_cast<int64_t>(util::ToUnixMillis(util::Now()));
  Check(conn_.Exec(db::sql::InsertHistory(history_table_), {version_id, std::string(direction), JoinHeads(heads), now}), "append history");
}

void StateStore::Stamp(const registry::IdSet& heads) {
  Record(heads.empty() ? std::string("base") : JoinHeads(heads), kStampDirection, heads);
}

std::vector<HistoryEntry> StateStore::History() {
  std::vector<HistoryEntry> out;
  Check(conn_.Query(db::sql::SelectHistory(history_table_), {},
                    [&](const db::sql::Row& row) {
                      HistoryEntry entry;
                      entry.seq        = row.GetInt64(0);
                      entry.version_id = row.GetText(1);
                      entry.direction  = row.GetText(2);
                      entry.heads      = SplitHeads(row.GetText(3));
                      entry.applied_at = util::FromUnixMillis(row.GetU64(4));
                      out.push_back(std::move(entry));
                    }),
        "read history");
  return out;
}

} // namespace schemaflow::state
