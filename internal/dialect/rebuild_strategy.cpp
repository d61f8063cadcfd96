#include "internal/dialect/rebuild_strategy.hpp"

#include <memory>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::dialect {

using observability::IntField;
using observability::StringField;
using util::OperationError;

RebuildStrategy::RebuildStrategy(db::Connection& conn, const SqlRenderer& renderer, bool swap_in_transaction)
    : conn_(conn), renderer_(renderer), swap_in_transaction_(swap_in_transaction) {
}

std::string RebuildStrategy::ShadowName(std::string_view table) {
  return std::string(kShadowPrefix) + std::string(table);
}

void RebuildStrategy::Exec(const std::string& sql) {
  auto r = conn_.Exec(sql);
  if (!r) {
    throw OperationError(r.message + " [" + sql + "]");
  }
}

int64_t RebuildStrategy::CountRows(std::string_view table) {
  int64_t    count = 0;
  const auto sql   = renderer_.CountRows(table);
  auto       r     = conn_.Query(sql, {}, [&](const db::sql::Row& row) { count = row.GetInt64(0); });
  if (!r) {
    throw OperationError(r.message + " [" + sql + "]");
  }
  return count;
}

bool RebuildStrategy::Recover(std::string_view table) {
  model::SchemaSnapshot live;
  auto                  r = conn_.Snapshot(live);
  if (!r) {
    throw OperationError("schema introspection failed: " + r.message);
  }

  const auto shadow = ShadowName(table);
  if (!live.HasTable(shadow)) return false;

  if (!live.HasTable(table)) {
    SCHEMAFLOW_LOG_ERROR("rebuild recovery: shadow without original", {StringField("table", table), StringField("shadow", shadow)});
    throw OperationError("rebuild of " + std::string(table) + ": found " + shadow + " but no " + std::string(table) +
                         "; the rows are in " + shadow + ", restore the table by hand");
  }

  SCHEMAFLOW_LOG_WARN("rebuild recovery: discarding unfinished shadow", {StringField("table", table), StringField("shadow", shadow)});
  Exec(renderer_.DropTable(shadow));
  return true;
}

void RebuildStrategy::Swap(const std::string& table, const model::TableSchema& target) {
  const auto shadow = ShadowName(table);
  Exec(renderer_.DropTable(table));
  for (const auto& index : target.indexes) {
    Exec(renderer_.CreateIndex(index, shadow));
  }
  Exec(renderer_.RenameTable(shadow, table));
  for (const auto& sql : renderer_.AfterSwap(target, shadow)) {
    Exec(sql);
  }
}

void RebuildStrategy::Run(const model::TableSchema& live, const model::TableSchema& target,
                          const std::map<std::string, std::string>& source_columns) {
  const auto& table  = live.name;
  const auto  shadow = ShadowName(table);

  std::vector<std::pair<std::string, std::string>> copy;
  for (const auto& column : target.columns) {
    auto mapped = source_columns.find(column.name);
    if (mapped != source_columns.end()) {
      if (!live.FindColumn(mapped->second)) {
        throw OperationError("rebuild of " + table + ": source column " + mapped->second + " does not exist");
      }
      copy.emplace_back(column.name, mapped->second);
    } else if (live.FindColumn(column.name)) {
      copy.emplace_back(column.name, column.name);
    }
  }

  SCHEMAFLOW_LOG_INFO("rebuild: creating shadow", {StringField("table", table), StringField("shadow", shadow)});
  Exec(renderer_.CreateTable(target, shadow));

  if (!copy.empty()) {
    Exec(renderer_.CopyRows(table, shadow, copy));
  }

  const auto expected = CountRows(table);
  const auto copied   = CountRows(shadow);
  if (expected != copied) {
    throw OperationError("rebuild of " + table + ": copied " + std::to_string(copied) + " of " + std::to_string(expected) + " rows");
  }
  SCHEMAFLOW_LOG_INFO("rebuild: rows copied", {StringField("table", table), IntField("rows", copied)});

  if (!swap_in_transaction_) {
    Swap(table, target);
  } else {
    std::unique_ptr<db::Transaction> tx;
    try {
      tx = conn_.Begin();
    } catch (const std::exception& e) {
      throw OperationError("rebuild of " + table + ": begin swap: " + e.what());
    }
    // An OperationError from Swap() rolls back through tx's destructor.
    Swap(table, target);
    try {
      tx->Commit();
    } catch (const std::exception& e) {
      throw OperationError("rebuild of " + table + ": commit swap: " + e.what());
    }
  }

  SCHEMAFLOW_LOG_INFO("rebuild: swapped", {StringField("table", table)});
}

} // namespace schemaflow::dialect
