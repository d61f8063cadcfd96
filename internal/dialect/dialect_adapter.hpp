#pragma once

#include <string_view>

#include "internal/db/api/capabilities.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/dialect/rebuild_strategy.hpp"
#include "internal/dialect/sql_renderer.hpp"
#include "internal/model/schema_op.hpp"
#include "internal/model/schema_snapshot.hpp"

namespace schemaflow::dialect {

enum class Strategy : std::uint8_t {
  kDirect,
  kRebuild,
};

std::string_view StrategyName(Strategy strategy);

/*
  Direct when the backend can express the change in place, Rebuild
  otherwise. Operations without an in-place/rebuild alternative (create,
  drop table, indexes, raw SQL) are always Direct; RebuildTable is
  always Rebuild. force_rebuild turns every optional in-place change
  into a rebuild.
*/
Strategy StrategyFor(model::OpKind kind, const db::Capabilities& caps, bool force_rebuild = false);

/*
  Executes schema operations against one connection.

  Capabilities are queried once by the caller and fixed for the run.
  Every failure surfaces as util::OperationError carrying the backend
  message and the statement.

  swap_in_transaction is for callers that run operations outside a
  transaction on a backend that has one: rebuild swaps then commit on
  their own.
*/
class DialectAdapter {
 public:
  DialectAdapter(db::Connection& conn, db::Capabilities caps, bool force_rebuild = false, bool swap_in_transaction = false);

  const db::Capabilities& Caps() const {
    return caps_;
  }

  Strategy StrategyFor(model::OpKind kind) const {
    return dialect::StrategyFor(kind, caps_, force_rebuild_);
  }

  // Resolve rebuild leftovers for the table the operation touches.
  bool Recover(const model::SchemaOp& op);

  // live must be a snapshot taken after Recover().
  void Execute(const model::SchemaOp& op, const model::SchemaSnapshot& live);

 private:
  void Exec(const std::string& sql);

  const model::TableSchema& LiveTable(const model::SchemaSnapshot& live, const std::string& table) const;

  void Rebuild(const model::TableSchema& live, const model::TableSchema& target, const std::map<std::string, std::string>& source_columns = {});

  void Apply(const model::AddColumn& op, const model::SchemaSnapshot& live);
  void Apply(const model::DropColumn& op, const model::SchemaSnapshot& live);
  void Apply(const model::RenameColumn& op, const model::SchemaSnapshot& live);
  void Apply(const model::AlterColumn& op, const model::SchemaSnapshot& live);
  void Apply(const model::CreateTable& op, const model::SchemaSnapshot& live);
  void Apply(const model::DropTable& op, const model::SchemaSnapshot& live);
  void Apply(const model::AddForeignKey& op, const model::SchemaSnapshot& live);
  void Apply(const model::DropForeignKey& op, const model::SchemaSnapshot& live);
  void Apply(const model::CreateIndex& op, const model::SchemaSnapshot& live);
  void Apply(const model::DropIndex& op, const model::SchemaSnapshot& live);
  void Apply(const model::RebuildTable& op, const model::SchemaSnapshot& live);
  void Apply(const model::ExecuteSql& op, const model::SchemaSnapshot& live);

  db::Connection&  conn_;
  db::Capabilities caps_;
  bool             force_rebuild_;
  SqlRenderer      renderer_;
  RebuildStrategy  rebuild_;
};

} // namespace schemaflow::dialect
