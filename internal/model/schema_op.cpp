#include "internal/model/schema_op.hpp"

namespace schemaflow::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ",";
    out += item;
  }
  return out;
}

} // namespace

OpKind KindOf(const SchemaOp& op) {
  return static_cast<OpKind>(op.index());
}

std::string_view OpKindName(OpKind kind) {
  switch (kind) {
    case OpKind::kAddColumn:
      return "add_column";
    case OpKind::kDropColumn:
      return "drop_column";
    case OpKind::kRenameColumn:
      return "rename_column";
    case OpKind::kAlterColumn:
      return "alter_column";
    case OpKind::kCreateTable:
      return "create_table";
    case OpKind::kDropTable:
      return "drop_table";
    case OpKind::kAddForeignKey:
      return "add_foreign_key";
    case OpKind::kDropForeignKey:
      return "drop_foreign_key";
    case OpKind::kCreateIndex:
      return "create_index";
    case OpKind::kDropIndex:
      return "drop_index";
    case OpKind::kRebuildTable:
      return "rebuild_table";
    case OpKind::kExecuteSql:
      return "execute";
  }
  return "unknown";
}

std::string TargetTable(const SchemaOp& op) {
  return std::visit(Overloaded{
                        [](const AddColumn& o) { return o.table; },
                        [](const DropColumn& o) { return o.table; },
                        [](const RenameColumn& o) { return o.table; },
                        [](const AlterColumn& o) { return o.table; },
                        [](const CreateTable& o) { return o.table.name; },
                        [](const DropTable& o) { return o.table; },
                        [](const AddForeignKey& o) { return o.table; },
                        [](const DropForeignKey& o) { return o.table; },
                        [](const CreateIndex& o) { return o.index.table; },
                        [](const DropIndex& o) { return o.table; },
                        [](const RebuildTable& o) { return o.target.name; },
                        [](const ExecuteSql&) { return std::string(); },
                    },
                    op);
}

std::string Describe(const SchemaOp& op) {
  std::string head(OpKindName(KindOf(op)));
  return std::visit(Overloaded{
                        [&](const AddColumn& o) { return head + " " + o.table + "." + o.column.name + " " + DescribeType(o.column.type); },
                        [&](const DropColumn& o) { return head + " " + o.table + "." + o.column; },
                        [&](const RenameColumn& o) { return head + " " + o.table + "." + o.from + " -> " + o.to; },
                        [&](const AlterColumn& o) {
                          std::string out = head + " " + o.table + "." + o.column;
                          if (o.type) out += " type=" + DescribeType(*o.type);
                          if (o.nullable) out += *o.nullable ? " null" : " not-null";
                          return out;
                        },
                        [&](const CreateTable& o) { return head + " " + o.table.name; },
                        [&](const DropTable& o) { return head + " " + o.table; },
                        [&](const AddForeignKey& o) {
                          return head + " " + o.table + "." + o.foreign_key.name + " (" + Join(o.foreign_key.columns) + ") -> " +
                                 o.foreign_key.ref_table + "(" + Join(o.foreign_key.ref_columns) + ")";
                        },
                        [&](const DropForeignKey& o) { return head + " " + o.table + "." + o.name; },
                        [&](const CreateIndex& o) { return head + " " + o.index.name + " on " + o.index.table + "(" + Join(o.index.columns) + ")"; },
                        [&](const DropIndex& o) { return head + " " + o.name + " on " + o.table; },
                        [&](const RebuildTable& o) { return head + " " + o.target.name; },
                        [&](const ExecuteSql& o) {
                          auto first_line = o.sql.substr(0, o.sql.find('\n'));
                          if (first_line.size() > 60) first_line = first_line.substr(0, 57) + "...";
                          return head + " " + first_line;
                        },
                    },
                    op);
}

} // namespace schemaflow::model
