#pragma once

#include <string>
#include <vector>

#include "internal/model/migration_unit.hpp"

namespace YAML {
class Node;
}

namespace schemaflow::registry {

/*
  Reads migration unit descriptors from YAML.

  One unit per file:

    id: 3271f7f4e2f2
    down_revision: 0ed865bdeda6        # string, list (merge) or null
    description: add account_id to tradingorder
    upgrade:
      - add_column: {table: tradingorder, column: {name: account_id, type: integer}}
    downgrade:
      - drop_column: {table: tradingorder, column: account_id}

  Every problem raises util::UnitFormatError naming the source.
*/
class UnitLoader {
 public:
  // All *.yaml / *.yml files directly under dir, in lexical path order.
  static std::vector<model::MigrationUnit> LoadDirectory(const std::string& dir);

  static model::MigrationUnit LoadFile(const std::string& path);

  // source is only used in error messages and MigrationUnit::Source().
  static model::MigrationUnit LoadString(const std::string& yaml, const std::string& source = "<string>");

 private:
  static model::MigrationUnit Parse(const YAML::Node& doc, const std::string& source);
};

} // namespace schemaflow::registry
