#pragma once

#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace schemaflow::db::sql {

/*
  Parameter abstraction.

  Statements are written with $1 $2 $3 in order of appearance:

  Postgres: native numbered placeholders
  SQLite:   $NNN is a named parameter, indexed in order of first use

  Both bind ordered → the same Params vector works for either.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

}
