#pragma once

#include <string>

#include "internal/db/api/connection.hpp"
#include "internal/model/table_schema.hpp"

namespace schemaflow::db::sql {

/*
  Portable column type <-> dialect spelling.

  RenderType output must parse back through ParseType to the same
  TypeSpec, otherwise the idempotency guard would report every column
  it created as a conflict.
*/

std::string RenderType(Dialect dialect, const model::TypeSpec& spec);

// SQLite: declared type text from PRAGMA table_info.
// PostgreSQL: information_schema.columns.data_type, with
// character_maximum_length passed as length (0 when NULL).
model::TypeSpec ParseType(Dialect dialect, const std::string& declared, int length = 0);

} // namespace schemaflow::db::sql
