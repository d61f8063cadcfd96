#pragma once

namespace schemaflow::db {

/*
  What a backend can do in place.

  Queried once per connection. Anything reported false for a structural
  change is carried out by the rebuild strategy instead.
*/
struct Capabilities {
  bool transactional_ddl = false;
  bool drop_column       = false;
  bool rename_column     = false;
  bool alter_column      = false;
  bool add_foreign_key   = false;
  bool drop_foreign_key  = false;
};

} // namespace schemaflow::db
