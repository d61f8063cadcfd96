#pragma once

#include "internal/model/schema_op.hpp"
#include "internal/model/schema_snapshot.hpp"

namespace schemaflow::guard {

/*
  Pre-flight check of one operation against the live catalog.

  ShouldApply() returns false when the operation's post-condition
  already holds (the engine records a no-op), true when its
  pre-condition holds, and throws util::IdempotencyConflict when the
  live schema matches neither.

    additive     create/add present with the same shape -> false
                 present with a different shape         -> conflict
    destructive  already absent                         -> false
    rename       from present, to absent                -> true
                 from absent, to present                -> false
    alter        live column already has target shape   -> false
                 matches existing_* (or none given)     -> true
    rebuild      live table equals target, no shadow    -> false
    execute                                             -> true

  Column and foreign key operations on a missing table conflict.
*/
class IdempotencyGuard {
 public:
  static bool ShouldApply(const model::SchemaOp& op, const model::SchemaSnapshot& live);
};

} // namespace schemaflow::guard
