#pragma once

namespace schemaflow::db {

/*
  Exclusive advisory lock held for the duration of one migration run.

  Acquisition never blocks: Connection::TryLock() returns nullptr when
  another run holds it. Destruction releases.
*/
class RunLock {
 public:
  virtual ~RunLock() = default;
};

} // namespace schemaflow::db
