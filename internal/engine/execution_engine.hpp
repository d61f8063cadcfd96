#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/connection.hpp"
#include "internal/dialect/dialect_adapter.hpp"
#include "internal/graph/graph_resolver.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/state/state_store.hpp"

namespace schemaflow::engine {

struct OperationOutcome {
  std::size_t index = 0;
  std::string description;
  bool        executed = false; // false: already satisfied, recorded as a no-op
};

struct UnitOutcome {
  std::string                   unit_id;
  model::Direction              direction = model::Direction::kForward;
  model::UnitState              state     = model::UnitState::kPending;
  std::vector<OperationOutcome> operations;
};

struct RunReport {
  bool                     transactional = true;
  std::vector<UnitOutcome> units;

  std::size_t Completed() const;
  std::size_t SkippedOperations() const;
};

/*
  ExecutionEngine

  Applies a resolved path one unit at a time.

  Per unit:
    - open a transaction (transactional mode only)
    - per operation: Recover -> Snapshot -> Guard -> Execute
    - record the new head set in the state store, commit

  A failing operation rolls the unit back (transactional mode) or stops
  where it is (otherwise) and raises util::ExecutionError; the state
  store is not written for that unit. Exactly one state write per
  completed unit. In non-transactional mode the state write still gets
  its own transaction.

  Cancellation is polled before each unit and, without transactions,
  between operations. It never interrupts an open transaction.
*/
class ExecutionEngine {
 public:
  ExecutionEngine(db::Connection& conn, dialect::DialectAdapter& adapter, state::StateStore& store, const graph::GraphResolver& resolver,
                  bool transactional);

  // Throws util::LockError when another run holds the lock.
  std::unique_ptr<db::RunLock> AcquireLock();

  // Caller holds the lock from AcquireLock().
  RunReport Apply(const graph::Path& path, const std::atomic<bool>* cancel = nullptr);

 private:
  void RunUnit(const graph::PathStep& step, UnitOutcome& outcome, registry::IdSet& heads, const std::atomic<bool>* cancel);

  db::Connection&              conn_;
  dialect::DialectAdapter&     adapter_;
  state::StateStore&           store_;
  const graph::GraphResolver&  resolver_;
  bool                         transactional_;
};

} // namespace schemaflow::engine
