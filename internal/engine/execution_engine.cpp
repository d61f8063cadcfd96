#include "internal/engine/execution_engine.hpp"

#include "internal/guard/idempotency_guard.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schemaflow::engine {

using model::UnitState;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

bool CancelRequested(const std::atomic<bool>* cancel) {
  return cancel && cancel->load();
}

void Transition(UnitOutcome& outcome, UnitState to) {
  if (!model::CanTransition(outcome.state, to)) {
    throw std::logic_error("unit " + outcome.unit_id + ": illegal transition " + std::string(model::UnitStateName(outcome.state)) + " -> " +
                           std::string(model::UnitStateName(to)));
  }
  outcome.state = to;
}

} // namespace

std::size_t RunReport::Completed() const {
  std::size_t n = 0;
  for (const auto& unit : units) {
    if (unit.state == UnitState::kApplied || unit.state == UnitState::kReverted) ++n;
  }
  return n;
}

std::size_t RunReport::SkippedOperations() const {
  std::size_t n = 0;
  for (const auto& unit : units) {
    for (const auto& op : unit.operations) {
      if (!op.executed) ++n;
    }
  }
  return n;
}

ExecutionEngine::ExecutionEngine(db::Connection& conn, dialect::DialectAdapter& adapter, state::StateStore& store,
                                 const graph::GraphResolver& resolver, bool transactional)
    : conn_(conn), adapter_(adapter), store_(store), resolver_(resolver), transactional_(transactional) {
}

std::unique_ptr<db::RunLock> ExecutionEngine::AcquireLock() {
  auto lock = conn_.TryLock();
  if (!lock) {
    throw util::LockError("another migration run holds the lock");
  }
  SCHEMAFLOW_LOG_INFO("run lock acquired");
  return lock;
}

RunReport ExecutionEngine::Apply(const graph::Path& path, const std::atomic<bool>* cancel) {
  RunReport report;
  report.transactional = transactional_;
  for (const auto& step : path) {
    UnitOutcome outcome;
    outcome.unit_id   = step.unit->Id();
    outcome.direction = step.direction;
    report.units.push_back(std::move(outcome));
  }

  if (!transactional_ && !path.empty()) {
    SCHEMAFLOW_LOG_WARN("running without transactional DDL; a failed unit is left partially applied");
  }

  auto heads = store_.GetCurrent();

  for (std::size_t i = 0; i < path.size(); ++i) {
    const auto& step    = path[i];
    auto&       outcome = report.units[i];

    if (CancelRequested(cancel)) {
      SCHEMAFLOW_LOG_WARN("run cancelled", {StringField("next_unit", outcome.unit_id), IntField("completed", static_cast<int64_t>(i))});
      throw util::Cancelled(outcome.unit_id);
    }

    const bool forward = step.direction == model::Direction::kForward;
    Transition(outcome, forward ? UnitState::kApplying : UnitState::kReverting);
    SCHEMAFLOW_LOG_INFO("unit start", {StringField("unit", outcome.unit_id), StringField("direction", model::DirectionName(step.direction)),
                                       IntField("operations", static_cast<int64_t>(step.unit->Ops(step.direction).size()))});

    try {
      RunUnit(step, outcome, heads, cancel);
    } catch (const util::ExecutionError& e) {
      Transition(outcome, UnitState::kFailed);
      SCHEMAFLOW_LOG_ERROR("unit failed", {StringField("unit", e.UnitId()), StringField("cause", e.Cause())});
      throw;
    }

    Transition(outcome, forward ? UnitState::kApplied : UnitState::kReverted);
    SCHEMAFLOW_LOG_INFO("unit done", {StringField("unit", outcome.unit_id), StringField("state", model::UnitStateName(outcome.state))});
  }

  return report;
}

void ExecutionEngine::RunUnit(const graph::PathStep& step, UnitOutcome& outcome, registry::IdSet& heads, const std::atomic<bool>* cancel) {
  const auto& unit = *step.unit;
  const auto& ops  = unit.Ops(step.direction);

  std::unique_ptr<db::Transaction> tx;
  if (transactional_) {
    try {
      tx = conn_.Begin();
    } catch (const std::exception& e) {
      throw util::ExecutionError(unit.Id(), 0, std::string("begin transaction: ") + e.what());
    }
  }

  for (std::size_t index = 0; index < ops.size(); ++index) {
    const auto& op = ops[index];

    if (!transactional_ && index > 0 && CancelRequested(cancel)) {
      SCHEMAFLOW_LOG_WARN("run cancelled inside unit", {StringField("unit", unit.Id()), IntField("operation", static_cast<int64_t>(index))});
      throw util::Cancelled(unit.Id());
    }

    try {
      adapter_.Recover(op);

      model::SchemaSnapshot live;
      auto                  r = conn_.Snapshot(live);
      if (!r) {
        throw util::OperationError("schema introspection failed: " + r.message);
      }

      const bool apply = guard::IdempotencyGuard::ShouldApply(op, live);
      if (apply) {
        adapter_.Execute(op, live);
      } else {
        SCHEMAFLOW_LOG_INFO("operation already satisfied, skipped",
                            {StringField("unit", unit.Id()), IntField("operation", static_cast<int64_t>(index)), StringField("op", model::Describe(op))});
      }
      outcome.operations.push_back({index, model::Describe(op), apply});
    } catch (const util::OperationError& e) {
      if (tx) tx->Rollback();
      throw util::ExecutionError(unit.Id(), index, e.what());
    } catch (const util::IdempotencyConflict& e) {
      if (tx) tx->Rollback();
      throw util::ExecutionError(unit.Id(), index, e.what());
    }
  }

  auto next = resolver_.NextHeads(heads, step);
  try {
    if (!tx) tx = conn_.Begin();
    store_.Record(unit.Id(), model::DirectionName(step.direction), next);
    tx->Commit();
  } catch (const std::exception& e) {
    if (tx && !tx->IsFinished()) tx->Rollback();
    throw util::ExecutionError(unit.Id(), util::ExecutionError::kStateRecord, e.what());
  }

  SCHEMAFLOW_LOG_DEBUG("state advanced", {StringField("unit", unit.Id()), BoolField("transactional", transactional_)});
  heads = std::move(next);
}

} // namespace schemaflow::engine
