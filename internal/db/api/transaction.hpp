#pragma once

namespace schemaflow::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends that report transactional DDL:

  - DDL and state writes issued on the owning Connection while the
    transaction is open belong to it
  - Rollback() discards all of them, including catalog changes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsFinished() const = 0;
};

}
