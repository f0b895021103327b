#pragma once

namespace deliveryiq::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  One transaction per unit of work: a sync page, one curve replacement,
  one estimator read.

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy, a commit over a newer snapshot fails
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace deliveryiq::db
