#pragma once

namespace jobclaim::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one write transaction is open per repository at a time

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work (row locks, SKIP LOCKED for leases)
  Memory: snapshot copy-on-write, single writer
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
