#pragma once

namespace datamarket::db {

/*
  Abstract transaction. One ledger operation = one transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Writers are totally ordered: at most one open transaction mutates
    the ledger at a time

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work + pg_advisory_xact_lock
  Memory: writer lock + snapshot copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

}
