#pragma once

namespace flowstate::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one writing transaction per flow record commits at a time

  SQLite: BEGIN IMMEDIATE on a connection guarded by a transaction mutex
  Postgres: pqxx::work with conditional row updates
  Memory: exclusive writer + snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once the transaction is committed or rolled back
  virtual bool IsCommitted() const = 0;
};

}
