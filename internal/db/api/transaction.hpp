#pragma once

namespace scanhub::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Two transactions touching the same product never interleave their
    read-mark-insert sequence

  SQLite: BEGIN IMMEDIATE under the connection lock
  Postgres: pqxx::work + per-product advisory lock
  Memory: exclusive lock + write set
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
