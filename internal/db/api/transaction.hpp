#pragma once

namespace fmd::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Acquiring a transaction waits at most the configured lock timeout,
    then throws util::Error(Timeout)

  SQLite: in-process lock + BEGIN IMMEDIATE
  Postgres: pooled connection + pqxx::work
  Memory: exclusive lock + snapshot copy
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
