#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fmd::db::sqlite {

/*
  SQLite transaction wrapper.

  Takes the in-process transaction lock (bounded), then BEGIN IMMEDIATE:
    - grabs the write lock early
    - destructive reads cannot interleave with another writer
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> lock_;
  bool                               finished_  = false;
  bool                               committed_ = false;
};

}
