#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace fmd::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. Transactions are serialized on
  TxMutex(); a transaction that cannot get it within the lock
  timeout fails with util::Error(Timeout).
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, int busy_timeout_ms = 5000, std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::timed_mutex& TxMutex() {
    return tx_mutex_;
  }

  std::chrono::milliseconds LockTimeout() const {
    return lock_timeout_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws util::Error: Timeout for SQLITE_BUSY/LOCKED, Storage otherwise.
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  int                       busy_timeout_ms_;
  std::chrono::milliseconds lock_timeout_;
  std::timed_mutex          tx_mutex_;
};

} // namespace fmd::db::sqlite
