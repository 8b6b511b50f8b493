#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace fmd::db::sqlite {

namespace {

util::ErrorKind KindFor(int rc) {
  const int primary = rc & 0xff;
  return (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) ? util::ErrorKind::Timeout : util::ErrorKind::Storage;
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms, std::chrono::milliseconds lock_timeout)
    : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms), lock_timeout_(lock_timeout) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::Error(util::ErrorKind::Storage, msg, "sqlite_open", path_);
  }

  try {
    Configure();
  } catch (const util::Error&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::Error(KindFor(rc), msg, "sqlite_exec");
  }
}

void SqliteDB::Configure() {
  // WAL lets readers from other processes run while we hold the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // bounded wait for locks held by other connections
  if (sqlite3_busy_timeout(db_, busy_timeout_ms_) != SQLITE_OK) {
    throw util::Error(util::ErrorKind::Storage, sqlite3_errmsg(db_), "sqlite_busy_timeout", path_);
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace fmd::db::sqlite
