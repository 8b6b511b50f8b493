#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <functional>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace fmd::db::sqlite {

using fmd::db::ErrorCode;
using fmd::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

void BindFloat(sqlite3_stmt* st, int idx, float v) {
  sqlite3_bind_double(st, idx, static_cast<double>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

float ColFloat(sqlite3_stmt* st, int col) {
  return static_cast<float>(sqlite3_column_double(st, col));
}

/*
  Read-side statement. Reads have no Result channel, so a backend
  failure is raised as util::Error and never mistaken for "no rows".
*/
class Query {
 public:
  Query(sqlite3* db, const char* sql, const char* operation) : db_(db), operation_(operation) {
    int rc = sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr);
    if (rc != SQLITE_OK) Fail(rc);
  }

  ~Query() {
    sqlite3_finalize(st_);
  }

  Query(const Query&)            = delete;
  Query& operator=(const Query&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  bool Next() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    Fail(rc);
    return false;
  }

 private:
  [[noreturn]] void Fail(int rc) {
    const int  primary = rc & 0xff;
    const auto kind    = (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) ? util::ErrorKind::Timeout : util::ErrorKind::Storage;
    throw util::Error(kind, sqlite3_errmsg(db_), operation_);
  }

  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
  const char*   operation_;
};

model::UserDeviceRecord ReadUserDevice(sqlite3_stmt* st) {
  model::UserDeviceRecord r;
  r.user_id       = ColText(st, 0);
  r.device_id     = ColText(st, 1);
  r.name          = ColText(st, 2);
  r.created_at_ms = ColI64(st, 3);
  return r;
}

model::PendingCommandRecord ReadCommand(sqlite3_stmt* st) {
  model::PendingCommandRecord r;
  r.id            = static_cast<uint64_t>(ColI64(st, 0));
  r.device_id     = ColText(st, 1);
  r.type          = ColText(st, 2);
  r.cmd           = ColText(st, 3);
  r.created_at_ms = ColI64(st, 4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

namespace {

// Prepare, bind, step once. rows = sqlite3_changes() on success.
Result Write(sqlite3* db, const char* sql, const std::function<void(sqlite3_stmt*)>& bind,
             Result (*translate)(sqlite3*, int)) {
  sqlite3_stmt* st = nullptr;
  int           rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  if (rc != SQLITE_OK) {
    auto r = translate(db, rc);
    sqlite3_finalize(st);
    return r;
  }

  bind(st);
  rc     = sqlite3_step(st);
  auto r = translate(db, rc);
  if (r) r.rows = static_cast<uint64_t>(sqlite3_changes(db));
  sqlite3_finalize(st);
  return r;
}

} // namespace

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  return Write(TX(t).Handle(), sql::INSERT_DEVICE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindBool(st, 2, r.lockable);
    BindBool(st, 3, r.logged_in);
    BindI64(st, 4, r.last_exchange_ms);
    BindText(st, 5, r.hawk_secret);
    BindText(st, 6, r.push_url);
    BindText(st, 7, r.accepts);
    BindText(st, 8, r.access_token);
  }, &Translate);
}

Result SqliteRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  return Write(TX(t).Handle(), sql::UPDATE_DEVICE, [&](sqlite3_stmt* st) {
    BindBool(st, 1, r.lockable);
    BindBool(st, 2, r.logged_in);
    BindI64(st, 3, r.last_exchange_ms);
    BindText(st, 4, r.hawk_secret);
    BindText(st, 5, r.accepts);
    BindText(st, 6, r.push_url);
    BindText(st, 7, r.id);
  }, &Translate);
}

std::optional<model::DeviceInfoRecord>
SqliteRepository::GetDeviceInfo(Transaction& t, const std::string& device_id) {
  Query q(TX(t).Handle(), sql::SELECT_DEVICE_INFO, "get_device_info");
  BindText(q.get(), 1, device_id);
  if (!q.Next()) return std::nullopt;

  auto*                   st = q.get();
  model::DeviceInfoRecord info;
  info.device.id               = ColText(st, 0);
  info.device.lockable         = ColBool(st, 1);
  info.device.logged_in        = ColBool(st, 2);
  info.device.last_exchange_ms = ColI64(st, 3);
  info.device.hawk_secret      = ColText(st, 4);
  info.device.push_url         = ColText(st, 5);
  info.device.accepts          = ColText(st, 6);
  info.device.access_token     = ColText(st, 7);
  info.user_id                 = ColText(st, 8);
  info.name                    = ColText(st, 9);
  return info;
}

Result SqliteRepository::SetAccessToken(Transaction& t, const std::string& device_id, const std::string& token, int64_t now_ms) {
  return Write(TX(t).Handle(), sql::SET_ACCESS_TOKEN, [&](sqlite3_stmt* st) {
    BindText(st, 1, token);
    BindI64(st, 2, now_ms);
    BindText(st, 3, device_id);
  }, &Translate);
}

Result SqliteRepository::SetDeviceLock(Transaction& t, const std::string& device_id, bool lockable, int64_t now_ms) {
  return Write(TX(t).Handle(), sql::SET_DEVICE_LOCK, [&](sqlite3_stmt* st) {
    BindBool(st, 1, lockable);
    BindI64(st, 2, now_ms);
    BindText(st, 3, device_id);
  }, &Translate);
}

Result SqliteRepository::TouchDevice(Transaction& t, const std::string& device_id, int64_t now_ms) {
  return Write(TX(t).Handle(), sql::TOUCH_DEVICE, [&](sqlite3_stmt* st) {
    BindI64(st, 1, now_ms);
    BindText(st, 2, device_id);
  }, &Translate);
}

Result SqliteRepository::DeleteDevice(Transaction& t, const std::string& device_id) {
  return Write(TX(t).Handle(), sql::DELETE_DEVICE, [&](sqlite3_stmt* st) { BindText(st, 1, device_id); }, &Translate);
}

// ------------------------------------------------------------------
// User to device mapping
// ------------------------------------------------------------------

Result SqliteRepository::InsertUserDevice(Transaction& t, const model::UserDeviceRecord& r) {
  return Write(TX(t).Handle(), sql::INSERT_USER_DEVICE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.user_id);
    BindText(st, 2, r.device_id);
    BindText(st, 3, r.name);
    BindI64(st, 4, r.created_at_ms);
  }, &Translate);
}

std::optional<model::UserDeviceRecord>
SqliteRepository::FindUserDevice(Transaction& t, const std::string& user_id, const std::string& device_id) {
  Query q(TX(t).Handle(), sql::SELECT_USER_DEVICE, "find_user_device");
  BindText(q.get(), 1, user_id);
  BindText(q.get(), 2, device_id);
  if (!q.Next()) return std::nullopt;
  return ReadUserDevice(q.get());
}

std::optional<model::UserDeviceRecord>
SqliteRepository::GetUserForDevice(Transaction& t, const std::string& device_id) {
  Query q(TX(t).Handle(), sql::SELECT_USER_FOR_DEVICE, "get_user_for_device");
  BindText(q.get(), 1, device_id);
  if (!q.Next()) return std::nullopt;
  return ReadUserDevice(q.get());
}

std::vector<model::UserDeviceRecord>
SqliteRepository::ListDevicesForUser(Transaction& t, const std::string& user_id, uint32_t limit) {
  Query q(TX(t).Handle(), sql::LIST_DEVICES_FOR_USER, "list_devices_for_user");
  BindText(q.get(), 1, user_id);
  BindI64(q.get(), 2, limit);

  std::vector<model::UserDeviceRecord> out;
  while (q.Next()) out.push_back(ReadUserDevice(q.get()));
  return out;
}

Result SqliteRepository::RekeyUser(Transaction& t, const std::string& old_user_id, const std::string& new_user_id) {
  return Write(TX(t).Handle(), sql::REKEY_USER, [&](sqlite3_stmt* st) {
    BindText(st, 1, new_user_id);
    BindText(st, 2, old_user_id);
  }, &Translate);
}

Result SqliteRepository::DeleteUserDevices(Transaction& t, const std::string& device_id) {
  return Write(TX(t).Handle(), sql::DELETE_USER_DEVICES, [&](sqlite3_stmt* st) { BindText(st, 1, device_id); }, &Translate);
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCommand(Transaction& t, const model::PendingCommandRecord& r) {
  return Write(TX(t).Handle(), sql::UPSERT_COMMAND, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.device_id);
    BindText(st, 2, r.type);
    BindText(st, 3, r.cmd);
    BindI64(st, 4, r.created_at_ms);
  }, &Translate);
}

std::optional<model::PendingCommandRecord>
SqliteRepository::PopOldestCommand(Transaction& t, const std::string& device_id) {
  Query q(TX(t).Handle(), sql::POP_OLDEST_COMMAND, "pop_command");
  BindText(q.get(), 1, device_id);
  if (!q.Next()) return std::nullopt;
  auto row = ReadCommand(q.get());
  // run the statement to completion
  while (q.Next()) {
  }
  return row;
}

std::vector<model::PendingCommandRecord>
SqliteRepository::ListCommands(Transaction& t, const std::string& device_id) {
  Query q(TX(t).Handle(), sql::LIST_COMMANDS, "list_commands");
  BindText(q.get(), 1, device_id);

  std::vector<model::PendingCommandRecord> out;
  while (q.Next()) out.push_back(ReadCommand(q.get()));
  return out;
}

Result SqliteRepository::PurgeCommands(Transaction& t, const std::string& device_id) {
  return Write(TX(t).Handle(), sql::PURGE_COMMANDS, [&](sqlite3_stmt* st) { BindText(st, 1, device_id); }, &Translate);
}

// ------------------------------------------------------------------
// Positions
// ------------------------------------------------------------------

Result SqliteRepository::InsertPosition(Transaction& t, const model::PositionRecord& r) {
  return Write(TX(t).Handle(), sql::INSERT_POSITION, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.device_id);
    BindI64(st, 2, r.time_ms);
    BindFloat(st, 3, r.latitude);
    BindFloat(st, 4, r.longitude);
    BindFloat(st, 5, r.altitude);
    BindFloat(st, 6, r.accuracy);
  }, &Translate);
}

std::vector<model::PositionRecord>
SqliteRepository::ListPositions(Transaction& t, const std::string& device_id, uint32_t limit) {
  Query q(TX(t).Handle(), sql::LIST_POSITIONS, "list_positions");
  BindText(q.get(), 1, device_id);
  BindI64(q.get(), 2, limit);

  std::vector<model::PositionRecord> out;
  while (q.Next()) {
    auto*                 st = q.get();
    model::PositionRecord r;
    r.device_id = ColText(st, 0);
    r.time_ms   = ColI64(st, 1);
    r.latitude  = ColFloat(st, 2);
    r.longitude = ColFloat(st, 3);
    r.altitude  = ColFloat(st, 4);
    r.accuracy  = ColFloat(st, 5);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::PurgePositions(Transaction& t, const std::string& device_id) {
  return Write(TX(t).Handle(), sql::PURGE_POSITIONS, [&](sqlite3_stmt* st) { BindText(st, 1, device_id); }, &Translate);
}

Result SqliteRepository::DeletePositionsOlderThan(Transaction& t, int64_t cutoff_ms) {
  return Write(TX(t).Handle(), sql::DELETE_POSITIONS_OLDER_THAN, [&](sqlite3_stmt* st) { BindI64(st, 1, cutoff_ms); }, &Translate);
}

// ------------------------------------------------------------------
// Nonces
// ------------------------------------------------------------------

Result SqliteRepository::InsertNonce(Transaction& t, const model::NonceRecord& r) {
  return Write(TX(t).Handle(), sql::INSERT_NONCE, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.key);
    BindText(st, 2, r.val);
    BindI64(st, 3, r.created_at_ms);
  }, &Translate);
}

std::optional<std::string> SqliteRepository::TakeNonce(Transaction& t, const std::string& key) {
  Query q(TX(t).Handle(), sql::TAKE_NONCE, "take_nonce");
  BindText(q.get(), 1, key);
  if (!q.Next()) return std::nullopt;
  auto val = ColText(q.get(), 0);
  while (q.Next()) {
  }
  return val;
}

Result SqliteRepository::DeleteNoncesOlderThan(Transaction& t, int64_t cutoff_ms) {
  return Write(TX(t).Handle(), sql::DELETE_NONCES_OLDER_THAN, [&](sqlite3_stmt* st) { BindI64(st, 1, cutoff_ms); }, &Translate);
}

// ------------------------------------------------------------------
// Meta
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetMeta(Transaction& t, const std::string& key) {
  Query q(TX(t).Handle(), sql::SELECT_META, "get_meta");
  BindText(q.get(), 1, key);
  if (!q.Next()) return std::nullopt;
  return ColText(q.get(), 0);
}

Result SqliteRepository::SetMeta(Transaction& t, const std::string& key, const std::string& value) {
  return Write(TX(t).Handle(), sql::UPSERT_META, [&](sqlite3_stmt* st) {
    BindText(st, 1, key);
    BindText(st, 2, value);
  }, &Translate);
}

} // namespace fmd::db::sqlite
