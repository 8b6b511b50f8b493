#include "pg_repository.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace fmd::db::postgres {

namespace {

/*
  Reads have no Result channel: a driver failure becomes util::Error so
  callers never confuse it with an empty result.
*/
template <typename Fn>
auto Read(const char* operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::query_cancelled& e) {
    throw util::Error(util::ErrorKind::Timeout, e.what(), operation);
  } catch (const pqxx::failure& e) {
    throw util::Error(util::ErrorKind::Storage, e.what(), operation);
  }
}

model::UserDeviceRecord ReadUserDevice(const pqxx::row& row) {
  model::UserDeviceRecord r;
  r.user_id       = row[0].c_str();
  r.device_id     = row[1].c_str();
  r.name          = row[2].c_str();
  r.created_at_ms = row[3].as<int64_t>();
  return r;
}

model::PendingCommandRecord ReadCommand(const pqxx::row& row) {
  model::PendingCommandRecord r;
  r.id            = row[0].as<uint64_t>();
  r.device_id     = row[1].c_str();
  r.type          = row[2].c_str();
  r.cmd           = row[3].c_str();
  r.created_at_ms = row[4].as<int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::query_cancelled*>(&e)) return Result::Err(ErrorCode::Timeout, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result PgRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_device", r.id, r.lockable, r.logged_in, r.last_exchange_ms, r.hawk_secret,
                                          r.push_url, r.accepts, r.access_token);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_device", r.id, r.lockable, r.logged_in, r.last_exchange_ms, r.hawk_secret,
                                          r.accepts, r.push_url);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeviceInfoRecord> PgRepository::GetDeviceInfo(Transaction& t, const std::string& device_id) {
  auto res = Read("get_device_info", [&] { return TX(t).Work().exec_prepared("get_device_info", device_id); });
  if (res.empty()) return std::nullopt;

  const auto&             row = res[0];
  model::DeviceInfoRecord info;
  info.device.id               = row[0].c_str();
  info.device.lockable         = row[1].as<bool>();
  info.device.logged_in        = row[2].as<bool>();
  info.device.last_exchange_ms = row[3].as<int64_t>();
  info.device.hawk_secret      = row[4].c_str();
  info.device.push_url         = row[5].c_str();
  info.device.accepts          = row[6].c_str();
  info.device.access_token     = row[7].c_str();
  info.user_id                 = row[8].is_null() ? "" : row[8].c_str();
  info.name                    = row[9].is_null() ? "" : row[9].c_str();
  return info;
}

Result PgRepository::SetAccessToken(Transaction& t, const std::string& device_id, const std::string& token, int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_access_token", device_id, token, now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetDeviceLock(Transaction& t, const std::string& device_id, bool lockable, int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_device_lock", device_id, lockable, now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TouchDevice(Transaction& t, const std::string& device_id, int64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_device", device_id, now_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDevice(Transaction& t, const std::string& device_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_device", device_id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// User to device mapping
// ------------------------------------------------------------------

Result PgRepository::InsertUserDevice(Transaction& t, const model::UserDeviceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_user_device", r.user_id, r.device_id, r.name, r.created_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserDeviceRecord> PgRepository::FindUserDevice(Transaction& t, const std::string& user_id, const std::string& device_id) {
  auto res = Read("find_user_device", [&] { return TX(t).Work().exec_prepared("find_user_device", user_id, device_id); });
  if (res.empty()) return std::nullopt;
  return ReadUserDevice(res[0]);
}

std::optional<model::UserDeviceRecord> PgRepository::GetUserForDevice(Transaction& t, const std::string& device_id) {
  auto res = Read("get_user_for_device", [&] { return TX(t).Work().exec_prepared("get_user_for_device", device_id); });
  if (res.empty()) return std::nullopt;
  return ReadUserDevice(res[0]);
}

std::vector<model::UserDeviceRecord> PgRepository::ListDevicesForUser(Transaction& t, const std::string& user_id, uint32_t limit) {
  auto res = Read("list_devices_for_user", [&] {
    return TX(t).Work().exec_prepared("list_devices_for_user", user_id, static_cast<int64_t>(limit));
  });

  std::vector<model::UserDeviceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadUserDevice(row));
  return out;
}

Result PgRepository::RekeyUser(Transaction& t, const std::string& old_user_id, const std::string& new_user_id) {
  try {
    auto res = TX(t).Work().exec_prepared("rekey_user", old_user_id, new_user_id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteUserDevices(Transaction& t, const std::string& device_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_user_devices", device_id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result PgRepository::UpsertCommand(Transaction& t, const model::PendingCommandRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("upsert_command", r.device_id, r.type, r.cmd, r.created_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PendingCommandRecord> PgRepository::PopOldestCommand(Transaction& t, const std::string& device_id) {
  auto res = Read("pop_command", [&] { return TX(t).Work().exec_prepared("pop_oldest_command", device_id); });
  if (res.empty()) return std::nullopt;
  return ReadCommand(res[0]);
}

std::vector<model::PendingCommandRecord> PgRepository::ListCommands(Transaction& t, const std::string& device_id) {
  auto res = Read("list_commands", [&] { return TX(t).Work().exec_prepared("list_commands", device_id); });

  std::vector<model::PendingCommandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadCommand(row));
  return out;
}

Result PgRepository::PurgeCommands(Transaction& t, const std::string& device_id) {
  try {
    auto res = TX(t).Work().exec_prepared("purge_commands", device_id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Positions
// ------------------------------------------------------------------

Result PgRepository::InsertPosition(Transaction& t, const model::PositionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_position", r.device_id, r.time_ms, r.latitude, r.longitude, r.altitude, r.accuracy);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PositionRecord> PgRepository::ListPositions(Transaction& t, const std::string& device_id, uint32_t limit) {
  auto res = Read("list_positions", [&] {
    return TX(t).Work().exec_prepared("list_positions", device_id, static_cast<int64_t>(limit));
  });

  std::vector<model::PositionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PositionRecord r;
    r.device_id = row[0].c_str();
    r.time_ms   = row[1].as<int64_t>();
    r.latitude  = row[2].as<float>();
    r.longitude = row[3].as<float>();
    r.altitude  = row[4].as<float>();
    r.accuracy  = row[5].as<float>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::PurgePositions(Transaction& t, const std::string& device_id) {
  try {
    auto res = TX(t).Work().exec_prepared("purge_positions", device_id);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeletePositionsOlderThan(Transaction& t, int64_t cutoff_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_positions_older_than", cutoff_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Nonces
// ------------------------------------------------------------------

Result PgRepository::InsertNonce(Transaction& t, const model::NonceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_nonce", r.key, r.val, r.created_at_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<std::string> PgRepository::TakeNonce(Transaction& t, const std::string& key) {
  auto res = Read("take_nonce", [&] { return TX(t).Work().exec_prepared("take_nonce", key); });
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::DeleteNoncesOlderThan(Transaction& t, int64_t cutoff_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_nonces_older_than", cutoff_ms);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Meta
// ------------------------------------------------------------------

std::optional<std::string> PgRepository::GetMeta(Transaction& t, const std::string& key) {
  auto res = Read("get_meta", [&] { return TX(t).Work().exec_prepared("get_meta", key); });
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

Result PgRepository::SetMeta(Transaction& t, const std::string& key, const std::string& value) {
  try {
    auto res = TX(t).Work().exec_prepared("set_meta", key, value);
    return Result::Ok(res.affected_rows());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace fmd::db::postgres
