#include "device_registry.hpp"

#include "db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace fmd::service {

using observability::StringField;

namespace {

db::model::DeviceRecord ToDeviceRecord(const model::Device& device, int64_t now_ms) {
  db::model::DeviceRecord record;
  record.id               = device.id;
  record.lockable         = device.lockable;
  record.logged_in        = device.logged_in;
  record.last_exchange_ms = now_ms;
  record.hawk_secret      = device.hawk_secret;
  record.push_url         = device.push_url;
  record.accepts          = device.accepts;
  record.access_token     = device.access_token;
  return record;
}

model::DeviceListEntry ToListEntry(const db::model::UserDeviceRecord& record) {
  return {record.device_id, record.name.empty() ? record.device_id : record.name};
}

} // namespace

DeviceRegistry::DeviceRegistry(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string DeviceRegistry::Register(const std::string& user_id, model::Device device) {
  if (device.id.empty()) {
    device.id = util::NewId();
  }

  const auto now_ms = util::NowMillis();
  auto&      repo   = *ctx_.repository;
  auto       tx     = repo.Begin();

  if (repo.FindUserDevice(*tx, user_id, device.id).has_value()) {
    FMD_LOG_DEBUG("db", "updating device", {StringField("user_id", user_id), StringField("device_id", device.id)});
    ThrowIfDbError(repo.UpdateDevice(*tx, ToDeviceRecord(device, now_ms)), "update_device", device.id);
    tx->Commit();
    return device.id;
  }

  ThrowIfDbError(repo.InsertDevice(*tx, ToDeviceRecord(device, now_ms)), "insert_device", device.id);

  db::model::UserDeviceRecord mapping;
  mapping.user_id       = user_id;
  mapping.device_id     = device.id;
  mapping.name          = device.name;
  mapping.created_at_ms = now_ms;
  ThrowIfDbError(repo.InsertUserDevice(*tx, mapping), "map_user_device", device.id);

  tx->Commit();
  FMD_LOG_INFO("db", "device registered", {StringField("user_id", user_id), StringField("device_id", device.id)});
  return device.id;
}

model::Device DeviceRegistry::GetDeviceInfo(const std::string& device_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  auto  info = repo.GetDeviceInfo(*tx, device_id);
  tx->Commit();

  if (!info.has_value()) {
    throw util::Error(util::ErrorKind::UnknownDevice, "unknown device", "get_device_info", device_id);
  }

  model::Device device;
  device.id               = info->device.id;
  device.user_id          = info->user_id;
  device.name             = info->name;
  device.lockable         = info->device.lockable;
  device.logged_in        = !info->device.push_url.empty();
  device.last_exchange_ms = info->device.last_exchange_ms;
  device.hawk_secret      = info->device.hawk_secret;
  device.push_url         = info->device.push_url;
  device.accepts          = info->device.accepts;
  device.access_token     = info->device.access_token;
  return device;
}

model::DeviceOwner DeviceRegistry::GetUserFromDevice(const std::string& device_id) {
  auto& repo    = *ctx_.repository;
  auto  tx      = repo.Begin();
  auto  mapping = repo.GetUserForDevice(*tx, device_id);
  tx->Commit();

  if (!mapping.has_value()) {
    throw util::Error(util::ErrorKind::UnknownDevice, "unknown device", "get_user_from_device", device_id);
  }
  return {mapping->user_id, mapping->name};
}

std::vector<model::DeviceListEntry> DeviceRegistry::GetDevicesForUser(const std::string& user_id, const std::string& old_user_id) {
  if (old_user_id.empty() || old_user_id == user_id) {
    return ListDevices(user_id);
  }

  // Re-key and list in one transaction so a concurrent Register under the
  // old id cannot land between the two.
  auto& repo = *ctx_.repository;
  {
    auto tx    = repo.Begin();
    auto rekey = repo.RekeyUser(*tx, old_user_id, user_id);
    if (rekey) {
      std::vector<model::DeviceListEntry> out;
      for (const auto& record : repo.ListDevicesForUser(*tx, user_id, ctx_.options.max_devices_per_user)) {
        out.push_back(ToListEntry(record));
      }
      tx->Commit();
      observability::Metrics::Instance().Increment("db.UserID.Updated", static_cast<int64_t>(rekey.rows));
      return out;
    }

    if (rekey.code == db::ErrorCode::Busy || rekey.code == db::ErrorCode::Timeout) {
      ThrowIfDbError(rekey, "rekey_user", old_user_id);
    }

    FMD_LOG_ERROR("db", "could not update user id",
                  {StringField("user_id", user_id), StringField("old_user_id", old_user_id), StringField("error", rekey.message)});
    tx->Rollback();
  }

  // TODO: retry the re-key on a later call instead of leaving the devices under old_user_id.
  return ListDevices(old_user_id);
}

std::vector<model::DeviceListEntry> DeviceRegistry::ListDevices(const std::string& user_id) {
  auto& repo    = *ctx_.repository;
  auto  tx      = repo.Begin();
  auto  records = repo.ListDevicesForUser(*tx, user_id, ctx_.options.max_devices_per_user);
  tx->Commit();

  std::vector<model::DeviceListEntry> out;
  out.reserve(records.size());
  for (const auto& record : records) out.push_back(ToListEntry(record));
  return out;
}

void DeviceRegistry::SetAccessToken(const std::string& device_id, const std::string& token) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.SetAccessToken(*tx, device_id, token, util::NowMillis()), "set_access_token", device_id);
  tx->Commit();
}

void DeviceRegistry::SetDeviceLock(const std::string& device_id, bool lockable) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.SetDeviceLock(*tx, device_id, lockable, util::NowMillis()), "set_device_lock", device_id);
  tx->Commit();
  FMD_LOG_DEBUG("db", "device lock updated", {StringField("device_id", device_id), observability::BoolField("lockable", lockable)});
}

void DeviceRegistry::Touch(const std::string& device_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.TouchDevice(*tx, device_id, util::NowMillis()), "touch_device", device_id);
  tx->Commit();
}

void DeviceRegistry::DeleteDevice(const std::string& device_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.PurgeCommands(*tx, device_id), "delete_device.pending_command", device_id);
  ThrowIfDbError(repo.PurgePositions(*tx, device_id), "delete_device.position", device_id);
  ThrowIfDbError(repo.DeleteUserDevices(*tx, device_id), "delete_device.user_device_map", device_id);
  ThrowIfDbError(repo.DeleteDevice(*tx, device_id), "delete_device.device_info", device_id);
  tx->Commit();
  FMD_LOG_INFO("db", "device deleted", {StringField("device_id", device_id)});
}

} // namespace fmd::service
