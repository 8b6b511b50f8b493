#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fmd::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_timeout) : lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result MemoryRepository::InsertDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.devices.contains(r.id)) return Result::Err(ErrorCode::ConstraintViolation, "device_info.id not unique");
  s.devices[r.id] = r;
  return Result::Ok(1);
}

Result MemoryRepository::UpdateDevice(Transaction& t, const model::DeviceRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(r.id);
  if (it == s.devices.end()) return Result::Ok(0);

  auto& d            = it->second;
  d.lockable         = r.lockable;
  d.logged_in        = r.logged_in;
  d.last_exchange_ms = r.last_exchange_ms;
  d.hawk_secret      = r.hawk_secret;
  d.accepts          = r.accepts;
  d.push_url         = r.push_url;
  return Result::Ok(1);
}

std::optional<model::DeviceInfoRecord> MemoryRepository::GetDeviceInfo(Transaction& t, const std::string& device_id) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(device_id);
  if (it == s.devices.end()) return std::nullopt;

  model::DeviceInfoRecord info;
  info.device = it->second;
  for (const auto& m : s.mappings) {
    if (m.device_id == device_id) {
      info.user_id = m.user_id;
      info.name    = m.name;
      break;
    }
  }
  return info;
}

Result MemoryRepository::SetAccessToken(Transaction& t, const std::string& device_id, const std::string& token, int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(device_id);
  if (it == s.devices.end()) return Result::Ok(0);
  it->second.access_token     = token;
  it->second.last_exchange_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::SetDeviceLock(Transaction& t, const std::string& device_id, bool lockable, int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(device_id);
  if (it == s.devices.end()) return Result::Ok(0);
  it->second.lockable         = lockable;
  it->second.last_exchange_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::TouchDevice(Transaction& t, const std::string& device_id, int64_t now_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.devices.find(device_id);
  if (it == s.devices.end()) return Result::Ok(0);
  it->second.last_exchange_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::DeleteDevice(Transaction& t, const std::string& device_id) {
  return Result::Ok(TX(t).Mutable().devices.erase(device_id));
}

// ------------------------------------------------------------------
// User to device mapping
// ------------------------------------------------------------------

Result MemoryRepository::InsertUserDevice(Transaction& t, const model::UserDeviceRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& m : s.mappings) {
    if (m.device_id == r.device_id) return Result::Err(ErrorCode::ConstraintViolation, "user_device_map.device_id not unique");
  }
  s.mappings.push_back(r);
  return Result::Ok(1);
}

std::optional<model::UserDeviceRecord> MemoryRepository::FindUserDevice(Transaction& t, const std::string& user_id, const std::string& device_id) {
  for (const auto& m : TX(t).View().mappings) {
    if (m.user_id == user_id && m.device_id == device_id) return m;
  }
  return std::nullopt;
}

std::optional<model::UserDeviceRecord> MemoryRepository::GetUserForDevice(Transaction& t, const std::string& device_id) {
  for (const auto& m : TX(t).View().mappings) {
    if (m.device_id == device_id) return m;
  }
  return std::nullopt;
}

std::vector<model::UserDeviceRecord> MemoryRepository::ListDevicesForUser(Transaction& t, const std::string& user_id, uint32_t limit) {
  std::vector<model::UserDeviceRecord> out;
  const auto&                          mappings = TX(t).View().mappings;
  // newest insertion first so equal timestamps keep a stable order
  for (auto it = mappings.rbegin(); it != mappings.rend(); ++it) {
    if (it->user_id == user_id) out.push_back(*it);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms > b.created_at_ms; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::RekeyUser(Transaction& t, const std::string& old_user_id, const std::string& new_user_id) {
  uint64_t moved = 0;
  for (auto& m : TX(t).Mutable().mappings) {
    if (m.user_id == old_user_id) {
      m.user_id = new_user_id;
      ++moved;
    }
  }
  return Result::Ok(moved);
}

Result MemoryRepository::DeleteUserDevices(Transaction& t, const std::string& device_id) {
  auto&      mappings = TX(t).Mutable().mappings;
  const auto before   = mappings.size();
  std::erase_if(mappings, [&](const auto& m) { return m.device_id == device_id; });
  return Result::Ok(before - mappings.size());
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCommand(Transaction& t, const model::PendingCommandRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.commands.find({r.device_id, r.type});
  if (it != s.commands.end()) {
    it->second.cmd           = r.cmd;
    it->second.created_at_ms = r.created_at_ms;
    return Result::Ok(1);
  }
  auto row = r;
  row.id   = s.next_command_id++;
  s.commands.emplace(CommandKey{r.device_id, r.type}, std::move(row));
  return Result::Ok(1);
}

std::optional<model::PendingCommandRecord> MemoryRepository::PopOldestCommand(Transaction& t, const std::string& device_id) {
  auto& commands = TX(t).Mutable().commands;
  auto  oldest   = commands.end();
  for (auto it = commands.lower_bound({device_id, std::string()}); it != commands.end() && it->first.first == device_id; ++it) {
    if (oldest == commands.end() || it->second.created_at_ms < oldest->second.created_at_ms ||
        (it->second.created_at_ms == oldest->second.created_at_ms && it->second.id < oldest->second.id)) {
      oldest = it;
    }
  }
  if (oldest == commands.end()) return std::nullopt;
  auto row = std::move(oldest->second);
  commands.erase(oldest);
  return row;
}

std::vector<model::PendingCommandRecord> MemoryRepository::ListCommands(Transaction& t, const std::string& device_id) {
  std::vector<model::PendingCommandRecord> out;
  const auto&                              commands = TX(t).View().commands;
  for (auto it = commands.lower_bound({device_id, std::string()}); it != commands.end() && it->first.first == device_id; ++it) {
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.created_at_ms != b.created_at_ms ? a.created_at_ms < b.created_at_ms : a.id < b.id;
  });
  return out;
}

Result MemoryRepository::PurgeCommands(Transaction& t, const std::string& device_id) {
  auto&    commands = TX(t).Mutable().commands;
  uint64_t removed  = 0;
  for (auto it = commands.lower_bound({device_id, std::string()}); it != commands.end() && it->first.first == device_id;) {
    it = commands.erase(it);
    ++removed;
  }
  return Result::Ok(removed);
}

// ------------------------------------------------------------------
// Positions
// ------------------------------------------------------------------

Result MemoryRepository::InsertPosition(Transaction& t, const model::PositionRecord& r) {
  TX(t).Mutable().positions.push_back(r);
  return Result::Ok(1);
}

std::vector<model::PositionRecord> MemoryRepository::ListPositions(Transaction& t, const std::string& device_id, uint32_t limit) {
  std::vector<model::PositionRecord> out;
  for (const auto& p : TX(t).View().positions) {
    if (p.device_id == device_id) out.push_back(p);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.time_ms > b.time_ms; });
  if (out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::PurgePositions(Transaction& t, const std::string& device_id) {
  auto&      positions = TX(t).Mutable().positions;
  const auto before    = positions.size();
  std::erase_if(positions, [&](const auto& p) { return p.device_id == device_id; });
  return Result::Ok(before - positions.size());
}

Result MemoryRepository::DeletePositionsOlderThan(Transaction& t, int64_t cutoff_ms) {
  auto&      positions = TX(t).Mutable().positions;
  const auto before    = positions.size();
  std::erase_if(positions, [&](const auto& p) { return p.time_ms < cutoff_ms; });
  return Result::Ok(before - positions.size());
}

// ------------------------------------------------------------------
// Nonces
// ------------------------------------------------------------------

Result MemoryRepository::InsertNonce(Transaction& t, const model::NonceRecord& r) {
  auto& nonces = TX(t).Mutable().nonces;
  if (nonces.contains(r.key)) return Result::Err(ErrorCode::ConstraintViolation, "nonce.key not unique");
  nonces[r.key] = r;
  return Result::Ok(1);
}

std::optional<std::string> MemoryRepository::TakeNonce(Transaction& t, const std::string& key) {
  auto& nonces = TX(t).Mutable().nonces;
  auto  it     = nonces.find(key);
  if (it == nonces.end()) return std::nullopt;
  auto val = std::move(it->second.val);
  nonces.erase(it);
  return val;
}

Result MemoryRepository::DeleteNoncesOlderThan(Transaction& t, int64_t cutoff_ms) {
  auto& nonces = TX(t).Mutable().nonces;
  auto  n      = std::erase_if(nonces, [&](const auto& kv) { return kv.second.created_at_ms < cutoff_ms; });
  return Result::Ok(n);
}

// ------------------------------------------------------------------
// Meta
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetMeta(Transaction& t, const std::string& key) {
  const auto& meta = TX(t).View().meta;
  auto        it   = meta.find(key);
  if (it == meta.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::SetMeta(Transaction& t, const std::string& key, const std::string& value) {
  TX(t).Mutable().meta[key] = value;
  return Result::Ok(1);
}

} // namespace fmd::db::memory
