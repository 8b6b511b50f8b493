#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fmd::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  A transaction owns the repository lock for its whole lifetime, so
  transactions are fully serialized. Used by tests and single-process
  deployments.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDevice(Transaction&, const model::DeviceRecord&) override;
  Result UpdateDevice(Transaction&, const model::DeviceRecord&) override;
  std::optional<model::DeviceInfoRecord> GetDeviceInfo(Transaction&, const std::string&) override;
  Result SetAccessToken(Transaction&, const std::string&, const std::string&, int64_t) override;
  Result SetDeviceLock(Transaction&, const std::string&, bool, int64_t) override;
  Result TouchDevice(Transaction&, const std::string&, int64_t) override;
  Result DeleteDevice(Transaction&, const std::string&) override;

  Result InsertUserDevice(Transaction&, const model::UserDeviceRecord&) override;
  std::optional<model::UserDeviceRecord> FindUserDevice(Transaction&, const std::string&, const std::string&) override;
  std::optional<model::UserDeviceRecord> GetUserForDevice(Transaction&, const std::string&) override;
  std::vector<model::UserDeviceRecord> ListDevicesForUser(Transaction&, const std::string&, uint32_t) override;
  Result RekeyUser(Transaction&, const std::string&, const std::string&) override;
  Result DeleteUserDevices(Transaction&, const std::string&) override;

  Result UpsertCommand(Transaction&, const model::PendingCommandRecord&) override;
  std::optional<model::PendingCommandRecord> PopOldestCommand(Transaction&, const std::string&) override;
  std::vector<model::PendingCommandRecord> ListCommands(Transaction&, const std::string&) override;
  Result PurgeCommands(Transaction&, const std::string&) override;

  Result InsertPosition(Transaction&, const model::PositionRecord&) override;
  std::vector<model::PositionRecord> ListPositions(Transaction&, const std::string&, uint32_t) override;
  Result PurgePositions(Transaction&, const std::string&) override;
  Result DeletePositionsOlderThan(Transaction&, int64_t) override;

  Result InsertNonce(Transaction&, const model::NonceRecord&) override;
  std::optional<std::string> TakeNonce(Transaction&, const std::string&) override;
  Result DeleteNoncesOlderThan(Transaction&, int64_t) override;

  std::optional<std::string> GetMeta(Transaction&, const std::string&) override;
  Result SetMeta(Transaction&, const std::string&, const std::string&) override;

private:
  friend class MemoryTransaction;

  using CommandKey = std::pair<std::string, std::string>; // (device_id, type)

  struct State {
    std::unordered_map<std::string, model::DeviceRecord> devices;
    // insertion order; device_id is unique across users
    std::vector<model::UserDeviceRecord> mappings;
    std::map<CommandKey, model::PendingCommandRecord> commands;
    uint64_t next_command_id = 1;
    std::vector<model::PositionRecord> positions;
    std::unordered_map<std::string, model::NonceRecord> nonces;
    std::map<std::string, std::string> meta;
  };

  std::timed_mutex          mutex_;
  std::chrono::milliseconds lock_timeout_;
  State                     committed_;
};

} // namespace fmd::db::memory
