#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/device_info_record.hpp"
#include "internal/db/model/device_record.hpp"
#include "internal/db/model/nonce_record.hpp"
#include "internal/db/model/pending_command_record.hpp"
#include "internal/db/model/position_record.hpp"
#include "internal/db/model/user_device_record.hpp"

namespace fmd::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - TakeNonce / PopOldestCommand are destructive reads: a row is handed
    to at most one transaction
  - Writes report failure through Result; reads return "absent" as an
    empty optional/vector and throw util::Error(Storage|Timeout) when
    the backend fails, so the two are never confused

  The DB is the source of truth for:
    devices and their owners
    pending commands
    positions
    nonces
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Devices
  // ---------------------------------------------------------------------

  virtual Result InsertDevice(Transaction&, const model::DeviceRecord&) = 0;

  // Updates lockable, logged_in, last_exchange, secret, accepts, push_url.
  virtual Result UpdateDevice(Transaction&, const model::DeviceRecord&) = 0;

  virtual std::optional<model::DeviceInfoRecord> GetDeviceInfo(Transaction&, const std::string& device_id) = 0;

  virtual Result SetAccessToken(Transaction&, const std::string& device_id, const std::string& token, int64_t now_ms) = 0;

  virtual Result SetDeviceLock(Transaction&, const std::string& device_id, bool lockable, int64_t now_ms) = 0;

  virtual Result TouchDevice(Transaction&, const std::string& device_id, int64_t now_ms) = 0;

  virtual Result DeleteDevice(Transaction&, const std::string& device_id) = 0;

  // ---------------------------------------------------------------------
  // User to device mapping
  // ---------------------------------------------------------------------

  virtual Result InsertUserDevice(Transaction&, const model::UserDeviceRecord&) = 0;

  virtual std::optional<model::UserDeviceRecord> FindUserDevice(Transaction&, const std::string& user_id, const std::string& device_id) = 0;

  virtual std::optional<model::UserDeviceRecord> GetUserForDevice(Transaction&, const std::string& device_id) = 0;

  // Newest association first.
  virtual std::vector<model::UserDeviceRecord> ListDevicesForUser(Transaction&, const std::string& user_id, uint32_t limit) = 0;

  // Moves every mapping of old_user_id to new_user_id. Result::rows = mappings moved.
  virtual Result RekeyUser(Transaction&, const std::string& old_user_id, const std::string& new_user_id) = 0;

  virtual Result DeleteUserDevices(Transaction&, const std::string& device_id) = 0;

  // ---------------------------------------------------------------------
  // Pending commands
  // ---------------------------------------------------------------------

  // Insert or replace the (device_id, type) row.
  virtual Result UpsertCommand(Transaction&, const model::PendingCommandRecord&) = 0;

  // Oldest command for the device across all types, deleted as it is read.
  virtual std::optional<model::PendingCommandRecord> PopOldestCommand(Transaction&, const std::string& device_id) = 0;

  virtual std::vector<model::PendingCommandRecord> ListCommands(Transaction&, const std::string& device_id) = 0;

  virtual Result PurgeCommands(Transaction&, const std::string& device_id) = 0;

  // ---------------------------------------------------------------------
  // Positions
  // ---------------------------------------------------------------------

  virtual Result InsertPosition(Transaction&, const model::PositionRecord&) = 0;

  // Newest first.
  virtual std::vector<model::PositionRecord> ListPositions(Transaction&, const std::string& device_id, uint32_t limit) = 0;

  virtual Result PurgePositions(Transaction&, const std::string& device_id) = 0;

  // Result::rows = positions removed.
  virtual Result DeletePositionsOlderThan(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Nonces
  // ---------------------------------------------------------------------

  virtual Result InsertNonce(Transaction&, const model::NonceRecord&) = 0;

  // Deletes the row and returns its value; empty if no such key.
  virtual std::optional<std::string> TakeNonce(Transaction&, const std::string& key) = 0;

  // Result::rows = nonces removed.
  virtual Result DeleteNoncesOlderThan(Transaction&, int64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Meta
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetMeta(Transaction&, const std::string& key) = 0;

  virtual Result SetMeta(Transaction&, const std::string& key, const std::string& value) = 0;
};

} // namespace fmd::db
