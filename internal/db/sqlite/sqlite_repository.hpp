#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fmd::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
