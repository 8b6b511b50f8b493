#include "command_queue.hpp"

#include "db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/time.hpp"

namespace fmd::service {

using observability::StringField;

CommandQueue::CommandQueue(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void CommandQueue::StoreCommand(const std::string& device_id, const std::string& command, const std::string& type) {
  db::model::PendingCommandRecord record;
  record.device_id     = device_id;
  record.type          = type;
  record.cmd           = command;
  record.created_at_ms = util::NowMillis();

  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.UpsertCommand(*tx, record), "store_command", device_id);
  tx->Commit();

  FMD_LOG_DEBUG("db", "stored command", {StringField("device_id", device_id), StringField("type", type)});
}

std::optional<model::PendingCommand> CommandQueue::GetPending(const std::string& device_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  auto       row    = repo.PopOldestCommand(*tx, device_id);
  const auto now_ms = util::NowMillis();
  ThrowIfDbError(repo.TouchDevice(*tx, device_id, now_ms), "touch_device", device_id);
  tx->Commit();

  if (!row.has_value()) {
    return std::nullopt;
  }

  observability::Metrics::Instance().RecordTimer("cmd.pending", static_cast<double>(now_ms - row->created_at_ms) / 1000.0);
  return model::PendingCommand{row->cmd, row->type};
}

void CommandQueue::PurgeCommands(const std::string& device_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.PurgeCommands(*tx, device_id), "purge_commands", device_id);
  tx->Commit();
}

} // namespace fmd::service
