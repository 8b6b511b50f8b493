#include "position_tracker.hpp"

#include "db_error.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/time.hpp"

namespace fmd::service {

using observability::IntField;

PositionTracker::PositionTracker(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void PositionTracker::SetDeviceLocation(const std::string& device_id, const model::Position& position) {
  db::model::PositionRecord record;
  record.device_id = device_id;
  record.time_ms   = util::NowMillis();
  record.latitude  = static_cast<float>(position.latitude);
  record.longitude = static_cast<float>(position.longitude);
  record.altitude  = static_cast<float>(position.altitude);
  record.accuracy  = static_cast<float>(position.accuracy);

  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();
  ThrowIfDbError(repo.PurgePositions(*tx, device_id), "purge_positions", device_id);
  ThrowIfDbError(repo.InsertPosition(*tx, record), "insert_position", device_id);
  tx->Commit();
}

std::vector<model::Position> PositionTracker::GetPositions(const std::string& device_id) {
  auto& repo    = *ctx_.repository;
  auto  tx      = repo.Begin();
  auto  records = repo.ListPositions(*tx, device_id, 1);
  tx->Commit();

  std::vector<model::Position> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back({r.latitude, r.longitude, r.altitude, r.accuracy, r.time_ms / 1000});
  }
  return out;
}

uint64_t PositionTracker::GcDatabase() {
  return GcDatabase(std::chrono::seconds(static_cast<int64_t>(ctx_.options.position_expiry_sec)));
}

uint64_t PositionTracker::GcDatabase(std::chrono::seconds expiry) {
  const int64_t cutoff_ms = util::NowMillis() - std::chrono::duration_cast<std::chrono::milliseconds>(expiry).count();

  auto& repo   = *ctx_.repository;
  auto  tx     = repo.Begin();
  auto  result = repo.DeletePositionsOlderThan(*tx, cutoff_ms);
  ThrowIfDbError(result, "gc_positions", {});
  tx->Commit();

  if (result.rows > 0) {
    observability::Metrics::Instance().Increment("gc.positions.deleted", static_cast<int64_t>(result.rows));
    FMD_LOG_INFO("gc", "expired positions removed", {IntField("count", static_cast<int64_t>(result.rows))});
  }
  return result.rows;
}

} // namespace fmd::service
