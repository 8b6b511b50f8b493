#pragma once

#include <cstdint>
#include <string>

namespace fmd::db::model {

/*
  pending_command row.

  At most one row per (device_id, type), enforced by a unique index
  and written with a native upsert.
*/

struct PendingCommandRecord {
  uint64_t    id = 0;
  std::string device_id;
  std::string type;
  std::string cmd;
  int64_t     created_at_ms = 0;
};

} // namespace fmd::db::model
