#pragma once

#include <string>
#include <vector>

namespace fmd::db::sql {

/*
  Table layout shared by the relational backends.

  device_info       one row per device
  user_device_map   owner + display name; device_id is unique
  pending_command   at most one row per (device_id, type)
  position          latest-only by policy, history-capable by layout
  nonce             single-use server nonces
  meta              key/value markers, e.g. db.ver

  Statements are idempotent (IF NOT EXISTS) and run on every start.
*/

inline constexpr const char* kSchemaVersionKey = "db.ver";
inline constexpr const char* kSchemaVersion    = "1";

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace fmd::db::sql
