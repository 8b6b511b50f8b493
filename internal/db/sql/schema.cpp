#include "schema.hpp"

namespace fmd::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS device_info (id TEXT PRIMARY KEY, lockable INTEGER NOT NULL DEFAULT 0, logged_in INTEGER NOT NULL DEFAULT 0, last_exchange_ms INTEGER NOT NULL DEFAULT 0, hawk_secret TEXT NOT NULL, push_url TEXT NOT NULL DEFAULT '', accepts TEXT NOT NULL DEFAULT '', access_token TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS user_device_map (user_id TEXT NOT NULL, device_id TEXT NOT NULL UNIQUE, name TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, PRIMARY KEY (user_id, device_id));",
      "CREATE INDEX IF NOT EXISTS user_device_map_user_idx ON user_device_map(user_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS pending_command (id INTEGER PRIMARY KEY AUTOINCREMENT, device_id TEXT NOT NULL, type TEXT NOT NULL, cmd TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS pending_command_device_type_idx ON pending_command(device_id, type);",
      "CREATE TABLE IF NOT EXISTS position (device_id TEXT NOT NULL, time_ms INTEGER NOT NULL, latitude REAL NOT NULL, longitude REAL NOT NULL, altitude REAL NOT NULL, accuracy REAL NOT NULL);",
      "CREATE INDEX IF NOT EXISTS position_device_time_idx ON position(device_id, time_ms);",
      "CREATE INDEX IF NOT EXISTS position_time_idx ON position(time_ms);",
      "CREATE TABLE IF NOT EXISTS nonce (key TEXT PRIMARY KEY, val TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS nonce_created_idx ON nonce(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);"};
  return kStatements;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS device_info (id TEXT PRIMARY KEY, lockable BOOLEAN NOT NULL DEFAULT FALSE, logged_in BOOLEAN NOT NULL DEFAULT FALSE, last_exchange_ms BIGINT NOT NULL DEFAULT 0, hawk_secret TEXT NOT NULL, push_url TEXT NOT NULL DEFAULT '', accepts TEXT NOT NULL DEFAULT '', access_token TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS user_device_map (user_id TEXT NOT NULL, device_id TEXT NOT NULL UNIQUE, name TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, PRIMARY KEY (user_id, device_id));",
      "CREATE INDEX IF NOT EXISTS user_device_map_user_idx ON user_device_map(user_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS pending_command (id BIGSERIAL PRIMARY KEY, device_id TEXT NOT NULL, type TEXT NOT NULL, cmd TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS pending_command_device_type_idx ON pending_command(device_id, type);",
      "CREATE TABLE IF NOT EXISTS position (device_id TEXT NOT NULL, time_ms BIGINT NOT NULL, latitude REAL NOT NULL, longitude REAL NOT NULL, altitude REAL NOT NULL, accuracy REAL NOT NULL);",
      "CREATE INDEX IF NOT EXISTS position_device_time_idx ON position(device_id, time_ms);",
      "CREATE INDEX IF NOT EXISTS position_time_idx ON position(time_ms);",
      "CREATE TABLE IF NOT EXISTS nonce (key TEXT PRIMARY KEY, val TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS nonce_created_idx ON nonce(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);"};
  return kStatements;
}

} // namespace fmd::db::sql
