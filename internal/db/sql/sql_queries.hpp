#pragma once

namespace fmd::db::sql {

/*
  SQL used by the SQLite backend.

  Positional '?' parameters. The Postgres backend keeps its own
  $n-numbered prepared statements in PgPool.
*/

// devices

static constexpr const char* INSERT_DEVICE =
    "INSERT INTO device_info(id,lockable,logged_in,last_exchange_ms,hawk_secret,push_url,accepts,access_token)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_DEVICE =
    "UPDATE device_info SET lockable=?,logged_in=?,last_exchange_ms=?,hawk_secret=?,accepts=?,push_url=?"
    " WHERE id=?;";

static constexpr const char* SELECT_DEVICE_INFO =
    "SELECT d.id,d.lockable,d.logged_in,d.last_exchange_ms,d.hawk_secret,d.push_url,d.accepts,d.access_token,"
    " m.user_id,m.name"
    " FROM device_info d LEFT JOIN user_device_map m ON m.device_id=d.id"
    " WHERE d.id=?;";

static constexpr const char* SET_ACCESS_TOKEN =
    "UPDATE device_info SET access_token=?,last_exchange_ms=? WHERE id=?;";

static constexpr const char* SET_DEVICE_LOCK =
    "UPDATE device_info SET lockable=?,last_exchange_ms=? WHERE id=?;";

static constexpr const char* TOUCH_DEVICE =
    "UPDATE device_info SET last_exchange_ms=? WHERE id=?;";

static constexpr const char* DELETE_DEVICE =
    "DELETE FROM device_info WHERE id=?;";

// user mapping

static constexpr const char* INSERT_USER_DEVICE =
    "INSERT INTO user_device_map(user_id,device_id,name,created_at_ms) VALUES(?,?,?,?);";

static constexpr const char* SELECT_USER_DEVICE =
    "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE user_id=? AND device_id=?;";

static constexpr const char* SELECT_USER_FOR_DEVICE =
    "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE device_id=?;";

static constexpr const char* LIST_DEVICES_FOR_USER =
    "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE user_id=?"
    " ORDER BY created_at_ms DESC, rowid DESC LIMIT ?;";

static constexpr const char* REKEY_USER =
    "UPDATE user_device_map SET user_id=? WHERE user_id=?;";

static constexpr const char* DELETE_USER_DEVICES =
    "DELETE FROM user_device_map WHERE device_id=?;";

// pending commands

static constexpr const char* UPSERT_COMMAND =
    "INSERT INTO pending_command(device_id,type,cmd,created_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(device_id,type) DO UPDATE SET"
    " cmd=excluded.cmd,"
    " created_at_ms=excluded.created_at_ms;";

static constexpr const char* POP_OLDEST_COMMAND =
    "DELETE FROM pending_command WHERE id=("
    "SELECT id FROM pending_command WHERE device_id=? ORDER BY created_at_ms ASC, id ASC LIMIT 1)"
    " RETURNING id,device_id,type,cmd,created_at_ms;";

static constexpr const char* LIST_COMMANDS =
    "SELECT id,device_id,type,cmd,created_at_ms FROM pending_command WHERE device_id=?"
    " ORDER BY created_at_ms ASC, id ASC;";

static constexpr const char* PURGE_COMMANDS =
    "DELETE FROM pending_command WHERE device_id=?;";

// positions

static constexpr const char* INSERT_POSITION =
    "INSERT INTO position(device_id,time_ms,latitude,longitude,altitude,accuracy) VALUES(?,?,?,?,?,?);";

static constexpr const char* LIST_POSITIONS =
    "SELECT device_id,time_ms,latitude,longitude,altitude,accuracy FROM position WHERE device_id=?"
    " ORDER BY time_ms DESC LIMIT ?;";

static constexpr const char* PURGE_POSITIONS =
    "DELETE FROM position WHERE device_id=?;";

static constexpr const char* DELETE_POSITIONS_OLDER_THAN =
    "DELETE FROM position WHERE time_ms<?;";

// nonces

static constexpr const char* INSERT_NONCE =
    "INSERT INTO nonce(key,val,created_at_ms) VALUES(?,?,?);";

static constexpr const char* TAKE_NONCE =
    "DELETE FROM nonce WHERE key=? RETURNING val;";

static constexpr const char* DELETE_NONCES_OLDER_THAN =
    "DELETE FROM nonce WHERE created_at_ms<?;";

// meta

static constexpr const char* SELECT_META =
    "SELECT value FROM meta WHERE key=?;";

static constexpr const char* UPSERT_META =
    "INSERT INTO meta(key,value) VALUES(?,?)"
    " ON CONFLICT(key) DO UPDATE SET value=excluded.value;";

} // namespace fmd::db::sql
