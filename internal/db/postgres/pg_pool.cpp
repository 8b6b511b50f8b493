#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace fmd::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout, int statement_timeout_ms)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout),
      statement_timeout_ms_(statement_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + acquire_timeout_;

  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        Setup(*conn);
        return Wrap(conn.release());
      } catch (const std::exception& e) {
        {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
        }
        cv_.notify_one();
        throw util::Error(util::ErrorKind::Storage, e.what(), "pg_connect");
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      throw util::Error(util::ErrorKind::Timeout, "no postgres connection available within timeout", "pg_acquire");
    }
  }
}

void PgPool::Setup(pqxx::connection& conn) const {
  {
    pqxx::nontransaction tx(conn);
    tx.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
  }
  PrepareStatements(conn);
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // devices
  conn.prepare("insert_device",
               "INSERT INTO device_info(id,lockable,logged_in,last_exchange_ms,hawk_secret,push_url,accepts,access_token) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("update_device",
               "UPDATE device_info SET lockable=$2,logged_in=$3,last_exchange_ms=$4,hawk_secret=$5,accepts=$6,push_url=$7 "
               "WHERE id=$1");

  conn.prepare("get_device_info",
               "SELECT d.id,d.lockable,d.logged_in,d.last_exchange_ms,d.hawk_secret,d.push_url,d.accepts,d.access_token,"
               "m.user_id,m.name "
               "FROM device_info d LEFT JOIN user_device_map m ON m.device_id=d.id WHERE d.id=$1");

  conn.prepare("set_access_token", "UPDATE device_info SET access_token=$2,last_exchange_ms=$3 WHERE id=$1");
  conn.prepare("set_device_lock", "UPDATE device_info SET lockable=$2,last_exchange_ms=$3 WHERE id=$1");
  conn.prepare("touch_device", "UPDATE device_info SET last_exchange_ms=$2 WHERE id=$1");
  conn.prepare("delete_device", "DELETE FROM device_info WHERE id=$1");

  // user mapping
  conn.prepare("insert_user_device", "INSERT INTO user_device_map(user_id,device_id,name,created_at_ms) VALUES($1,$2,$3,$4)");
  conn.prepare("find_user_device",
               "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE user_id=$1 AND device_id=$2");
  conn.prepare("get_user_for_device", "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE device_id=$1");
  conn.prepare("list_devices_for_user",
               "SELECT user_id,device_id,name,created_at_ms FROM user_device_map WHERE user_id=$1 "
               "ORDER BY created_at_ms DESC LIMIT $2");
  conn.prepare("rekey_user", "UPDATE user_device_map SET user_id=$2 WHERE user_id=$1");
  conn.prepare("delete_user_devices", "DELETE FROM user_device_map WHERE device_id=$1");

  // pending commands
  conn.prepare("upsert_command",
               "INSERT INTO pending_command(device_id,type,cmd,created_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(device_id,type) DO UPDATE SET cmd=EXCLUDED.cmd, created_at_ms=EXCLUDED.created_at_ms");
  conn.prepare("pop_oldest_command",
               "DELETE FROM pending_command WHERE id=("
               "SELECT id FROM pending_command WHERE device_id=$1 ORDER BY created_at_ms ASC, id ASC LIMIT 1 "
               "FOR UPDATE SKIP LOCKED) "
               "RETURNING id,device_id,type,cmd,created_at_ms");
  conn.prepare("list_commands",
               "SELECT id,device_id,type,cmd,created_at_ms FROM pending_command WHERE device_id=$1 "
               "ORDER BY created_at_ms ASC, id ASC");
  conn.prepare("purge_commands", "DELETE FROM pending_command WHERE device_id=$1");

  // positions
  conn.prepare("insert_position",
               "INSERT INTO position(device_id,time_ms,latitude,longitude,altitude,accuracy) VALUES($1,$2,$3,$4,$5,$6)");
  conn.prepare("list_positions",
               "SELECT device_id,time_ms,latitude,longitude,altitude,accuracy FROM position WHERE device_id=$1 "
               "ORDER BY time_ms DESC LIMIT $2");
  conn.prepare("purge_positions", "DELETE FROM position WHERE device_id=$1");
  conn.prepare("delete_positions_older_than", "DELETE FROM position WHERE time_ms<$1");

  // nonces
  conn.prepare("insert_nonce", "INSERT INTO nonce(key,val,created_at_ms) VALUES($1,$2,$3)");
  conn.prepare("take_nonce", "DELETE FROM nonce WHERE key=$1 RETURNING val");
  conn.prepare("delete_nonces_older_than", "DELETE FROM nonce WHERE created_at_ms<$1");

  // meta
  conn.prepare("get_meta", "SELECT value FROM meta WHERE key=$1");
  conn.prepare("set_meta", "INSERT INTO meta(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace fmd::db::postgres
