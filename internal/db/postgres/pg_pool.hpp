#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace fmd::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  Design notes:
  -------------
  - Each transaction holds its own connection for its lifetime.
  - libpqxx connections are NOT thread-safe, never shared.
  - Prepared statements and statement_timeout are installed once
    per connection when it is opened.
  - Acquire() waits at most acquire_timeout for a free connection
    and then throws util::Error(Timeout).

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 16,
         std::chrono::milliseconds acquire_timeout = std::chrono::milliseconds(5000), int statement_timeout_ms = 5000);

  // Acquire a ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  void                              Setup(pqxx::connection& conn) const;
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;
  int                       statement_timeout_ms_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace fmd::db::postgres
