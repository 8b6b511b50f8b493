#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if FMD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FMD_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace fmd::factory {

using namespace fmd;
using fmd::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

#if FMD_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}

std::shared_ptr<db::Repository> BuildSqlite(const RuntimeConfig& config) {
  const auto& sqlite = config.database().sqlite();
  if (sqlite.path().empty()) {
    throw util::Error(util::ErrorKind::Config, "database.sqlite.path is required for the sqlite backend", "build_repository", "sqlite");
  }
  const int busy_timeout_ms = sqlite.busy_timeout_ms() > 0 ? static_cast<int>(sqlite.busy_timeout_ms()) : 5000;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), busy_timeout_ms,
                                                          std::chrono::milliseconds(config::LockTimeoutMs(config)));
  BootstrapSqliteSchema(sqlite_db);
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}
#endif

#if FMD_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto conn = pool->Acquire();
  try {
    pqxx::work tx(*conn);
    for (const auto& sql : db::sql::PostgresSchema()) {
      tx.exec(sql);
    }
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::Error(util::ErrorKind::Storage, e.what(), "bootstrap_schema", "postgres");
  }
}

std::shared_ptr<db::Repository> BuildPostgres(const RuntimeConfig& config) {
  const auto& postgres = config.database().postgres();
  if (postgres.connection_uri().empty()) {
    throw util::Error(util::ErrorKind::Config, "database.postgres.connection_uri is required for the postgres backend", "build_repository",
                      "postgres");
  }
  const auto lock_timeout_ms      = config::LockTimeoutMs(config);
  const auto max_connections      = postgres.max_connections() > 0 ? postgres.max_connections() : 16;
  const auto statement_timeout_ms = postgres.statement_timeout_ms() > 0 ? postgres.statement_timeout_ms() : lock_timeout_ms;

  auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections, std::chrono::milliseconds(lock_timeout_ms),
                                                     static_cast<int>(statement_timeout_ms));
  BootstrapPostgresSchema(pool);
  return std::make_shared<db::postgres::PgRepository>(std::move(pool));
}
#endif

} // namespace

db::BackendRegistry DefaultBackends() {
  db::BackendRegistry backends;
  backends.Register("memory", [](const RuntimeConfig& config) -> std::shared_ptr<db::Repository> {
    return std::make_shared<db::memory::MemoryRepository>(std::chrono::milliseconds(config::LockTimeoutMs(config)));
  });
#if FMD_DB_SQLITE
  backends.Register("sqlite", &BuildSqlite);
#endif
#if FMD_DB_POSTGRES
  backends.Register("postgres", &BuildPostgres);
#endif
  return backends;
}

void EnsureSchemaVersion(db::Repository& repository) {
  auto tx      = repository.Begin();
  auto version = repository.GetMeta(*tx, db::sql::kSchemaVersionKey);

  if (!version.has_value()) {
    auto result = repository.SetMeta(*tx, db::sql::kSchemaVersionKey, db::sql::kSchemaVersion);
    if (!result) {
      throw util::Error(util::ErrorKind::Storage, "could not write schema version: " + result.message, "set_meta", db::sql::kSchemaVersionKey);
    }
    tx->Commit();
    FMD_LOG_INFO("db", "Database initialized", {StringField("version", db::sql::kSchemaVersion)});
    return;
  }

  tx->Commit();
  if (*version != db::sql::kSchemaVersion) {
    throw util::Error(util::ErrorKind::Config,
                      "database schema version " + *version + " does not match expected " + db::sql::kSchemaVersion,
                      "check_schema_version", db::sql::kSchemaVersionKey);
  }
  FMD_LOG_INFO("db", "Database up to date", {StringField("version", *version)});
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, const db::BackendRegistry& backends) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  const auto backend = config::DatabaseBackend(config);
  app.repository     = backends.Create(backend, config);
  EnsureSchemaVersion(*app.repository);
  FMD_LOG_INFO("db", "repository ready", {StringField("backend", backend)});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository                   = app.repository;
  ctx.options.max_devices_per_user = config::MaxDevicesPerUser(config);
  ctx.options.position_expiry_sec  = config::PositionExpirySec(config);

  app.devices   = std::make_shared<service::DeviceRegistry>(ctx);
  app.commands  = std::make_shared<service::CommandQueue>(ctx);
  app.positions = std::make_shared<service::PositionTracker>(ctx);

  // ------------------------------------------------------------------
  // Auth
  // ------------------------------------------------------------------
  auth::HawkOptions hawk_options;
  hawk_options.override_port = config.hawk().override_port();
  hawk_options.show_hash     = config.hawk().show_hash();

  app.nonces     = std::make_shared<auth::NonceStore>(app.repository);
  app.hawk       = std::make_shared<auth::HawkAuthenticator>(hawk_options);
  app.auth_guard = std::make_shared<auth::AuthGuard>(app.devices, *app.hawk);

  // ------------------------------------------------------------------
  // Background GC
  // ------------------------------------------------------------------
  app.gc_worker = std::make_shared<gc::GcWorker>(app.positions, app.nonces, std::chrono::seconds(config::GcIntervalSec(config)));

  return app;
}

Application Build(const RuntimeConfig& config) {
  return Build(config, DefaultBackends());
}

} // namespace fmd::factory
