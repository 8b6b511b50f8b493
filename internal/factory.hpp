#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/auth/auth_guard.hpp"
#include "internal/auth/hawk.hpp"
#include "internal/auth/nonce_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/backend_registry.hpp"
#include "internal/gc/gc_worker.hpp"
#include "internal/service/command_queue.hpp"
#include "internal/service/device_registry.hpp"
#include "internal/service/position_tracker.hpp"

namespace fmd::factory {

/*
  Application

  Owns all long-lived objects used by the server and the CLI.
  The GC worker is built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::DeviceRegistry>  devices;
  std::shared_ptr<service::CommandQueue>    commands;
  std::shared_ptr<service::PositionTracker> positions;

  std::shared_ptr<auth::NonceStore>        nonces;
  std::shared_ptr<auth::HawkAuthenticator> hawk;
  std::shared_ptr<auth::AuthGuard>         auth_guard;

  std::shared_ptr<gc::GcWorker> gc_worker;
};

// memory, plus sqlite / postgres when compiled in. Each constructor
// creates any missing tables before returning the repository.
db::BackendRegistry DefaultBackends();

// Writes meta['db.ver'] on a fresh store; throws util::Error(Config)
// when the store carries a different version.
void EnsureSchemaVersion(db::Repository& repository);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const fmd::runtime::config::RuntimeConfig& config, const db::BackendRegistry& backends);
Application Build(const fmd::runtime::config::RuntimeConfig& config);

}
