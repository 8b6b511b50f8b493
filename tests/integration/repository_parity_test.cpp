#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using fmd::db::Repository;
using fmd::db::model::DeviceRecord;
using fmd::db::model::NonceRecord;
using fmd::db::model::PendingCommandRecord;
using fmd::db::model::PositionRecord;
using fmd::db::model::UserDeviceRecord;
using fmd::runtime::config::RuntimeConfig;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

std::shared_ptr<Repository> Create(const RuntimeConfig& config) {
  auto repo = fmd::factory::DefaultBackends().Create(config.database().backend(), config);
  fmd::factory::EnsureSchemaVersion(*repo);
  return repo;
}

void VerifyDeviceLifecycle(Repository& repo, const std::string& prefix) {
  const std::string dev  = prefix + "-dev";
  const std::string user = prefix + "-user";

  {
    auto tx = repo.Begin();
    assert(repo.InsertDevice(*tx, DeviceRecord{.id = dev, .lockable = true, .last_exchange_ms = 10, .hawk_secret = "s3cr3t", .accepts = "lock"}));
    assert(repo.InsertUserDevice(*tx, UserDeviceRecord{.user_id = user, .device_id = dev, .name = "Phone", .created_at_ms = 10}));

    // inserts are visible inside the same transaction
    auto info = repo.GetDeviceInfo(*tx, dev);
    assert(info.has_value());
    assert(info->user_id == user);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.InsertDevice(*tx, DeviceRecord{.id = dev, .hawk_secret = "x"}));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.InsertUserDevice(*tx, UserDeviceRecord{.user_id = user + "-other", .device_id = dev, .created_at_ms = 11}));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.UpdateDevice(*tx, DeviceRecord{.id = dev, .last_exchange_ms = 20, .hawk_secret = "n3w", .push_url = "https://push", .accepts = "ring"}).rows == 1);
    assert(repo.SetAccessToken(*tx, dev, "tok", 30).rows == 1);
    assert(repo.SetAccessToken(*tx, prefix + "-missing", "tok", 30).rows == 0);
    assert(repo.SetDeviceLock(*tx, dev, true, 40).rows == 1);
    assert(repo.TouchDevice(*tx, dev, 50).rows == 1);
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto info = repo.GetDeviceInfo(*tx, dev);
    assert(info.has_value());
    assert(info->name == "Phone");
    assert(info->device.lockable);
    assert(info->device.hawk_secret == "n3w");
    assert(info->device.push_url == "https://push");
    assert(info->device.accepts == "ring");
    assert(info->device.access_token == "tok");
    assert(info->device.last_exchange_ms == 50);

    assert(repo.FindUserDevice(*tx, user, dev).has_value());
    assert(!repo.FindUserDevice(*tx, user + "-other", dev).has_value());
    assert(repo.GetUserForDevice(*tx, dev)->user_id == user);
    assert(!repo.GetDeviceInfo(*tx, prefix + "-missing").has_value());
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteUserDevices(*tx, dev).rows == 1);
    assert(repo.DeleteDevice(*tx, dev).rows == 1);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetDeviceInfo(*tx, dev).has_value());
  assert(!repo.GetUserForDevice(*tx, dev).has_value());
  tx->Commit();
}

void VerifyListAndRekey(Repository& repo, const std::string& prefix) {
  const std::string old_user = prefix + "-old";
  const std::string new_user = prefix + "-new";

  {
    auto tx = repo.Begin();
    for (int i = 1; i <= 3; ++i) {
      const auto id = prefix + "-dev" + std::to_string(i);
      assert(repo.InsertDevice(*tx, DeviceRecord{.id = id, .hawk_secret = "s"}));
      assert(repo.InsertUserDevice(*tx, UserDeviceRecord{.user_id = old_user, .device_id = id, .created_at_ms = 100 + i}));
    }
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto list = repo.ListDevicesForUser(*tx, old_user, 2);
    assert(list.size() == 2);
    assert(list[0].device_id == prefix + "-dev3");
    assert(list[1].device_id == prefix + "-dev2");

    assert(repo.RekeyUser(*tx, old_user, new_user).rows == 3);
    assert(repo.ListDevicesForUser(*tx, old_user, 10).empty());
    assert(repo.ListDevicesForUser(*tx, new_user, 10).size() == 3);
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.RekeyUser(*tx, old_user, new_user).rows == 0);
  assert(repo.GetUserForDevice(*tx, prefix + "-dev1")->user_id == new_user);
  tx->Commit();
}

void VerifyCommandQueue(Repository& repo, const std::string& prefix) {
  const std::string dev = prefix + "-dev";

  {
    auto tx = repo.Begin();
    assert(repo.UpsertCommand(*tx, PendingCommandRecord{.device_id = dev, .type = "ring", .cmd = "ring 5", .created_at_ms = 200}));
    assert(repo.UpsertCommand(*tx, PendingCommandRecord{.device_id = dev, .type = "lock", .cmd = "lock", .created_at_ms = 100}));
    assert(repo.UpsertCommand(*tx, PendingCommandRecord{.device_id = dev, .type = "ring", .cmd = "ring 10", .created_at_ms = 300}));
    assert(repo.UpsertCommand(*tx, PendingCommandRecord{.device_id = prefix + "-other", .type = "lock", .cmd = "x", .created_at_ms = 1}));
    tx->Commit();
  }

  {
    auto tx       = repo.Begin();
    auto commands = repo.ListCommands(*tx, dev);
    assert(commands.size() == 2);
    assert(commands[0].type == "lock");
    assert(commands[1].cmd == "ring 10");

    auto first = repo.PopOldestCommand(*tx, dev);
    assert(first.has_value());
    assert(first->type == "lock");
    assert(first->created_at_ms == 100);
    tx->Commit();
  }

  {
    // a rolled back pop leaves the command queued
    auto tx = repo.Begin();
    assert(repo.PopOldestCommand(*tx, dev)->cmd == "ring 10");
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.PopOldestCommand(*tx, dev)->cmd == "ring 10");
    assert(!repo.PopOldestCommand(*tx, dev).has_value());
    assert(repo.PurgeCommands(*tx, prefix + "-other").rows == 1);
    tx->Commit();
  }
}

void VerifyPositions(Repository& repo, const std::string& prefix) {
  const std::string dev    = prefix + "-dev";
  const int64_t     now_ms = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.InsertPosition(*tx, PositionRecord{.device_id = dev, .time_ms = now_ms - 1000, .latitude = 1.5f, .longitude = 2.5f}));
    assert(repo.InsertPosition(*tx, PositionRecord{.device_id = dev, .time_ms = now_ms, .latitude = 3.5f, .longitude = 4.5f, .altitude = 5.5f, .accuracy = 6.5f}));
    assert(repo.InsertPosition(*tx, PositionRecord{.device_id = prefix + "-stale", .time_ms = 1000}));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto latest = repo.ListPositions(*tx, dev, 1);
    assert(latest.size() == 1);
    assert(latest[0].time_ms == now_ms);
    assert(latest[0].latitude == 3.5f);
    assert(latest[0].longitude == 4.5f);
    assert(latest[0].altitude == 5.5f);
    assert(latest[0].accuracy == 6.5f);
    assert(repo.ListPositions(*tx, dev, 10).size() == 2);

    assert(repo.DeletePositionsOlderThan(*tx, 2000).rows >= 1);
    assert(repo.ListPositions(*tx, prefix + "-stale", 10).empty());
    assert(repo.ListPositions(*tx, dev, 10).size() == 2);

    assert(repo.PurgePositions(*tx, dev).rows == 2);
    assert(repo.ListPositions(*tx, dev, 10).empty());
    tx->Commit();
  }
}

void VerifyNonces(Repository& repo, const std::string& prefix) {
  const int64_t now_ms = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertNonce(*tx, NonceRecord{.key = prefix + "-fresh", .val = "v1", .created_at_ms = now_ms}));
    assert(repo.InsertNonce(*tx, NonceRecord{.key = prefix + "-stale", .val = "v2", .created_at_ms = 1000}));
    assert(!repo.InsertNonce(*tx, NonceRecord{.key = prefix + "-fresh", .val = "dup", .created_at_ms = now_ms}));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertNonce(*tx, NonceRecord{.key = prefix + "-fresh", .val = "v1", .created_at_ms = now_ms}));
    assert(repo.InsertNonce(*tx, NonceRecord{.key = prefix + "-stale", .val = "v2", .created_at_ms = 1000}));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.DeleteNoncesOlderThan(*tx, 2000).rows >= 1);
  assert(!repo.TakeNonce(*tx, prefix + "-stale").has_value());

  auto val = repo.TakeNonce(*tx, prefix + "-fresh");
  assert(val.has_value());
  assert(*val == "v1");
  assert(!repo.TakeNonce(*tx, prefix + "-fresh").has_value());
  tx->Commit();
}

void VerifyMeta(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.GetMeta(*tx, "db.ver").has_value());
  assert(!repo.GetMeta(*tx, "parity.missing").has_value());
  assert(repo.SetMeta(*tx, "parity.key", "a"));
  assert(repo.SetMeta(*tx, "parity.key", "b"));
  assert(*repo.GetMeta(*tx, "parity.key") == "b");
  tx->Commit();
}

void VerifyConcurrentTake(Repository& repo, const std::string& prefix) {
  const std::string key = prefix + "-race";
  {
    auto tx = repo.Begin();
    assert(repo.InsertNonce(*tx, NonceRecord{.key = key, .val = "v", .created_at_ms = NowMs()}));
    tx->Commit();
  }

  std::atomic<int>         taken{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      auto tx  = repo.Begin();
      auto val = repo.TakeNonce(*tx, key);
      tx->Commit();
      if (val.has_value()) taken.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  assert(taken.load() == 1);
}

void VerifyTransactionExclusion(Repository& repo, bool supports_parallel_transactions) {
  if (supports_parallel_transactions) {
    return;
  }

  auto held = repo.Begin();

  bool timed_out = false;
  std::thread other([&] {
    try {
      auto tx = repo.Begin();
      tx->Rollback();
    } catch (const fmd::util::Error& e) {
      timed_out = e.kind() == fmd::util::ErrorKind::Timeout;
    }
  });
  other.join();
  held->Rollback();

  assert(timed_out);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertDevice(*tx, DeviceRecord{.id = prefix + "-dev", .hawk_secret = "s3cr3t"}));
    assert(repo->InsertUserDevice(*tx, UserDeviceRecord{.user_id = prefix + "-user", .device_id = prefix + "-dev", .created_at_ms = NowMs()}));
    assert(repo->UpsertCommand(*tx, PendingCommandRecord{.device_id = prefix + "-dev", .type = "lock", .cmd = "lock", .created_at_ms = NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto info = repo->GetDeviceInfo(*tx, prefix + "-dev");
  assert(info.has_value());
  assert(info->device.hawk_secret == "s3cr3t");
  assert(info->user_id == prefix + "-user");
  assert(repo->PopOldestCommand(*tx, prefix + "-dev")->cmd == "lock");
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  RuntimeConfig config;
  config.mutable_database()->set_backend("memory");
  config.mutable_database()->set_lock_timeout_ms(200);

  return BackendFactory{
      .name                           = "memory",
      .make_repository                = [config]() { return Create(config); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}

#if FMD_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("fmd_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->set_backend("sqlite");
  config.mutable_database()->set_lock_timeout_ms(200);
  config.mutable_database()->mutable_sqlite()->set_path(db_path);

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = [config]() { return Create(config); },
      .supports_restart               = []() { return true; },
      .restart                        = [config](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = Create(config);
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if FMD_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FMD_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FMD_TEST_PG_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->set_backend("postgres");
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = [config]() { return Create(config); },
      .supports_restart               = []() { return true; },
      .restart                        = [config](std::shared_ptr<Repository>& repo) { repo = Create(config); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyDeviceLifecycle(*repo, run + "-life");
  VerifyListAndRekey(*repo, run + "-list");
  VerifyCommandQueue(*repo, run + "-cmd");
  VerifyPositions(*repo, run + "-pos");
  VerifyNonces(*repo, run + "-nonce");
  VerifyMeta(*repo);
  VerifyConcurrentTake(*repo, run + "-take");
  VerifyTransactionExclusion(*repo, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FMD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FMD_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "fmd_integration_repository_parity: pass\n";
  return 0;
}
