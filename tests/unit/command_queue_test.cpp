#include "internal/service/command_queue.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/device_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using fmd::service::CommandQueue;
using fmd::service::DeviceRegistry;
using fmd::service::ServiceContext;

ServiceContext NewContext() {
  ServiceContext ctx;
  ctx.repository = std::make_shared<fmd::db::memory::MemoryRepository>();
  return ctx;
}

void RegisterDevice(const ServiceContext& ctx, const std::string& id) {
  fmd::model::Device d;
  d.id = id;
  DeviceRegistry(ctx).Register("user-1", d);
}

void TestEmptyQueue() {
  CommandQueue queue(NewContext());
  assert(!queue.GetPending("dev-1").has_value());
}

void TestStoreThenPopOnce() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "{\"op\":\"lock\"}", "lock");

  auto cmd = queue.GetPending("dev-1");
  assert(cmd.has_value());
  assert(cmd->cmd == "{\"op\":\"lock\"}");
  assert(cmd->type == "lock");
  assert(!queue.GetPending("dev-1").has_value());
}

void TestSameTypeReplaces() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "ring 5", "ring");
  queue.StoreCommand("dev-1", "ring 10", "ring");

  auto cmd = queue.GetPending("dev-1");
  assert(cmd.has_value());
  assert(cmd->cmd == "ring 10");
  assert(!queue.GetPending("dev-1").has_value());
}

void TestOldestFirstAcrossTypes() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "lock", "lock");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  queue.StoreCommand("dev-1", "ring", "ring");
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  queue.StoreCommand("dev-1", "locate", "locate");

  assert(queue.GetPending("dev-1")->type == "lock");
  assert(queue.GetPending("dev-1")->type == "ring");
  assert(queue.GetPending("dev-1")->type == "locate");
  assert(!queue.GetPending("dev-1").has_value());
}

void TestQueuesArePerDevice() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "lock", "lock");
  queue.StoreCommand("dev-2", "ring", "ring");

  assert(queue.GetPending("dev-2")->cmd == "ring");
  assert(queue.GetPending("dev-1")->cmd == "lock");
}

void TestPurge() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "lock", "lock");
  queue.StoreCommand("dev-1", "ring", "ring");
  queue.StoreCommand("dev-2", "ring", "ring");

  queue.PurgeCommands("dev-1");
  assert(!queue.GetPending("dev-1").has_value());
  assert(queue.GetPending("dev-2").has_value());
}

void TestPendingTouchesDevice() {
  auto ctx = NewContext();
  RegisterDevice(ctx, "dev-1");
  DeviceRegistry registry(ctx);
  CommandQueue   queue(ctx);

  const auto before = registry.GetDeviceInfo("dev-1").last_exchange_ms;
  std::this_thread::sleep_for(std::chrono::milliseconds(5));

  // polling an empty queue still counts as contact
  assert(!queue.GetPending("dev-1").has_value());
  assert(registry.GetDeviceInfo("dev-1").last_exchange_ms > before);
}

void TestConcurrentPollersSeeEachCommandOnce() {
  CommandQueue queue(NewContext());
  queue.StoreCommand("dev-1", "lock", "lock");
  queue.StoreCommand("dev-1", "ring", "ring");
  queue.StoreCommand("dev-1", "locate", "locate");

  std::atomic<int>         delivered{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (queue.GetPending("dev-1").has_value()) {
        delivered.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(delivered.load() == 3);
}

void TestBusyStoreKeepsCommand() {
  auto           repo = std::make_shared<fmd::db::memory::MemoryRepository>(std::chrono::milliseconds(20));
  ServiceContext ctx;
  ctx.repository = repo;
  CommandQueue queue(ctx);
  queue.StoreCommand("dev-1", "locate", "locate");

  auto held     = repo->Begin();
  bool timedout = false;
  std::thread other([&] {
    try {
      queue.GetPending("dev-1");
    } catch (const fmd::util::Error& e) {
      timedout = e.kind() == fmd::util::ErrorKind::Timeout;
    }
  });
  other.join();
  held->Rollback();

  assert(timedout);
  auto cmd = queue.GetPending("dev-1");
  assert(cmd.has_value());
  assert(cmd->cmd == "locate");
  assert(!queue.GetPending("dev-1").has_value());
}

} // namespace

int main() {
  TestEmptyQueue();
  TestStoreThenPopOnce();
  TestSameTypeReplaces();
  TestOldestFirstAcrossTypes();
  TestQueuesArePerDevice();
  TestPurge();
  TestPendingTouchesDevice();
  TestConcurrentPollersSeeEachCommandOnce();
  TestBusyStoreKeepsCommand();

  std::cout << "fmd_unit_command_queue: pass\n";
  return 0;
}
