#include "internal/auth/nonce_store.hpp"

#include <atomic>
#include <chrono>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using fmd::auth::NonceStore;

std::shared_ptr<fmd::db::memory::MemoryRepository> NewRepo() {
  return std::make_shared<fmd::db::memory::MemoryRepository>();
}

void InsertRaw(fmd::db::Repository& repo, const std::string& key, const std::string& val, int64_t created_at_ms) {
  fmd::db::model::NonceRecord record{key, val, created_at_ms};
  auto                        tx = repo.Begin();
  assert(repo.InsertNonce(*tx, record));
  tx->Commit();
}

void TestIssuedNonceVerifiesOnce() {
  NonceStore store(NewRepo());
  const auto nonce = store.Issue();

  assert(nonce.find('.') != std::string::npos);
  assert(store.VerifyAndConsume(nonce));
  assert(!store.VerifyAndConsume(nonce));
}

void TestNoncesAreIndependent() {
  NonceStore store(NewRepo());
  const auto a = store.Issue();
  const auto b = store.Issue();
  assert(a != b);

  assert(store.VerifyAndConsume(b));
  assert(store.VerifyAndConsume(a));
}

void TestSignatureIsMd5OfKeyDotVal() {
  assert(NonceStore::Signature("k", "v") == "1d3d07a38dc1f813ab80c01188b7afda");
}

void TestMalformedAndUnknownNoncesFail() {
  NonceStore store(NewRepo());
  assert(!store.VerifyAndConsume(""));
  assert(!store.VerifyAndConsume("no-dot-here"));
  assert(!store.VerifyAndConsume("unknown.1d3d07a38dc1f813ab80c01188b7afda"));
}

void TestTamperedChecksumConsumesRow() {
  auto       repo = NewRepo();
  NonceStore store(repo);
  InsertRaw(*repo, "k", "v", fmd::util::NowMillis());

  assert(!store.VerifyAndConsume("k.00000000000000000000000000000000"));
  // the bad attempt burned the row
  assert(!store.VerifyAndConsume("k." + NonceStore::Signature("k", "v")));
}

void TestExpiredNonceFails() {
  auto       repo = NewRepo();
  NonceStore store(repo);

  const int64_t six_minutes_ago = fmd::util::NowMillis() - 6 * 60 * 1000;
  InsertRaw(*repo, "old", "v", six_minutes_ago);
  InsertRaw(*repo, "fresh", "v", fmd::util::NowMillis() - 60 * 1000);

  assert(!store.VerifyAndConsume("old." + NonceStore::Signature("old", "v")));
  assert(store.VerifyAndConsume("fresh." + NonceStore::Signature("fresh", "v")));
}

void TestPurgeExpiredCountsRows() {
  auto       repo = NewRepo();
  NonceStore store(repo);

  const int64_t stale = fmd::util::NowMillis() - 10 * 60 * 1000;
  InsertRaw(*repo, "a", "v", stale);
  InsertRaw(*repo, "b", "v", stale);
  const auto live = store.Issue();

  assert(store.PurgeExpired() == 2);
  assert(store.PurgeExpired() == 0);
  assert(store.VerifyAndConsume(live));
}

void TestConcurrentConsumersOnlyOneWins() {
  NonceStore store(NewRepo());
  const auto nonce = store.Issue();

  std::atomic<int>         wins{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (store.VerifyAndConsume(nonce)) {
        wins.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(wins.load() == 1);
}

void TestBusyStoreTimesOutWithoutConsuming() {
  auto       repo = std::make_shared<fmd::db::memory::MemoryRepository>(std::chrono::milliseconds(20));
  NonceStore store(repo);
  const auto nonce = store.Issue();

  auto held     = repo->Begin();
  bool timedout = false;
  std::thread other([&] {
    try {
      store.VerifyAndConsume(nonce);
    } catch (const fmd::util::Error& e) {
      timedout = e.kind() == fmd::util::ErrorKind::Timeout;
    }
  });
  other.join();
  held->Rollback();

  assert(timedout);
  // the nonce is still there for the retry
  assert(store.VerifyAndConsume(nonce));
  assert(!store.VerifyAndConsume(nonce));
}

} // namespace

int main() {
  TestIssuedNonceVerifiesOnce();
  TestNoncesAreIndependent();
  TestSignatureIsMd5OfKeyDotVal();
  TestMalformedAndUnknownNoncesFail();
  TestTamperedChecksumConsumesRow();
  TestExpiredNonceFails();
  TestPurgeExpiredCountsRows();
  TestConcurrentConsumersOnlyOneWins();
  TestBusyStoreTimesOutWithoutConsuming();

  std::cout << "fmd_unit_nonce_store: pass\n";
  return 0;
}
