#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace fmd::service {
class PositionTracker;
}
namespace fmd::auth {
class NonceStore;
}

namespace fmd::gc {

/*
  Background worker that removes expired rows.

  Every interval:
      PositionTracker::GcDatabase()   positions past the expiry window
      NonceStore::PurgeExpired()      nonces older than five minutes

  Failures are logged and the next round runs as usual.
*/
class GcWorker {
 public:
  GcWorker(std::shared_ptr<service::PositionTracker> positions, std::shared_ptr<auth::NonceStore> nonces, std::chrono::seconds interval);
  ~GcWorker();

  void Start();
  void Stop();

  // One pass on the calling thread.
  void RunOnce();

 private:
  void Run();

  std::shared_ptr<service::PositionTracker> positions_;
  std::shared_ptr<auth::NonceStore>         nonces_;
  std::chrono::seconds                      interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace fmd::gc
