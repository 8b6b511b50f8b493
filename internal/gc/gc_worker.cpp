#include "gc_worker.hpp"

#include "internal/auth/nonce_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/position_tracker.hpp"

namespace fmd::gc {

using observability::StringField;

GcWorker::GcWorker(std::shared_ptr<service::PositionTracker> positions, std::shared_ptr<auth::NonceStore> nonces,
                   std::chrono::seconds interval)
    : positions_(std::move(positions)),
      nonces_(std::move(nonces)),
      interval_(interval) {}

GcWorker::~GcWorker() {
  Stop();
}

void GcWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&GcWorker::Run, this);
}

void GcWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void GcWorker::RunOnce() {
  try {
    positions_->GcDatabase();
  } catch (const std::exception& e) {
    FMD_LOG_ERROR("gc", "position gc failed", {StringField("error", e.what())});
  }

  try {
    nonces_->PurgeExpired();
  } catch (const std::exception& e) {
    FMD_LOG_ERROR("gc", "nonce purge failed", {StringField("error", e.what())});
  }
}

void GcWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    RunOnce();
    lock.lock();
  }
}

} // namespace fmd::gc
