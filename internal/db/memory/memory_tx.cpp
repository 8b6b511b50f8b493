#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fmd::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_, std::defer_lock) {
  if (!lock_.try_lock_for(repo_.lock_timeout_)) {
    throw util::Error(util::ErrorKind::Timeout, "memory repository lock not acquired within timeout", "begin");
  }
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() = default;

void MemoryTransaction::Commit() {
  if (!lock_.owns_lock()) {
    throw std::logic_error("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace fmd::db::memory
