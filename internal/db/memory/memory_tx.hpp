#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace fmd::db::memory {

/*
  Transaction = exclusive lock + snapshot

  The lock is taken in the constructor (bounded by the repository lock
  timeout) and released when the transaction ends.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                   repo_;
  std::unique_lock<std::timed_mutex>  lock_;
  MemoryRepository::State             working_;
  bool                                committed_ = false;
};

} // namespace fmd::db::memory
