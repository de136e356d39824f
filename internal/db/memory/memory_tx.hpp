#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace jobclaim::db::memory {

/*
  Transaction = exclusive lock + snapshot copy.

  The lock is held until Commit()/Rollback() so the snapshot cannot go
  stale, like BEGIN IMMEDIATE on SQLite.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

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
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace jobclaim::db::memory
