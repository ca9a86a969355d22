#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace supervisor::db::memory {

/*
  Transaction = exclusive repository lock + undo journal.

  Writes go straight to the shared state while the lock is held;
  Rollback() replays the journal backwards.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

  void OnRollback(std::function<void()> undo);

 private:
  void EnsureOpen() const;

  MemoryRepository&                  repo_;
  std::unique_lock<std::mutex>       lock_;
  std::vector<std::function<void()>> undo_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace supervisor::db::memory
