#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace datamarket::db::memory {

/*
  Transaction = writer lock + snapshot + write set

  The writer lock plays the role of sqlite's BEGIN IMMEDIATE: a second
  Begin() waits up to the repository busy timeout, then throws.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                  repo_;
  std::unique_lock<std::timed_mutex> writer_;
  MemoryRepository::State            working_;
  bool                               committed_   = false;
  bool                               rolled_back_ = false;
};

} // namespace datamarket::db::memory
