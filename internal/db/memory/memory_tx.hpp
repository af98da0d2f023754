#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tams::db::memory {

/*
  Transaction = snapshot + write set

  Transactions are serialized for their whole lifetime, mirroring the
  SQLite backend's BEGIN IMMEDIATE: no two transactions interleave, so
  commits never conflict. Never open a second transaction on the same
  repository from a thread that already holds one.
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
  std::unique_lock<std::mutex> serial_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
};

} // namespace tams::db::memory
