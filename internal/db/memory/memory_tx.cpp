#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace tams::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), serial_(repo.tx_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (!serial_.owns_lock()) {
    throw util::StorageFailure("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  serial_.unlock();
}

void MemoryTransaction::Rollback() {
  if (serial_.owns_lock()) serial_.unlock();
}

} // namespace tams::db::memory
