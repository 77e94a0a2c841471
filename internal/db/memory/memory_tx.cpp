#include "memory_tx.hpp"

#include <stdexcept>

namespace creditgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace creditgate::db::memory
