#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace creditgate::db::memory {

/*
  Transaction = snapshot + write set

  The repository mutex is held from Begin() until Commit()/Rollback(),
  so transactions from different threads are serialized and a CAS read
  inside one can never go stale before its write.
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
  MemoryRepository&                      repo_;
  std::unique_lock<std::recursive_mutex> lock_;
  MemoryRepository::State                working_;
  bool                                   committed_ = false;
  bool                                   finished_  = false;
};

} // namespace creditgate::db::memory
