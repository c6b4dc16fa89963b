#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace pricing::db::memory {

/*
  Transaction = snapshot + write set

  Mutable() marks the transaction dirty. Committing a dirty transaction
  whose snapshot is older than the committed state throws; a clean
  (read-only) transaction always commits.
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
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    dirty_            = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
};

} // namespace pricing::db::memory
