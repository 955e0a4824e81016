#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace chessdb::db::memory {

/*
  Transaction = pinned snapshot + lazily copied write set.

  Readers never copy. A writer copies the snapshot on its first mutation
  and swaps it in on Commit(); commit fails with Conflict when another
  writer committed since the snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  MemoryState& Mutable();
  const MemoryState& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                  repo_;
  std::shared_ptr<const MemoryState> snapshot_;
  std::shared_ptr<MemoryState>       working_;
  uint64_t                           snapshot_version_ = 0;
  bool                               read_only_        = false;
  bool                               committed_        = false;
  bool                               rolled_back_      = false;
};

} // namespace chessdb::db::memory
