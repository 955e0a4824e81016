#include "memory_tx.hpp"

#include "internal/db/api/result.hpp"

namespace chessdb::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryState& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw DbError(ErrorCode::Unsupported, "write attempted in read-only transaction");
  }
  if (committed_ || rolled_back_) {
    throw DbError(ErrorCode::InternalError, "transaction already finished");
  }
  if (!working_) {
    working_ = std::make_shared<MemoryState>(*snapshot_); // copy on first write
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw DbError(ErrorCode::Conflict, "transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace chessdb::db::memory
