#include "internal/ingest/commit_scheduler.hpp"

#include <utility>

namespace chessdb::ingest {

CommitScheduler::CommitScheduler(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool CommitScheduler::Enqueue(Batch batch) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push(std::move(batch));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<Batch> CommitScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  Batch batch = std::move(queue_.front());
  queue_.pop();
  lock.unlock();
  not_full_.notify_one();
  return batch;
}

void CommitScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t CommitScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace chessdb::ingest
