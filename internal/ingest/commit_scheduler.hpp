#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/ingest/batch.hpp"

namespace chessdb::ingest {

/*
  Thread-safe bounded queue between the reader and the commit worker.

  Enqueue blocks while capacity batches are pending, which keeps the
  reader at most that many batches ahead of the store. After Shutdown
  Enqueue refuses new batches while Dequeue still drains what is queued.
*/
class CommitScheduler {
 public:
  explicit CommitScheduler(std::size_t capacity = 1);

  // false once shut down; the batch is not queued.
  bool Enqueue(Batch batch);

  // blocking wait; nullopt when shut down and empty
  std::optional<Batch> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::queue<Batch>       queue_;
  bool                    shutdown_ = false;
};

} // namespace chessdb::ingest
