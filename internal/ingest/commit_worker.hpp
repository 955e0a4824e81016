#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/ingest/batch_committer.hpp"
#include "internal/ingest/commit_scheduler.hpp"

namespace chessdb::ingest {

/*
  Background worker that commits batches in enqueue order.

  A committer exception (store unavailable) stops the worker: the
  scheduler is shut down so the reader stops producing, and the
  exception is kept for the caller to rethrow.
*/
class CommitWorker {
 public:
  using OutcomeCallback = std::function<void(const BatchOutcome&)>;

  CommitWorker(std::shared_ptr<CommitScheduler> scheduler, std::shared_ptr<BatchCommitter> committer, OutcomeCallback on_outcome);
  ~CommitWorker();

  void Start();

  // Shuts the scheduler down, commits what is still queued, joins.
  void Stop();

  bool Failed() const;

  std::exception_ptr Failure() const;

 private:
  void Run();

  std::shared_ptr<CommitScheduler> scheduler_;
  std::shared_ptr<BatchCommitter>  committer_;
  OutcomeCallback                  on_outcome_;

  std::thread        thread_;
  mutable std::mutex failure_mutex_;
  std::exception_ptr failure_;
};

} // namespace chessdb::ingest
