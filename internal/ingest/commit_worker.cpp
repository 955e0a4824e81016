#include "internal/ingest/commit_worker.hpp"

#include "internal/observability/logging.hpp"

namespace chessdb::ingest {

CommitWorker::CommitWorker(std::shared_ptr<CommitScheduler> scheduler, std::shared_ptr<BatchCommitter> committer, OutcomeCallback on_outcome)
    : scheduler_(std::move(scheduler)), committer_(std::move(committer)), on_outcome_(std::move(on_outcome)) {}

CommitWorker::~CommitWorker() {
  Stop();
}

void CommitWorker::Start() {
  thread_ = std::thread(&CommitWorker::Run, this);
}

void CommitWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

bool CommitWorker::Failed() const {
  std::lock_guard lock(failure_mutex_);
  return failure_ != nullptr;
}

std::exception_ptr CommitWorker::Failure() const {
  std::lock_guard lock(failure_mutex_);
  return failure_;
}

void CommitWorker::Run() {
  while (auto batch = scheduler_->Dequeue()) {
    try {
      auto outcome = committer_->Commit(*batch);
      if (on_outcome_) on_outcome_(outcome);
    } catch (const std::exception& e) {
      CHESSDB_LOG_ERROR("Commit worker stopped", {chessdb::observability::UIntField("batch", batch->seq),
                                                  chessdb::observability::StringField("error", e.what())});
      {
        std::lock_guard lock(failure_mutex_);
        failure_ = std::current_exception();
      }
      scheduler_->Shutdown();
      break;
    }
  }
}

} // namespace chessdb::ingest
