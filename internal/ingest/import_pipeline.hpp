#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/batch_committer.hpp"
#include "internal/ingest/ingest_buffer.hpp"
#include "internal/ingest/record_parser.hpp"

namespace chessdb::runtime::config {
class RuntimeConfig;
}

namespace chessdb::ingest {

struct ImportOptions {
  ValidationLimits validation;
  BufferLimits     buffer;
  CommitterOptions commit;

  std::size_t max_queued_batches        = 1;
  uint32_t    progress_interval_batches = 10;

  // Stop reading once this many records were accepted.
  std::optional<uint64_t> max_games;

  static ImportOptions FromConfig(const chessdb::runtime::config::RuntimeConfig& config);
};

struct ImportProgress {
  uint64_t batches_committed = 0;
  uint64_t processed         = 0;
  uint64_t accepted          = 0;
  uint64_t rejected          = 0;
  uint64_t games_committed   = 0;
  uint64_t duplicates        = 0;
  uint64_t failed_batches    = 0;
};

struct FailedBatch {
  uint64_t                       seq = 0;
  std::string                    error;
  std::vector<model::GameRecord> records;
};

struct ImportSummary {
  std::string source;

  uint64_t processed         = 0;
  uint64_t accepted          = 0;
  uint64_t rejected          = 0;
  uint64_t parse_errors      = 0;
  uint64_t validation_errors = 0;

  uint64_t games_committed   = 0;
  uint64_t duplicates        = 0;
  uint64_t new_players       = 0;
  uint64_t new_openings      = 0;
  uint64_t name_conflicts    = 0;
  uint64_t batches_committed = 0;

  std::vector<FailedBatch> failed_batches;

  // buffered records dropped by cancellation
  uint64_t discarded_records = 0;
  bool     cancelled         = false;

  std::size_t peak_buffer_bytes = 0;

  int64_t started_ms  = 0;
  int64_t finished_ms = 0;

  // reject reason label -> count
  std::map<std::string, uint64_t> rejects_by_reason;
};

/*
  ImportPipeline

  Reader thread (caller):  parser -> buffer -> scheduler
  Commit worker thread:    scheduler -> committer -> store

  At most max_queued_batches wait behind the batch being committed, so
  memory stays bounded by the buffer ceiling times a small constant.

  Outcomes:
    - end of input: trailing batch drained and committed
    - Cancel(): reading stops, the partial buffer is discarded, queued
      batches still commit
    - store unavailable: reading stops, earlier batches stay committed,
      util::StoreUnavailable is rethrown from Import
*/
class ImportPipeline {
 public:
  using ProgressListener = std::function<void(const ImportProgress&)>;

  ImportPipeline(std::shared_ptr<db::Repository> repository, ImportOptions options, BatchCommitter::SleepFn sleep = {});

  void SetProgressListener(ProgressListener listener);

  // Throws util::InputUnreadable when the file cannot be read.
  ImportSummary ImportFile(const std::string& path);

  ImportSummary Import(std::istream& in, const std::string& source);

  // Safe from any thread or a signal watcher. Applies to the running
  // import, or to the next one when none is running; cleared once that
  // import returns.
  void Cancel();

  bool Cancelled() const {
    return cancelled_.load();
  }

 private:
  void OnOutcome(const BatchOutcome& outcome);
  void RecordRun(const ImportSummary& summary);

  std::shared_ptr<db::Repository> repository_;
  ImportOptions                   options_;
  BatchCommitter::SleepFn         sleep_;
  ProgressListener                listener_;

  std::atomic<bool> cancelled_{false};

  std::mutex     mutex_;
  ImportSummary  summary_;
  ImportProgress progress_;
};

} // namespace chessdb::ingest
