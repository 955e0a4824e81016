#include "internal/ingest/import_pipeline.hpp"

#include <filesystem>
#include <fstream>
#include <utility>
#include <variant>

#include "config/config.pb.h"
#include "internal/ingest/commit_scheduler.hpp"
#include "internal/ingest/commit_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chessdb::ingest {

using chessdb::observability::BoolField;
using chessdb::observability::StringField;
using chessdb::observability::UIntField;

ImportOptions ImportOptions::FromConfig(const chessdb::runtime::config::RuntimeConfig& config) {
  ImportOptions options;
  options.buffer.max_records        = config.ingest().max_batch_records();
  options.buffer.max_bytes          = config.ingest().max_batch_bytes();
  options.validation                = ValidationLimits::FromConfig(config.validation(), options.buffer.max_bytes);
  options.commit                    = CommitterOptions::FromConfig(config.commit());
  options.max_queued_batches        = config.ingest().max_queued_batches();
  options.progress_interval_batches = config.ingest().progress_interval_batches();
  return options;
}

ImportPipeline::ImportPipeline(std::shared_ptr<db::Repository> repository, ImportOptions options, BatchCommitter::SleepFn sleep)
    : repository_(std::move(repository)), options_(std::move(options)), sleep_(std::move(sleep)) {
  if (options_.validation.max_record_bytes == 0 || options_.validation.max_record_bytes > options_.buffer.max_bytes) {
    options_.validation.max_record_bytes = options_.buffer.max_bytes;
  }
}

void ImportPipeline::SetProgressListener(ProgressListener listener) {
  listener_ = std::move(listener);
}

void ImportPipeline::Cancel() {
  cancelled_.store(true);
}

ImportSummary ImportPipeline::ImportFile(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw util::InputUnreadable("input is a directory: " + path);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InputUnreadable("cannot open input: " + path);
  }
  return Import(in, path);
}

void ImportPipeline::OnOutcome(const BatchOutcome& outcome) {
  std::optional<ImportProgress> report;
  {
    std::lock_guard lock(mutex_);
    if (outcome.committed) {
      ++summary_.batches_committed;
      summary_.games_committed += outcome.games_committed;
      summary_.duplicates += outcome.duplicates_skipped;
      summary_.new_players += outcome.new_players;
      summary_.new_openings += outcome.new_openings;
      summary_.name_conflicts += outcome.name_conflicts;
    } else {
      summary_.failed_batches.push_back(FailedBatch{outcome.batch_seq, outcome.error, outcome.failed_records});
    }

    progress_.batches_committed = summary_.batches_committed;
    progress_.games_committed   = summary_.games_committed;
    progress_.duplicates        = summary_.duplicates;
    progress_.failed_batches    = summary_.failed_batches.size();

    const auto interval = options_.progress_interval_batches;
    if (outcome.committed && interval > 0 && summary_.batches_committed % interval == 0) {
      report = progress_;
    }
  }

  if (!report) return;

  CHESSDB_LOG_INFO("Import progress", {UIntField("batches", report->batches_committed), UIntField("processed", report->processed),
                                       UIntField("accepted", report->accepted), UIntField("rejected", report->rejected),
                                       UIntField("committed", report->games_committed), UIntField("duplicates", report->duplicates),
                                       UIntField("failed_batches", report->failed_batches)});
  if (listener_) listener_(*report);
}

ImportSummary ImportPipeline::Import(std::istream& in, const std::string& source) {
  {
    std::lock_guard lock(mutex_);
    summary_            = ImportSummary{};
    summary_.source     = source;
    summary_.started_ms = util::NowMillis();
    progress_           = ImportProgress{};
  }

  CHESSDB_LOG_INFO("Import started", {StringField("source", source)});

  auto scheduler = std::make_shared<CommitScheduler>(options_.max_queued_batches);
  auto committer = std::make_shared<BatchCommitter>(repository_, options_.commit, sleep_);
  CommitWorker worker(scheduler, committer, [this](const BatchOutcome& outcome) { OnOutcome(outcome); });
  worker.Start();

  RecordParser parser(in, options_.validation);

  auto publish_counters = [&] {
    const auto& c = parser.Counters();
    std::lock_guard lock(mutex_);
    progress_.processed = c.total;
    progress_.accepted  = c.accepted;
    progress_.rejected  = c.rejected;
  };

  IngestBuffer buffer(options_.buffer, [&](Batch&& batch) {
    publish_counters();
    const auto seq = batch.seq;
    if (!scheduler->Enqueue(std::move(batch))) {
      CHESSDB_LOG_WARN("Commit queue closed, batch dropped", {UIntField("batch", seq)});
    }
  });

  std::map<std::string, uint64_t> rejects;
  uint64_t                         unbufferable = 0;

  while (!cancelled_.load() && !worker.Failed()) {
    if (options_.max_games && parser.Counters().accepted >= *options_.max_games) break;

    auto outcome = parser.Next();
    if (!outcome) break;

    if (auto* rejection = std::get_if<model::Rejection>(&*outcome)) {
      ++rejects[chessdb::v1::RejectReasonLabel(rejection->reason)];
      continue;
    }

    auto& record = std::get<model::GameRecord>(*outcome);
    if (!buffer.Push(std::move(record))) {
      ++unbufferable;
    }
  }

  const bool input_failed = parser.InputFailed();
  const bool cancelled    = cancelled_.load();

  std::size_t discarded = 0;
  if (cancelled || input_failed || worker.Failed()) {
    discarded = buffer.Discard();
  } else {
    buffer.Drain();
  }

  worker.Stop();

  // the next Import starts uncancelled
  cancelled_.store(false);

  if (auto failure = worker.Failure()) {
    std::rethrow_exception(failure);
  }
  if (input_failed) {
    throw util::InputUnreadable("read error in input: " + source);
  }

  ImportSummary summary;
  {
    std::lock_guard lock(mutex_);
    summary_.finished_ms = util::NowMillis();
    summary              = summary_;
  }

  const auto& counters      = parser.Counters();
  summary.processed         = counters.total;
  summary.accepted          = counters.accepted;
  summary.rejected          = counters.rejected;
  summary.parse_errors      = counters.parse_errors;
  summary.validation_errors = counters.validation_errors;
  summary.rejects_by_reason = std::move(rejects);
  summary.discarded_records = discarded + unbufferable;
  summary.cancelled         = cancelled;
  summary.peak_buffer_bytes = buffer.PeakBytes();

  RecordRun(summary);

  CHESSDB_LOG_INFO("Import finished",
                   {StringField("source", source), UIntField("processed", summary.processed), UIntField("accepted", summary.accepted),
                    UIntField("rejected", summary.rejected), UIntField("committed", summary.games_committed),
                    UIntField("duplicates", summary.duplicates), UIntField("failed_batches", summary.failed_batches.size()),
                    UIntField("discarded", summary.discarded_records), BoolField("cancelled", summary.cancelled),
                    UIntField("peak_buffer_bytes", summary.peak_buffer_bytes)});
  return summary;
}

void ImportPipeline::RecordRun(const ImportSummary& summary) {
  db::model::ImportRunRecord run;
  run.source             = summary.source;
  run.started_ms         = summary.started_ms;
  run.finished_ms        = summary.finished_ms;
  run.records_processed  = summary.processed;
  run.records_accepted   = summary.accepted;
  run.records_rejected   = summary.rejected;
  run.games_committed    = summary.games_committed;
  run.duplicates_skipped = summary.duplicates;
  run.failed_batches     = summary.failed_batches.size();
  run.cancelled          = summary.cancelled;

  try {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->RecordImportRun(*tx, run), "record import run");
    tx->Commit();
  } catch (const db::DbError& e) {
    if (db::IsUnavailable(e.code())) {
      throw util::StoreUnavailable(std::string("cannot record import run: ") + e.what());
    }
    throw;
  }
}

} // namespace chessdb::ingest
