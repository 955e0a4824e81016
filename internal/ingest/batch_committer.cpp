#include "internal/ingest/batch_committer.hpp"

#include <algorithm>
#include <thread>
#include <unordered_set>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chessdb::ingest {

using chessdb::observability::IntField;
using chessdb::observability::StringField;
using chessdb::observability::UIntField;

CommitterOptions CommitterOptions::FromConfig(const chessdb::runtime::config::CommitConfig& config) {
  CommitterOptions options;
  options.max_retries        = config.max_retries();
  options.initial_backoff    = util::FromProto(config.initial_backoff());
  options.max_backoff        = util::FromProto(config.max_backoff());
  options.backoff_multiplier = config.backoff_multiplier();
  return options;
}

BatchCommitter::BatchCommitter(std::shared_ptr<db::Repository> repository, CommitterOptions options, SleepFn sleep, EntityResolver resolver)
    : repository_(std::move(repository)), options_(options), sleep_(std::move(sleep)), resolver_(std::move(resolver)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

BatchOutcome BatchCommitter::Attempt(const Batch& batch) {
  BatchOutcome outcome;
  outcome.batch_seq = batch.seq;

  auto tx = repository_->Begin();

  std::vector<const model::GameRecord*> fresh;
  std::unordered_set<std::string>       seen;
  fresh.reserve(batch.records.size());
  for (const auto& record : batch.records) {
    if (!seen.insert(record.game_key).second || repository_->GameExists(*tx, record.game_key)) {
      ++outcome.duplicates_skipped;
      continue;
    }
    fresh.push_back(&record);
  }

  auto resolved = resolver_.Resolve(*repository_, *tx, fresh);

  for (const auto& player : resolved.players) {
    db::ThrowIfDbError(repository_->UpsertPlayer(*tx, player), "upsert player " + player.name_key);
  }
  for (const auto& delta : resolved.openings) {
    db::ThrowIfDbError(repository_->ApplyOpeningDelta(*tx, delta), "apply opening delta " + delta.eco_code);
  }
  for (const auto& game : resolved.games) {
    db::ThrowIfDbError(repository_->InsertGame(*tx, game), "insert game " + game.game_key);
  }
  for (const auto& point : resolved.rating_points) {
    db::ThrowIfDbError(repository_->AppendRatingPoint(*tx, point), "append rating point " + point.player_id);
  }

  tx->Commit();

  outcome.committed       = true;
  outcome.games_committed = resolved.games.size();
  outcome.new_players     = resolved.new_players;
  outcome.new_openings    = resolved.new_openings;
  outcome.name_conflicts  = resolved.name_conflicts;
  return outcome;
}

BatchOutcome BatchCommitter::Commit(const Batch& batch) {
  auto backoff = options_.initial_backoff;

  for (uint32_t attempt = 0;; ++attempt) {
    db::ErrorCode code;
    std::string   message;
    try {
      auto outcome     = Attempt(batch);
      outcome.attempts = attempt + 1;
      return outcome;
    } catch (const db::DbError& e) {
      code    = e.code();
      message = e.what();
    }

    if (attempt >= options_.max_retries) {
      if (db::IsUnavailable(code)) {
        CHESSDB_LOG_ERROR("Store unavailable, giving up", {UIntField("batch", batch.seq), IntField("attempts", attempt + 1),
                                                           StringField("error", message)});
        throw util::StoreUnavailable("store unavailable after " + std::to_string(attempt + 1) + " attempts: " + message);
      }

      CHESSDB_LOG_ERROR("Batch commit failed", {UIntField("batch", batch.seq), IntField("attempts", attempt + 1),
                                                StringField("code", db::ErrorCodeName(code)), StringField("error", message)});
      BatchOutcome failed;
      failed.batch_seq      = batch.seq;
      failed.committed      = false;
      failed.attempts       = attempt + 1;
      failed.error          = message;
      failed.failed_records = batch.records;
      return failed;
    }

    CHESSDB_LOG_WARN("Batch commit attempt failed, retrying",
                     {UIntField("batch", batch.seq), IntField("attempt", attempt + 1), StringField("code", db::ErrorCodeName(code)),
                      IntField("backoff_ms", backoff.count()), StringField("error", message)});
    sleep_(backoff);

    const auto next = std::chrono::milliseconds(static_cast<int64_t>(static_cast<double>(backoff.count()) * options_.backoff_multiplier));
    backoff         = std::min(next, options_.max_backoff);
  }
}

} // namespace chessdb::ingest
