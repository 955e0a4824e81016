#include "internal/ingest/import_pipeline.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "internal/analytics/analytics_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "support/test_games.hpp"

namespace {

using chessdb::analytics::AnalyticsEngine;
using chessdb::db::DbError;
using chessdb::db::ErrorCode;
using chessdb::db::Repository;
using chessdb::db::Result;
using chessdb::db::Transaction;
using chessdb::db::memory::MemoryRepository;
using chessdb::ingest::ImportOptions;
using chessdb::ingest::ImportPipeline;
using chessdb::ingest::ImportProgress;
using chessdb::testing::GameSpec;
using chessdb::testing::MalformedPgn;
using chessdb::testing::Pgn;
namespace model = chessdb::db::model;
namespace agg   = chessdb::db::agg;

void NoSleep(std::chrono::milliseconds) {}

std::string TwoDigits(int v) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d", v);
  return buf;
}

// Distinct games between Alice and Bob, one per day, Alice's rating
// rising with the date.
std::vector<GameSpec> Games(int n) {
  std::vector<GameSpec> games;
  for (int i = 0; i < n; ++i) {
    GameSpec g;
    g.date      = "2024." + TwoDigits(1 + i / 28) + "." + TwoDigits(1 + i % 28);
    g.white_elo = 1500 + i;
    g.black_elo = 1600 - i;
    g.result    = i % 3 == 0 ? "1-0" : (i % 3 == 1 ? "0-1" : "1/2-1/2");
    g.eco       = i % 2 == 0 ? "C50" : "B01";
    g.opening   = i % 2 == 0 ? "Italian Game" : "Scandinavian Defense";
    games.push_back(g);
  }
  return games;
}

ImportOptions SmallBatches(std::size_t records_per_batch) {
  ImportOptions options;
  options.buffer.max_records        = records_per_batch;
  options.progress_interval_batches = 1;
  return options;
}

uint64_t GameCount(Repository& repo) {
  auto tx = repo.BeginRead();
  return repo.Counts(*tx).games;
}

void TestMixedInputCommitsValidRecords() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();

  const auto         games = Games(3);
  std::istringstream in(Pgn(games[0]) + MalformedPgn() + Pgn(games[1]) + Pgn(games[2]));

  ImportPipeline pipeline(repo, SmallBatches(2), NoSleep);
  auto           summary = pipeline.Import(in, "mixed.pgn");

  assert(summary.processed == 4);
  assert(summary.accepted == 3);
  assert(summary.rejected == 1);
  assert(summary.parse_errors == 1);
  assert(summary.validation_errors == 0);
  assert(summary.rejects_by_reason.at("malformed_tag") == 1);
  assert(summary.games_committed == 3);
  assert(summary.batches_committed == 2);
  assert(summary.duplicates == 0);
  assert(summary.new_players == 2);
  assert(summary.new_openings == 2);
  assert(summary.failed_batches.empty());
  assert(!summary.cancelled);
  assert(summary.finished_ms >= summary.started_ms);

  auto tx     = repo->BeginRead();
  auto counts = repo->Counts(*tx);
  assert(counts.games == 3);
  assert(counts.players == 2);
  assert(counts.openings == 2);
  assert(counts.rating_points == 6);
  assert(counts.import_runs == 1);

  auto run = repo->LastImportRun(*tx);
  assert(run.has_value());
  assert(run->source == "mixed.pgn");
  assert(run->records_processed == 4);
  assert(run->records_accepted == 3);
  assert(run->records_rejected == 1);
  assert(run->games_committed == 3);
  assert(!run->cancelled);
}

void TestIrregularBlocksDoNotLoseGames() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();

  const auto games = Games(3);
  const auto text  = Pgn(games[0]) + chessdb::testing::TagsOnlyPgn() + Pgn(games[1]) + chessdb::testing::StrayTextPgn() + Pgn(games[2]) +
                    chessdb::testing::CommentOnlyPgn();
  std::istringstream in(text);

  ImportPipeline pipeline(repo, SmallBatches(2), NoSleep);
  auto           summary = pipeline.Import(in, "irregular.pgn");

  // one outcome per block in the input
  assert(summary.processed == 6);
  assert(summary.accepted == 3);
  assert(summary.rejected == 3);
  assert(summary.parse_errors == 1);
  assert(summary.validation_errors == 2);
  assert(summary.rejects_by_reason.at("malformed_movetext") == 1);
  assert(summary.rejects_by_reason.at("missing_tag") == 2);
  assert(summary.games_committed == 3);
  assert(GameCount(*repo) == 3);
}

void TestReimportIsIdempotent() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  const auto text = Pgn(Games(3));

  ImportPipeline pipeline(repo, SmallBatches(10), NoSleep);
  {
    std::istringstream in(text);
    auto               first = pipeline.Import(in, "games.pgn");
    assert(first.games_committed == 3);
  }

  std::istringstream in(text);
  auto               second = pipeline.Import(in, "games.pgn");
  assert(second.accepted == 3);
  assert(second.games_committed == 0);
  assert(second.duplicates == 3);
  assert(second.new_players == 0);

  auto tx     = repo->BeginRead();
  auto counts = repo->Counts(*tx);
  assert(counts.games == 3);
  assert(counts.rating_points == 6);
  assert(counts.import_runs == 2);

  auto alice = repo->FindPlayerByKey(*tx, "alice");
  assert(alice.has_value());
  assert(alice->games_played == 3);

  auto c50 = repo->FindOpening(*tx, "C50");
  assert(c50.has_value());
  assert(c50->games == 2);
}

void TestCountersAndHistoryStayConsistent() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();

  // newest games first: the resolver must still record history in date order
  auto games = Games(40);
  std::vector<GameSpec> reversed(games.rbegin(), games.rend());
  std::istringstream    in(Pgn(reversed));

  ImportPipeline pipeline(repo, SmallBatches(7), NoSleep);
  auto           summary = pipeline.Import(in, "reversed.pgn");
  assert(summary.games_committed == 40);

  AnalyticsEngine engine(repo);
  auto            report = engine.VerifyOpeningCounters();
  assert(report.Ok());
  assert(report.openings_checked == 2);

  auto tx    = repo->BeginRead();
  auto alice = repo->FindPlayerByKey(*tx, "alice");
  assert(alice.has_value());
  assert(alice->games_played == 40);

  auto history = repo->RatingHistory(*tx, alice->id);
  assert(!history.empty());
  for (std::size_t i = 1; i < history.size(); ++i) {
    assert(history[i - 1].timestamp_ms <= history[i].timestamp_ms);
    if (history[i - 1].timestamp_ms == history[i].timestamp_ms) {
      assert(history[i - 1].seq < history[i].seq);
    }
  }
  assert(alice->current_rating == history.back().rating);
  assert(alice->peak_rating >= alice->current_rating);
}

void TestMaxGamesStopsReading() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  std::istringstream in(Pgn(Games(5)));

  auto options      = SmallBatches(10);
  options.max_games = 2;

  ImportPipeline pipeline(repo, options, NoSleep);
  auto           summary = pipeline.Import(in, "limited.pgn");

  assert(summary.processed == 2);
  assert(summary.accepted == 2);
  assert(summary.games_committed == 2);
  assert(GameCount(*repo) == 2);
}

void TestCancelBeforeImport() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  std::istringstream in(Pgn(Games(5)));

  ImportPipeline pipeline(repo, SmallBatches(10), NoSleep);
  pipeline.Cancel();
  auto summary = pipeline.Import(in, "cancelled.pgn");

  assert(summary.cancelled);
  assert(summary.processed == 0);
  assert(summary.games_committed == 0);
  assert(GameCount(*repo) == 0);

  {
    auto tx  = repo->BeginRead();
    auto run = repo->LastImportRun(*tx);
    assert(run.has_value());
    assert(run->cancelled);
  }

  // the cancel applied to one run only
  assert(!pipeline.Cancelled());
  std::istringstream again(Pgn(Games(5)));
  auto               rerun = pipeline.Import(again, "cancelled.pgn");
  assert(!rerun.cancelled);
  assert(rerun.games_committed == 5);
  assert(GameCount(*repo) == 5);
}

void TestCancelMidImportKeepsCommittedBatches() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  std::istringstream in(Pgn(Games(50)));

  ImportPipeline pipeline(repo, SmallBatches(1), NoSleep);

  std::vector<uint64_t> seen;
  pipeline.SetProgressListener([&](const ImportProgress& progress) {
    seen.push_back(progress.batches_committed);
    pipeline.Cancel();
  });

  auto summary = pipeline.Import(in, "interrupted.pgn");

  assert(summary.cancelled);
  assert(!seen.empty());
  assert(seen.front() == 1);
  assert(summary.games_committed >= 1);
  assert(summary.games_committed < 50);
  assert(summary.processed < 50);
  // whole batches only
  assert(GameCount(*repo) == summary.games_committed);

  AnalyticsEngine engine(repo);
  assert(engine.VerifyOpeningCounters().Ok());
}

void TestBufferCeilingBoundsMemory() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  std::istringstream in(Pgn(Games(30)));

  ImportOptions options;
  options.buffer.max_records = 1000;
  options.buffer.max_bytes   = 4096;

  ImportPipeline pipeline(repo, options, NoSleep);
  auto           summary = pipeline.Import(in, "bounded.pgn");

  assert(summary.games_committed == 30);
  assert(summary.batches_committed > 1);
  assert(summary.peak_buffer_bytes > 0);
  assert(summary.peak_buffer_bytes <= 4096);
}

/*
  Begin() fails with Unavailable once `healthy_begins` transactions
  were handed out.
*/
class FlakyRepository final : public Repository {
 public:
  FlakyRepository(std::shared_ptr<Repository> inner, int healthy_begins) : inner_(std::move(inner)), healthy_begins_(healthy_begins) {}

  std::unique_ptr<Transaction> Begin() override {
    if (begins_++ >= healthy_begins_) throw DbError(ErrorCode::Unavailable, "store went away");
    return inner_->Begin();
  }
  std::unique_ptr<Transaction> BeginRead() override {
    return inner_->BeginRead();
  }
  void EnsureSchema() override {
    inner_->EnsureSchema();
  }

  std::optional<model::PlayerRecord> FindPlayerByKey(Transaction& tx, const std::string& key) override {
    return inner_->FindPlayerByKey(tx, key);
  }
  std::optional<model::PlayerRecord> FindPlayerById(Transaction& tx, const std::string& id) override {
    return inner_->FindPlayerById(tx, id);
  }
  Result UpsertPlayer(Transaction& tx, const model::PlayerRecord& p) override {
    return inner_->UpsertPlayer(tx, p);
  }
  std::optional<model::OpeningRecord> FindOpening(Transaction& tx, const std::string& eco) override {
    return inner_->FindOpening(tx, eco);
  }
  std::vector<model::OpeningRecord> ListOpenings(Transaction& tx) override {
    return inner_->ListOpenings(tx);
  }
  Result ApplyOpeningDelta(Transaction& tx, const model::OpeningDelta& d) override {
    return inner_->ApplyOpeningDelta(tx, d);
  }
  bool GameExists(Transaction& tx, const std::string& key) override {
    return inner_->GameExists(tx, key);
  }
  Result InsertGame(Transaction& tx, const model::GameRow& g) override {
    return inner_->InsertGame(tx, g);
  }
  Result AppendRatingPoint(Transaction& tx, const model::RatingPointRecord& r) override {
    return inner_->AppendRatingPoint(tx, r);
  }
  std::vector<model::RatingPointRecord> RatingHistory(Transaction& tx, const std::string& id) override {
    return inner_->RatingHistory(tx, id);
  }
  Result RecordImportRun(Transaction& tx, model::ImportRunRecord& r) override {
    return inner_->RecordImportRun(tx, r);
  }
  std::optional<model::ImportRunRecord> LastImportRun(Transaction& tx) override {
    return inner_->LastImportRun(tx);
  }
  chessdb::db::CollectionCounts Counts(Transaction& tx) override {
    return inner_->Counts(tx);
  }
  std::vector<agg::Row> Aggregate(Transaction& tx, const agg::Pipeline& p, std::optional<agg::Deadline> d) override {
    return inner_->Aggregate(tx, p, d);
  }

 private:
  std::shared_ptr<Repository> inner_;
  int                         healthy_begins_;
  int                         begins_ = 0;
};

void TestStoreLossAbortsImport() {
  auto inner = std::make_shared<MemoryRepository>();
  inner->EnsureSchema();
  auto flaky = std::make_shared<FlakyRepository>(inner, 2);

  std::istringstream in(Pgn(Games(5)));
  ImportPipeline     pipeline(flaky, SmallBatches(1), NoSleep);

  bool threw = false;
  try {
    (void)pipeline.Import(in, "flaky.pgn");
  } catch (const chessdb::util::StoreUnavailable&) {
    threw = true;
  }
  assert(threw);

  // batches committed before the failure stay committed
  assert(GameCount(*inner) == 2);
}

void TestImportFileRejectsUnreadableInput() {
  auto repo = std::make_shared<MemoryRepository>();
  repo->EnsureSchema();
  ImportPipeline pipeline(repo, ImportOptions{}, NoSleep);

  const auto dir = std::filesystem::temp_directory_path() / "chessdb_import_pipeline_tests";
  std::filesystem::create_directories(dir);

  bool threw = false;
  try {
    (void)pipeline.ImportFile((dir / "missing.pgn").string());
  } catch (const chessdb::util::InputUnreadable&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)pipeline.ImportFile(dir.string());
  } catch (const chessdb::util::InputUnreadable&) {
    threw = true;
  }
  assert(threw);

  const auto path = dir / "games.pgn";
  {
    std::ofstream out(path);
    out << Pgn(Games(4));
  }
  auto summary = pipeline.ImportFile(path.string());
  assert(summary.source == path.string());
  assert(summary.games_committed == 4);
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestMixedInputCommitsValidRecords();
  TestIrregularBlocksDoNotLoseGames();
  TestReimportIsIdempotent();
  TestCountersAndHistoryStayConsistent();
  TestMaxGamesStopsReading();
  TestCancelBeforeImport();
  TestCancelMidImportKeepsCommittedBatches();
  TestBufferCeilingBoundsMemory();
  TestStoreLossAbortsImport();
  TestImportFileRejectsUnreadableInput();

  std::cout << "chessdb_integration_import_pipeline: pass\n";
  return 0;
}
