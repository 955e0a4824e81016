#include "internal/analytics/analytics_engine.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/batch_committer.hpp"
#include "internal/util/errors.hpp"
#include "support/test_games.hpp"

namespace {

using chessdb::analytics::AnalyticsEngine;
using chessdb::analytics::QueryOptions;
using chessdb::testing::kBaseMs;
using chessdb::testing::kDay;
using chessdb::testing::Record;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-6;
}

std::shared_ptr<chessdb::db::memory::MemoryRepository> Seed() {
  auto repo = std::make_shared<chessdb::db::memory::MemoryRepository>();
  repo->EnsureSchema();

  chessdb::ingest::Batch batch;
  batch.seq = 1;

  const int         alice[]   = {1500, 1520, 1490, 1510, 1530};
  const std::string results[] = {"1-0", "1-0", "0-1", "1/2-1/2", "1-0"};
  for (int i = 0; i < 5; ++i) {
    batch.records.push_back(Record("Alice", "Bob", alice[i], 1450, kBaseMs + i * kDay, "C50", results[i]));
  }
  batch.records.push_back(Record("Carol", "Dave", 1800, 1700, kBaseMs + 5 * kDay, "B01", "1-0"));

  chessdb::ingest::BatchCommitter committer(repo, chessdb::ingest::CommitterOptions{});
  auto                            outcome = committer.Commit(batch);
  assert(outcome.committed);
  assert(outcome.games_committed == 6);
  return repo;
}

// B01 has one game, C50 has five; a threshold of two keeps only C50.
void TestOpeningSuccessRatesThreshold() {
  AnalyticsEngine engine(Seed());

  QueryOptions options;
  options.min_games = 2;
  auto stats        = engine.OpeningSuccessRates(options);

  assert(stats.size() == 1);
  const auto& c50 = stats.front();
  assert(c50.eco_code == "C50");
  assert(c50.opening_name == "C50 opening");
  assert(c50.games == 5);
  assert(c50.white_wins == 3 && c50.black_wins == 1 && c50.draws == 1);
  assert(Near(c50.white_win_rate, 0.6));
  assert(Near(c50.black_win_rate, 0.2));
  assert(Near(c50.draw_rate, 0.2));
  assert(Near(c50.white_advantage, 0.4));
  assert(c50.avg_rating && Near(*c50.avg_rating, 1480.0));

  auto all = engine.OpeningSuccessRates();
  assert(all.size() == 2);
  assert(all[0].eco_code == "C50");
  assert(all[1].eco_code == "B01");
}

void TestTimeControlFilter() {
  AnalyticsEngine engine(Seed());

  QueryOptions blitz;
  blitz.time_control = chessdb::v1::TIME_CONTROL_BLITZ;
  assert(engine.OpeningSuccessRates(blitz).size() == 2);

  QueryOptions bullet;
  bullet.time_control = chessdb::v1::TIME_CONTROL_BULLET;
  assert(engine.OpeningSuccessRates(bullet).empty());

  auto by_class = engine.TimeControlComparison();
  assert(by_class.size() == 1);
  assert(by_class[0].time_control == chessdb::v1::TIME_CONTROL_BLITZ);
  assert(by_class[0].games == 6);
  assert(by_class[0].white_wins == 4);
}

void TestRatingTrend() {
  AnalyticsEngine engine(Seed());

  auto full = engine.RatingTrend("Alice");
  assert(full.size() == 5);
  for (std::size_t i = 1; i < full.size(); ++i) assert(full[i - 1].timestamp_ms <= full[i].timestamp_ms);
  assert(full.back().rating == 1530);

  QueryOptions recent;
  recent.limit = 2;
  auto last    = engine.RatingTrend(" alice ", recent);
  assert(last.size() == 2);
  assert(last[0].rating == 1510);
  assert(last[1].rating == 1530);

  QueryOptions strict;
  strict.min_games = 6;
  assert(engine.RatingTrend("Alice", strict).empty());
  assert(engine.RatingTrend("Nobody").empty());
}

void TestRepertoire() {
  AnalyticsEngine engine(Seed());

  auto white = engine.PlayerRepertoire("Alice", chessdb::v1::COLOR_WHITE);
  assert(white.size() == 1);
  assert(white[0].eco_code == "C50");
  assert(white[0].games == 5);
  assert(white[0].wins == 3 && white[0].draws == 1 && white[0].losses == 1);
  assert(Near(white[0].score_rate, 0.7));
  assert(Near(white[0].win_rate, 0.6));
  assert(white[0].last_played_ms == kBaseMs + 4 * kDay);

  assert(engine.PlayerRepertoire("Alice", chessdb::v1::COLOR_BLACK).empty());

  auto bob = engine.PlayerRepertoire("Bob", chessdb::v1::COLOR_BLACK);
  assert(bob.size() == 1);
  assert(bob[0].wins == 1 && bob[0].losses == 3);
}

void TestVolatility() {
  AnalyticsEngine engine(Seed());

  auto entries = engine.RatingVolatility();
  // Carol and Dave have a single point each
  assert(entries.size() == 2);
  assert(entries[0].display_name == "Alice");
  assert(entries[0].points == 5);
  assert(Near(entries[0].rating_stddev, std::sqrt(468.75)));
  assert(Near(entries[0].avg_rating, 1510.0));
  assert(entries[0].min_rating == 1490 && entries[0].max_rating == 1530);
  assert(entries[1].display_name == "Bob");
  assert(Near(entries[1].rating_stddev, 0.0));

  QueryOptions strict;
  strict.min_games = 6;
  assert(engine.RatingVolatility(strict).empty());
}

void TestProfileAndStatus() {
  AnalyticsEngine engine(Seed());

  auto profile = engine.FindPlayer("  ALICE ");
  assert(profile.has_value());
  assert(profile->player.display_name == "Alice");
  assert(profile->player.current_rating == 1530);
  assert(profile->player.peak_rating == 1530);
  assert(profile->player.games_played == 5);
  assert(profile->rating_points == 5);
  assert(profile->recent.size() == 5);
  assert(profile->recent.back().rating == 1530);
  assert(!engine.FindPlayer("nobody").has_value());

  auto status = engine.Status();
  assert(status.counts.games == 6);
  assert(status.counts.players == 4);
  assert(status.counts.openings == 2);
  assert(status.counts.rating_points == 12);
  assert(!status.last_import.has_value());
}

void TestVerifyOpeningCounters() {
  auto            repo = Seed();
  AnalyticsEngine engine(repo);

  auto ok = engine.VerifyOpeningCounters();
  assert(ok.Ok());
  assert(ok.openings_checked == 2);

  {
    auto                               tx = repo->Begin();
    chessdb::db::model::OpeningDelta stray;
    stray.eco_code = "C50";
    stray.games    = 1;
    chessdb::db::ThrowIfDbError(repo->ApplyOpeningDelta(*tx, stray), "stray delta");
    tx->Commit();
  }

  auto bad = engine.VerifyOpeningCounters();
  assert(!bad.Ok());
  assert(bad.mismatches.size() == 1);
  assert(bad.mismatches[0].eco_code == "C50");
  assert(bad.mismatches[0].stored.games == 6);
  assert(bad.mismatches[0].recomputed.games == 5);
}

void TestQueryTimeout() {
  AnalyticsEngine engine(Seed());

  QueryOptions options;
  options.time_budget = std::chrono::milliseconds(0);

  bool threw = false;
  try {
    (void)engine.OpeningSuccessRates(options);
  } catch (const chessdb::util::QueryTimeout&) {
    threw = true;
  }
  assert(threw);

  chessdb::analytics::AnalyticsDefaults defaults;
  defaults.query_timeout = std::chrono::milliseconds(0);
  AnalyticsEngine strict(Seed(), defaults);
  threw = false;
  try {
    (void)strict.RatingVolatility();
  } catch (const chessdb::util::QueryTimeout&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOpeningSuccessRatesThreshold();
  TestTimeControlFilter();
  TestRatingTrend();
  TestRepertoire();
  TestVolatility();
  TestProfileAndStatus();
  TestVerifyOpeningCounters();
  TestQueryTimeout();

  std::cout << "chessdb_unit_analytics_engine: pass\n";
  return 0;
}
