#include "internal/ingest/entity_resolver.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "support/test_games.hpp"

namespace {

using chessdb::db::memory::MemoryRepository;
using chessdb::ingest::EntityResolver;
using chessdb::ingest::ResolvedBatch;
using chessdb::model::GameRecord;
using chessdb::testing::kBaseMs;
using chessdb::testing::kDay;
using chessdb::testing::Record;

constexpr int64_t kWallClock = 1'000'000;

EntityResolver FixedClockResolver() {
  return EntityResolver([] { return kWallClock; });
}

std::vector<const GameRecord*> Pointers(const std::vector<GameRecord>& games) {
  std::vector<const GameRecord*> out;
  for (const auto& g : games) out.push_back(&g);
  return out;
}

void Apply(MemoryRepository& repo, const std::vector<GameRecord>& games) {
  auto tx       = repo.Begin();
  auto resolved = FixedClockResolver().Resolve(repo, *tx, Pointers(games));
  for (const auto& p : resolved.players) chessdb::db::ThrowIfDbError(repo.UpsertPlayer(*tx, p), "player");
  for (const auto& o : resolved.openings) chessdb::db::ThrowIfDbError(repo.ApplyOpeningDelta(*tx, o), "opening");
  for (const auto& g : resolved.games) chessdb::db::ThrowIfDbError(repo.InsertGame(*tx, g), "game");
  for (const auto& r : resolved.rating_points) chessdb::db::ThrowIfDbError(repo.AppendRatingPoint(*tx, r), "rating");
  tx->Commit();
}

// New player seen twice in one batch gets one identity; latest rating wins.
void TestNewPlayerTwiceInOneBatch() {
  MemoryRepository repo;
  repo.EnsureSchema();

  std::vector<GameRecord> games = {Record("Alice", "Bob", 1500, 1450, kBaseMs), Record("Carol", "Alice", 1600, 1520, kBaseMs + kDay)};

  auto tx       = repo.Begin();
  auto resolved = FixedClockResolver().Resolve(repo, *tx, Pointers(games));

  assert(resolved.new_players == 3);
  assert(resolved.players.size() == 3);
  assert(resolved.new_openings == 1);
  assert(resolved.games.size() == 2);

  const auto& alice = resolved.players[0];
  assert(alice.display_name == "Alice");
  assert(alice.name_key == "alice");
  assert(alice.current_rating == 1520);
  assert(alice.peak_rating == 1520);
  assert(alice.games_played == 2);
  assert(alice.first_seen_ms == kWallClock);
  assert(resolved.games[0].white_player_id == alice.id);
  assert(resolved.games[1].black_player_id == alice.id);

  std::vector<chessdb::db::model::RatingPointRecord> alice_points;
  for (const auto& p : resolved.rating_points) {
    if (p.player_id == alice.id) alice_points.push_back(p);
  }
  assert(alice_points.size() == 2);
  assert(alice_points[0].rating == 1500 && alice_points[0].seq == 1);
  assert(alice_points[1].rating == 1520 && alice_points[1].seq == 2);

  const auto& c50 = resolved.openings.front();
  assert(c50.eco_code == "C50");
  assert(c50.games == 2);
  assert(c50.white_wins == 2);
  assert(c50.white_rating_sum == 3100);
}

// Games are applied in played-at order, whatever the input order.
void TestBatchIsResolvedInDateOrder() {
  MemoryRepository repo;
  repo.EnsureSchema();

  std::vector<GameRecord> games = {Record("Alice", "Bob", 1520, 1450, kBaseMs + kDay), Record("Alice", "Bob", 1500, 1460, kBaseMs)};

  auto tx       = repo.Begin();
  auto resolved = FixedClockResolver().Resolve(repo, *tx, Pointers(games));
  assert(resolved.players[0].current_rating == 1520);
  assert(resolved.games[0].date_ms == kBaseMs);
  assert(resolved.rating_points.size() == 4);
}

void TestExistingPlayerAndStaleGame() {
  MemoryRepository repo;
  repo.EnsureSchema();
  Apply(repo, {Record("Alice", "Bob", 1500, 1450, kBaseMs + 10 * kDay)});

  // older game with a higher rating
  std::vector<GameRecord> later = {Record("alice", "Dave", 1700, 1400, kBaseMs, "B01")};

  auto tx       = repo.Begin();
  auto resolved = FixedClockResolver().Resolve(repo, *tx, Pointers(later));

  assert(resolved.new_players == 1);
  assert(resolved.new_openings == 1);
  assert(resolved.name_conflicts == 1);

  const auto& alice = resolved.players[0];
  assert(alice.display_name == "Alice");
  assert(alice.games_played == 2);
  assert(alice.peak_rating == 1700);
  assert(alice.current_rating == 1500);

  for (const auto& p : resolved.rating_points) assert(p.player_id != alice.id);
}

void TestTitleFilledWhenFirstKnown() {
  MemoryRepository repo;
  repo.EnsureSchema();
  Apply(repo, {Record("Erin", "Bob", 2400, 1450, kBaseMs)});

  auto titled        = Record("Erin", "Frank", 2410, 2300, kBaseMs + kDay);
  titled.white_title = "IM";

  auto tx       = repo.Begin();
  auto resolved = FixedClockResolver().Resolve(repo, *tx, {&titled});
  assert(resolved.players[0].title == "IM");
  assert(resolved.players[0].current_rating == 2410);
}

void TestCommittedStateAfterTwoBatches() {
  MemoryRepository repo;
  repo.EnsureSchema();
  Apply(repo, {Record("Alice", "Bob", 1500, 1450, kBaseMs), Record("Alice", "Carol", 1520, 1600, kBaseMs + kDay)});
  Apply(repo, {Record("Alice", "Bob", 1490, 1470, kBaseMs + 2 * kDay, "C50", "0-1")});

  auto tx    = repo.BeginRead();
  auto alice = repo.FindPlayerByKey(*tx, "alice");
  assert(alice.has_value());
  assert(alice->games_played == 3);
  assert(alice->current_rating == 1490);
  assert(alice->peak_rating == 1520);

  auto history = repo.RatingHistory(*tx, alice->id);
  assert(history.size() == 3);
  for (std::size_t i = 1; i < history.size(); ++i) assert(history[i - 1].timestamp_ms <= history[i].timestamp_ms);

  auto opening = repo.FindOpening(*tx, "C50");
  assert(opening.has_value());
  assert(opening->games == 3);
  assert(opening->white_wins == 2);
  assert(opening->black_wins == 1);
}

} // namespace

int main() {
  TestNewPlayerTwiceInOneBatch();
  TestBatchIsResolvedInDateOrder();
  TestExistingPlayerAndStaleGame();
  TestTitleFilledWhenFirstKnown();
  TestCommittedStateAfterTwoBatches();

  std::cout << "chessdb_unit_entity_resolver: pass\n";
  return 0;
}
