#include "memory_repository.hpp"

#include <algorithm>

#include "memory_aggregate.hpp"
#include "memory_tx.hpp"

namespace chessdb::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<MemoryState>()) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

void MemoryRepository::EnsureSchema() {
  // collections and indexes exist from construction
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

std::optional<model::PlayerRecord> MemoryRepository::FindPlayerByKey(Transaction& t, const std::string& name_key) {
  const auto& s  = TX(t).View();
  auto        it = s.player_ids_by_key.find(name_key);
  if (it == s.player_ids_by_key.end()) return std::nullopt;
  return s.players.at(it->second);
}

std::optional<model::PlayerRecord> MemoryRepository::FindPlayerById(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.players.find(id);
  if (it == s.players.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertPlayer(Transaction& t, const model::PlayerRecord& r) {
  if (r.id.empty() || r.name_key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "player id and name key are required");

  auto& s        = TX(t).Mutable();
  auto  owner_it = s.player_ids_by_key.find(r.name_key);
  if (owner_it != s.player_ids_by_key.end() && owner_it->second != r.id) {
    return Result::Err(ErrorCode::AlreadyExists, "player name key already bound to another id");
  }

  auto it = s.players.find(r.id);
  if (it == s.players.end()) {
    s.players.emplace(r.id, r);
    s.player_ids_by_key[r.name_key] = r.id;
    return Result::Ok();
  }

  if (it->second.name_key != r.name_key) {
    return Result::Err(ErrorCode::ConstraintViolation, "player name key is immutable");
  }
  const auto peak   = std::max(it->second.peak_rating, r.peak_rating);
  it->second        = r;
  it->second.peak_rating = peak;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Openings
// ------------------------------------------------------------------

std::optional<model::OpeningRecord> MemoryRepository::FindOpening(Transaction& t, const std::string& eco_code) {
  const auto& s  = TX(t).View();
  auto        it = s.openings.find(eco_code);
  if (it == s.openings.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OpeningRecord> MemoryRepository::ListOpenings(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::OpeningRecord> out;
  out.reserve(s.openings.size());
  for (const auto& [_, record] : s.openings) out.push_back(record);
  return out;
}

Result MemoryRepository::ApplyOpeningDelta(Transaction& t, const model::OpeningDelta& d) {
  if (d.eco_code.empty()) return Result::Err(ErrorCode::ConstraintViolation, "opening code is required");

  auto& s       = TX(t).Mutable();
  auto [it, _]  = s.openings.try_emplace(d.eco_code);
  auto& opening = it->second;
  opening.eco_code = d.eco_code;
  if (opening.name.empty()) opening.name = d.name;
  opening.games += d.games;
  opening.white_wins += d.white_wins;
  opening.black_wins += d.black_wins;
  opening.draws += d.draws;
  opening.white_rating_sum += d.white_rating_sum;
  opening.black_rating_sum += d.black_rating_sum;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Games
// ------------------------------------------------------------------

bool MemoryRepository::GameExists(Transaction& t, const std::string& game_key) {
  return TX(t).View().game_keys.contains(game_key);
}

Result MemoryRepository::InsertGame(Transaction& t, const model::GameRow& g) {
  auto& s = TX(t).Mutable();
  if (s.game_keys.contains(g.game_key)) return Result::Err(ErrorCode::AlreadyExists, "game already committed");
  if (!s.players.contains(g.white_player_id) || !s.players.contains(g.black_player_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "game references unknown player");
  }
  if (!s.openings.contains(g.eco_code)) return Result::Err(ErrorCode::ConstraintViolation, "game references unknown opening");

  const std::size_t pos = s.games.size();
  s.games.push_back(g);
  s.game_keys.insert(g.game_key);
  s.games_by_eco[g.eco_code].push_back(pos);
  s.games_by_white[g.white_player_id].push_back(pos);
  s.games_by_black[g.black_player_id].push_back(pos);
  s.games_by_time_control[static_cast<int64_t>(g.time_control)].push_back(pos);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Rating history
// ------------------------------------------------------------------

Result MemoryRepository::AppendRatingPoint(Transaction& t, const model::RatingPointRecord& p) {
  auto& s = TX(t).Mutable();
  if (!s.players.contains(p.player_id)) return Result::Err(ErrorCode::ConstraintViolation, "rating point references unknown player");

  auto& positions = s.points_by_player[p.player_id];
  for (auto pos : positions) {
    const auto& existing = s.rating_points[pos];
    if (existing.timestamp_ms > p.timestamp_ms) {
      return Result::Err(ErrorCode::ConstraintViolation, "rating history timestamp regression");
    }
    if (existing.seq == p.seq) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate rating history sequence");
    }
  }

  positions.push_back(s.rating_points.size());
  s.rating_points.push_back(p);
  return Result::Ok();
}

std::vector<model::RatingPointRecord> MemoryRepository::RatingHistory(Transaction& t, const std::string& player_id) {
  const auto&                            s = TX(t).View();
  std::vector<model::RatingPointRecord> out;
  auto                                   it = s.points_by_player.find(player_id);
  if (it == s.points_by_player.end()) return out;

  out.reserve(it->second.size());
  for (auto pos : it->second) out.push_back(s.rating_points[pos]);
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.timestamp_ms != b.timestamp_ms) return a.timestamp_ms < b.timestamp_ms;
    return a.seq < b.seq;
  });
  return out;
}

// ------------------------------------------------------------------
// Import runs
// ------------------------------------------------------------------

Result MemoryRepository::RecordImportRun(Transaction& t, model::ImportRunRecord& record) {
  auto& s   = TX(t).Mutable();
  record.id = s.import_runs.size() + 1;
  s.import_runs.push_back(record);
  return Result::Ok();
}

std::optional<model::ImportRunRecord> MemoryRepository::LastImportRun(Transaction& t) {
  const auto& s = TX(t).View();
  if (s.import_runs.empty()) return std::nullopt;
  return s.import_runs.back();
}

// ------------------------------------------------------------------
// Analytics
// ------------------------------------------------------------------

CollectionCounts MemoryRepository::Counts(Transaction& t) {
  const auto&      s = TX(t).View();
  CollectionCounts counts;
  counts.players       = s.players.size();
  counts.openings      = s.openings.size();
  counts.games         = s.games.size();
  counts.rating_points = s.rating_points.size();
  counts.import_runs   = s.import_runs.size();
  return counts;
}

std::vector<agg::Row> MemoryRepository::Aggregate(Transaction& t, const agg::Pipeline& pipeline, std::optional<agg::Deadline> deadline) {
  return RunPipeline(TX(t).View(), pipeline, deadline);
}

} // namespace chessdb::db::memory
