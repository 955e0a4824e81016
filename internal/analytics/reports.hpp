#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chessdb/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace chessdb::analytics {

struct QueryOptions {
  // sample-size threshold; the engine default applies when unset
  std::optional<uint64_t> min_games;

  std::optional<chessdb::v1::TimeControlClass> time_control;

  // overrides the configured query timeout
  std::optional<std::chrono::milliseconds> time_budget;

  std::optional<uint64_t> limit;
};

struct OpeningStats {
  std::string eco_code;
  std::string opening_name;

  uint64_t games      = 0;
  uint64_t white_wins = 0;
  uint64_t black_wins = 0;
  uint64_t draws      = 0;

  double white_win_rate = 0.0;
  double black_win_rate = 0.0;
  double draw_rate      = 0.0;

  // white win rate minus black win rate
  double white_advantage = 0.0;

  std::optional<double> avg_rating;
};

struct TimeControlStats {
  chessdb::v1::TimeControlClass time_control = chessdb::v1::TIME_CONTROL_UNKNOWN;

  uint64_t games      = 0;
  uint64_t white_wins = 0;
  uint64_t black_wins = 0;
  uint64_t draws      = 0;

  double white_win_rate = 0.0;
  double black_win_rate = 0.0;
  double draw_rate      = 0.0;

  std::optional<double> avg_rating;
};

struct TrendPoint {
  int64_t                       timestamp_ms = 0;
  int32_t                       rating       = 0;
  uint64_t                      seq          = 0;
  chessdb::v1::TimeControlClass time_control = chessdb::v1::TIME_CONTROL_UNKNOWN;
};

struct RepertoireEntry {
  std::string eco_code;
  std::string opening_name;

  uint64_t games  = 0;
  uint64_t wins   = 0;
  uint64_t draws  = 0;
  uint64_t losses = 0;

  // (wins + 0.5 * draws) / games
  double score_rate = 0.0;
  double win_rate   = 0.0;

  int64_t last_played_ms = 0;
};

struct VolatilityEntry {
  std::string player_id;
  std::string display_name;

  uint64_t points = 0;

  // population stddev of successive rating deltas
  double rating_stddev = 0.0;
  double avg_rating    = 0.0;

  int32_t min_rating = 0;
  int32_t max_rating = 0;
};

struct PlayerProfile {
  db::model::PlayerRecord player;
  uint64_t                rating_points = 0;
  std::vector<TrendPoint> recent;
};

struct StatusReport {
  db::CollectionCounts                      counts;
  std::optional<db::model::ImportRunRecord> last_import;
};

struct CounterMismatch {
  std::string eco_code;

  // stored opening counters, and the values recomputed from games
  db::model::OpeningRecord stored;
  db::model::OpeningRecord recomputed;
};

struct VerifyReport {
  uint64_t                     openings_checked = 0;
  std::vector<CounterMismatch> mismatches;

  bool Ok() const {
    return mismatches.empty();
  }
};

} // namespace chessdb::analytics
