#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/analytics/reports.hpp"
#include "internal/db/api/repository.hpp"

namespace chessdb::runtime::config {
class AnalyticsConfig;
}

namespace chessdb::analytics {

struct AnalyticsDefaults {
  uint64_t                                 min_games    = 1;
  uint64_t                                 result_limit = 50;
  std::optional<std::chrono::milliseconds> query_timeout;

  static AnalyticsDefaults FromConfig(const chessdb::runtime::config::AnalyticsConfig& config);
};

/*
  AnalyticsEngine

  Read-only statistics over the committed store. Every call opens its
  own snapshot transaction, so a batch is either fully visible or not
  at all.

  Throws util::QueryTimeout when the time budget runs out and
  db::DbError when the backend fails.
*/
class AnalyticsEngine {
 public:
  explicit AnalyticsEngine(std::shared_ptr<db::Repository> repository, AnalyticsDefaults defaults = {});

  // Grouped by ECO, sorted by games desc then ECO.
  std::vector<OpeningStats> OpeningSuccessRates(const QueryOptions& options = {});

  // Ascending by (timestamp, seq); limit keeps the most recent points.
  // Unknown players and players under min_games points yield nothing.
  std::vector<TrendPoint> RatingTrend(const std::string& player_name, const QueryOptions& options = {});

  std::vector<TimeControlStats> TimeControlComparison(const QueryOptions& options = {});

  std::vector<RepertoireEntry> PlayerRepertoire(const std::string& player_name, chessdb::v1::Color color, const QueryOptions& options = {});

  // Players with at least max(min_games, 2) rating points.
  std::vector<VolatilityEntry> RatingVolatility(const QueryOptions& options = {});

  std::optional<PlayerProfile> FindPlayer(const std::string& player_name, const QueryOptions& options = {});

  StatusReport Status();

  VerifyReport VerifyOpeningCounters(const QueryOptions& options = {});

 private:
  std::optional<db::agg::Deadline> DeadlineFor(const QueryOptions& options) const;

  uint64_t MinGames(const QueryOptions& options) const;
  uint64_t Limit(const QueryOptions& options) const;

  std::shared_ptr<db::Repository> repository_;
  AnalyticsDefaults               defaults_;
};

} // namespace chessdb::analytics
