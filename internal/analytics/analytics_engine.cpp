#include "internal/analytics/analytics_engine.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "config/config.pb.h"
#include "internal/analytics/pipeline_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace chessdb::analytics {

using db::agg::Collection;
using db::agg::CompareOp;
using db::agg::GetDouble;
using db::agg::GetInt;
using db::agg::GetOptionalDouble;
using db::agg::GetString;

namespace {

constexpr std::size_t kProfileRecentPoints = 10;

int64_t ResultValue(chessdb::v1::GameResult result) {
  return static_cast<int64_t>(result);
}

double Rate(uint64_t part, uint64_t total) {
  return total == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(total);
}

std::optional<double> MeanOf(const std::optional<double>& a, const std::optional<double>& b) {
  if (a && b) return (*a + *b) / 2.0;
  if (a) return a;
  return b;
}

// Count plus per-result counts plus average ratings, shared by the
// opening and time-control reports.
std::vector<db::agg::Accumulator> OutcomeAccumulators() {
  return {acc::Count("games"),
          acc::CountIf("white_wins", "result", ResultValue(chessdb::v1::GAME_RESULT_WHITE_WIN)),
          acc::CountIf("black_wins", "result", ResultValue(chessdb::v1::GAME_RESULT_BLACK_WIN)),
          acc::CountIf("draws", "result", ResultValue(chessdb::v1::GAME_RESULT_DRAW)),
          acc::Avg("avg_white_rating", "white_rating"),
          acc::Avg("avg_black_rating", "black_rating")};
}

TrendPoint ToTrendPoint(const db::agg::Row& row) {
  TrendPoint p;
  p.timestamp_ms = GetInt(row, "timestamp_ms");
  p.rating       = static_cast<int32_t>(GetInt(row, "rating"));
  p.seq          = static_cast<uint64_t>(GetInt(row, "seq"));
  p.time_control = static_cast<chessdb::v1::TimeControlClass>(GetInt(row, "time_control"));
  return p;
}

std::map<std::string, std::string> OpeningNames(db::Repository& repo, db::Transaction& tx) {
  std::map<std::string, std::string> names;
  for (auto& opening : repo.ListOpenings(tx)) names.emplace(opening.eco_code, std::move(opening.name));
  return names;
}

} // namespace

AnalyticsDefaults AnalyticsDefaults::FromConfig(const chessdb::runtime::config::AnalyticsConfig& config) {
  AnalyticsDefaults defaults;
  defaults.min_games    = config.default_min_games();
  defaults.result_limit = config.result_limit();
  if (config.has_query_timeout()) defaults.query_timeout = util::FromProto(config.query_timeout());
  return defaults;
}

AnalyticsEngine::AnalyticsEngine(std::shared_ptr<db::Repository> repository, AnalyticsDefaults defaults)
    : repository_(std::move(repository)), defaults_(defaults) {}

std::optional<db::agg::Deadline> AnalyticsEngine::DeadlineFor(const QueryOptions& options) const {
  const auto budget = options.time_budget ? options.time_budget : defaults_.query_timeout;
  if (!budget) return std::nullopt;
  return std::chrono::steady_clock::now() + *budget;
}

uint64_t AnalyticsEngine::MinGames(const QueryOptions& options) const {
  return options.min_games.value_or(defaults_.min_games);
}

uint64_t AnalyticsEngine::Limit(const QueryOptions& options) const {
  return options.limit.value_or(defaults_.result_limit);
}

std::vector<OpeningStats> AnalyticsEngine::OpeningSuccessRates(const QueryOptions& options) {
  PipelineBuilder builder(Collection::kGames);
  if (options.time_control) builder.Match("time_control", CompareOp::kEq, static_cast<int64_t>(*options.time_control));
  builder.Group({"eco_code"}, OutcomeAccumulators())
      .Having("games", CompareOp::kGe, static_cast<int64_t>(MinGames(options)))
      .SortBy("games", true)
      .SortBy("eco_code");
  if (const auto limit = Limit(options); limit > 0) builder.Limit(limit);
  const auto pipeline = builder.Build();
  const auto deadline = DeadlineFor(options);

  auto tx    = repository_->BeginRead();
  auto rows  = repository_->Aggregate(*tx, pipeline, deadline);
  auto names = OpeningNames(*repository_, *tx);

  std::vector<OpeningStats> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    OpeningStats s;
    s.eco_code   = GetString(row, "eco_code");
    s.games      = static_cast<uint64_t>(GetInt(row, "games"));
    s.white_wins = static_cast<uint64_t>(GetInt(row, "white_wins"));
    s.black_wins = static_cast<uint64_t>(GetInt(row, "black_wins"));
    s.draws      = static_cast<uint64_t>(GetInt(row, "draws"));

    s.white_win_rate  = Rate(s.white_wins, s.games);
    s.black_win_rate  = Rate(s.black_wins, s.games);
    s.draw_rate       = Rate(s.draws, s.games);
    s.white_advantage = s.white_win_rate - s.black_win_rate;
    s.avg_rating      = MeanOf(GetOptionalDouble(row, "avg_white_rating"), GetOptionalDouble(row, "avg_black_rating"));

    if (auto it = names.find(s.eco_code); it != names.end()) s.opening_name = it->second;
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<TrendPoint> AnalyticsEngine::RatingTrend(const std::string& player_name, const QueryOptions& options) {
  const auto deadline = DeadlineFor(options);

  auto tx     = repository_->BeginRead();
  auto player = repository_->FindPlayerByKey(*tx, util::NormalizeName(player_name));
  if (!player) return {};

  auto filtered = [&](PipelineBuilder& b) -> PipelineBuilder& {
    b.Match("player_id", CompareOp::kEq, player->id);
    if (options.time_control) b.Match("time_control", CompareOp::kEq, static_cast<int64_t>(*options.time_control));
    return b;
  };

  if (options.min_games) {
    PipelineBuilder count(Collection::kRatingHistory);
    filtered(count).Group({}, {acc::Count("points")});
    auto rows = repository_->Aggregate(*tx, count.Build(), deadline);
    const auto points = rows.empty() ? 0 : static_cast<uint64_t>(GetInt(rows.front(), "points"));
    if (points < *options.min_games) return {};
  }

  PipelineBuilder builder(Collection::kRatingHistory);
  filtered(builder);
  if (options.limit) {
    builder.SortBy("timestamp_ms", true).SortBy("seq", true).Limit(*options.limit);
  } else {
    builder.SortBy("timestamp_ms").SortBy("seq");
  }

  auto rows = repository_->Aggregate(*tx, builder.Build(), deadline);

  std::vector<TrendPoint> out;
  out.reserve(rows.size());
  for (const auto& row : rows) out.push_back(ToTrendPoint(row));
  if (options.limit) std::reverse(out.begin(), out.end());
  return out;
}

std::vector<TimeControlStats> AnalyticsEngine::TimeControlComparison(const QueryOptions& options) {
  PipelineBuilder builder(Collection::kGames);
  if (options.time_control) builder.Match("time_control", CompareOp::kEq, static_cast<int64_t>(*options.time_control));
  builder.Group({"time_control"}, OutcomeAccumulators())
      .Having("games", CompareOp::kGe, static_cast<int64_t>(MinGames(options)))
      .SortBy("games", true)
      .SortBy("time_control");
  if (options.limit) builder.Limit(*options.limit);
  const auto pipeline = builder.Build();

  auto tx   = repository_->BeginRead();
  auto rows = repository_->Aggregate(*tx, pipeline, DeadlineFor(options));

  std::vector<TimeControlStats> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    TimeControlStats s;
    s.time_control = static_cast<chessdb::v1::TimeControlClass>(GetInt(row, "time_control"));
    s.games        = static_cast<uint64_t>(GetInt(row, "games"));
    s.white_wins   = static_cast<uint64_t>(GetInt(row, "white_wins"));
    s.black_wins   = static_cast<uint64_t>(GetInt(row, "black_wins"));
    s.draws        = static_cast<uint64_t>(GetInt(row, "draws"));

    s.white_win_rate = Rate(s.white_wins, s.games);
    s.black_win_rate = Rate(s.black_wins, s.games);
    s.draw_rate      = Rate(s.draws, s.games);
    s.avg_rating     = MeanOf(GetOptionalDouble(row, "avg_white_rating"), GetOptionalDouble(row, "avg_black_rating"));
    out.push_back(s);
  }
  return out;
}

std::vector<RepertoireEntry> AnalyticsEngine::PlayerRepertoire(const std::string& player_name, chessdb::v1::Color color,
                                                               const QueryOptions& options) {
  if (color != chessdb::v1::COLOR_WHITE && color != chessdb::v1::COLOR_BLACK) {
    throw util::InvalidArgument("repertoire: color must be white or black");
  }
  const bool as_white = color == chessdb::v1::COLOR_WHITE;
  const auto win      = as_white ? chessdb::v1::GAME_RESULT_WHITE_WIN : chessdb::v1::GAME_RESULT_BLACK_WIN;
  const auto loss     = as_white ? chessdb::v1::GAME_RESULT_BLACK_WIN : chessdb::v1::GAME_RESULT_WHITE_WIN;
  const auto deadline = DeadlineFor(options);

  auto tx     = repository_->BeginRead();
  auto player = repository_->FindPlayerByKey(*tx, util::NormalizeName(player_name));
  if (!player) return {};

  PipelineBuilder builder(Collection::kGames);
  builder.Match(as_white ? "white_player_id" : "black_player_id", CompareOp::kEq, player->id);
  if (options.time_control) builder.Match("time_control", CompareOp::kEq, static_cast<int64_t>(*options.time_control));
  builder
      .Group({"eco_code"},
             {acc::Count("games"), acc::CountIf("wins", "result", ResultValue(win)),
              acc::CountIf("draws", "result", ResultValue(chessdb::v1::GAME_RESULT_DRAW)), acc::CountIf("losses", "result", ResultValue(loss)),
              acc::Max("last_played_ms", "date_ms")})
      .Having("games", CompareOp::kGe, static_cast<int64_t>(MinGames(options)))
      .SortBy("games", true)
      .SortBy("eco_code");
  if (options.limit) builder.Limit(*options.limit);

  auto rows  = repository_->Aggregate(*tx, builder.Build(), deadline);
  auto names = OpeningNames(*repository_, *tx);

  std::vector<RepertoireEntry> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    RepertoireEntry e;
    e.eco_code       = GetString(row, "eco_code");
    e.games          = static_cast<uint64_t>(GetInt(row, "games"));
    e.wins           = static_cast<uint64_t>(GetInt(row, "wins"));
    e.draws          = static_cast<uint64_t>(GetInt(row, "draws"));
    e.losses         = static_cast<uint64_t>(GetInt(row, "losses"));
    e.last_played_ms = GetInt(row, "last_played_ms");
    e.win_rate       = Rate(e.wins, e.games);
    e.score_rate     = e.games == 0 ? 0.0 : (static_cast<double>(e.wins) + 0.5 * static_cast<double>(e.draws)) / static_cast<double>(e.games);

    if (auto it = names.find(e.eco_code); it != names.end()) e.opening_name = it->second;
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<VolatilityEntry> AnalyticsEngine::RatingVolatility(const QueryOptions& options) {
  const uint64_t min_points = std::max<uint64_t>(MinGames(options), 2);

  PipelineBuilder builder(Collection::kRatingHistory);
  if (options.time_control) builder.Match("time_control", CompareOp::kEq, static_cast<int64_t>(*options.time_control));
  builder.Delta("rating", "player_id", {"timestamp_ms", "seq"}, "rating_delta")
      .Group({"player_id"}, {acc::Count("points"), acc::StdDevPop("rating_stddev", "rating_delta"), acc::Avg("avg_rating", "rating"),
                             acc::Min("min_rating", "rating"), acc::Max("max_rating", "rating")})
      .Having("points", CompareOp::kGe, static_cast<int64_t>(min_points))
      .SortBy("rating_stddev", true)
      .SortBy("player_id");
  if (const auto limit = Limit(options); limit > 0) builder.Limit(limit);
  const auto pipeline = builder.Build();

  auto tx   = repository_->BeginRead();
  auto rows = repository_->Aggregate(*tx, pipeline, DeadlineFor(options));

  std::vector<VolatilityEntry> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    VolatilityEntry e;
    e.player_id     = GetString(row, "player_id");
    e.points        = static_cast<uint64_t>(GetInt(row, "points"));
    e.rating_stddev = GetDouble(row, "rating_stddev");
    e.avg_rating    = GetDouble(row, "avg_rating");
    e.min_rating    = static_cast<int32_t>(GetInt(row, "min_rating"));
    e.max_rating    = static_cast<int32_t>(GetInt(row, "max_rating"));

    if (auto player = repository_->FindPlayerById(*tx, e.player_id)) e.display_name = player->display_name;
    out.push_back(std::move(e));
  }
  return out;
}

std::optional<PlayerProfile> AnalyticsEngine::FindPlayer(const std::string& player_name, const QueryOptions& options) {
  const auto deadline = DeadlineFor(options);

  auto tx     = repository_->BeginRead();
  auto player = repository_->FindPlayerByKey(*tx, util::NormalizeName(player_name));
  if (!player) return std::nullopt;

  PipelineBuilder count(Collection::kRatingHistory);
  count.Match("player_id", CompareOp::kEq, player->id).Group({}, {acc::Count("points")});
  auto counted = repository_->Aggregate(*tx, count.Build(), deadline);

  PipelineBuilder recent(Collection::kRatingHistory);
  recent.Match("player_id", CompareOp::kEq, player->id)
      .SortBy("timestamp_ms", true)
      .SortBy("seq", true)
      .Limit(options.limit.value_or(kProfileRecentPoints));
  auto rows = repository_->Aggregate(*tx, recent.Build(), deadline);

  PlayerProfile profile;
  profile.player        = std::move(*player);
  profile.rating_points = counted.empty() ? 0 : static_cast<uint64_t>(GetInt(counted.front(), "points"));
  for (const auto& row : rows) profile.recent.push_back(ToTrendPoint(row));
  std::reverse(profile.recent.begin(), profile.recent.end());
  return profile;
}

StatusReport AnalyticsEngine::Status() {
  auto tx = repository_->BeginRead();

  StatusReport report;
  report.counts      = repository_->Counts(*tx);
  report.last_import = repository_->LastImportRun(*tx);
  return report;
}

VerifyReport AnalyticsEngine::VerifyOpeningCounters(const QueryOptions& options) {
  PipelineBuilder builder(Collection::kGames);
  builder.Group({"eco_code"}, {acc::Count("games"), acc::CountIf("white_wins", "result", ResultValue(chessdb::v1::GAME_RESULT_WHITE_WIN)),
                               acc::CountIf("black_wins", "result", ResultValue(chessdb::v1::GAME_RESULT_BLACK_WIN)),
                               acc::CountIf("draws", "result", ResultValue(chessdb::v1::GAME_RESULT_DRAW)),
                               acc::Sum("white_rating_sum", "white_rating"), acc::Sum("black_rating_sum", "black_rating")});
  const auto pipeline = builder.Build();

  auto tx       = repository_->BeginRead();
  auto rows     = repository_->Aggregate(*tx, pipeline, DeadlineFor(options));
  auto openings = repository_->ListOpenings(*tx);

  std::map<std::string, db::model::OpeningRecord> recomputed;
  for (const auto& row : rows) {
    db::model::OpeningRecord r;
    r.eco_code         = GetString(row, "eco_code");
    r.games            = static_cast<uint64_t>(GetInt(row, "games"));
    r.white_wins       = static_cast<uint64_t>(GetInt(row, "white_wins"));
    r.black_wins       = static_cast<uint64_t>(GetInt(row, "black_wins"));
    r.draws            = static_cast<uint64_t>(GetInt(row, "draws"));
    r.white_rating_sum = GetInt(row, "white_rating_sum");
    r.black_rating_sum = GetInt(row, "black_rating_sum");
    recomputed.emplace(r.eco_code, std::move(r));
  }

  auto same = [](const db::model::OpeningRecord& a, const db::model::OpeningRecord& b) {
    return a.games == b.games && a.white_wins == b.white_wins && a.black_wins == b.black_wins && a.draws == b.draws &&
           a.white_rating_sum == b.white_rating_sum && a.black_rating_sum == b.black_rating_sum;
  };

  VerifyReport report;
  for (const auto& stored : openings) {
    ++report.openings_checked;
    db::model::OpeningRecord expected;
    expected.eco_code = stored.eco_code;
    if (auto it = recomputed.find(stored.eco_code); it != recomputed.end()) {
      expected = it->second;
      recomputed.erase(it);
    }
    if (!same(stored, expected)) report.mismatches.push_back(CounterMismatch{stored.eco_code, stored, expected});
  }
  // games pointing at an opening row that does not exist
  for (auto& [eco, expected] : recomputed) {
    db::model::OpeningRecord stored;
    stored.eco_code = eco;
    report.mismatches.push_back(CounterMismatch{eco, stored, expected});
  }

  for (const auto& m : report.mismatches) {
    CHESSDB_LOG_WARN("Opening counter mismatch", {observability::StringField("eco", m.eco_code),
                                                  observability::UIntField("stored_games", m.stored.games),
                                                  observability::UIntField("recomputed_games", m.recomputed.games)});
  }
  return report;
}

} // namespace chessdb::analytics
