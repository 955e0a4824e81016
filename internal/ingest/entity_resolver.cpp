#include "internal/ingest/entity_resolver.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <string>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chessdb::ingest {

namespace {

struct WorkingPlayer {
  db::model::PlayerRecord record;
  std::size_t             order = 0;
};

struct WorkingOpening {
  db::model::OpeningDelta delta;
  std::size_t             order = 0;
};

} // namespace

EntityResolver::EntityResolver() : now_(util::NowMillis) {
}

EntityResolver::EntityResolver(WallClock now) : now_(std::move(now)) {
}

ResolvedBatch EntityResolver::Resolve(db::Repository& repo, db::Transaction& tx, const std::vector<const model::GameRecord*>& games) const {
  ResolvedBatch out;
  const int64_t now = now_();

  std::vector<std::size_t> order(games.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return games[a]->date_ms < games[b]->date_ms; });

  std::unordered_map<std::string, WorkingPlayer>  players;
  std::unordered_map<std::string, WorkingOpening> openings;

  auto resolve_player = [&](const model::GameRecord& game, const std::string& name, int32_t rating, const std::string& title) -> std::string {
    const auto key = util::NormalizeName(name);
    auto       it  = players.find(key);

    if (it == players.end()) {
      WorkingPlayer working;
      working.order = players.size();
      if (auto existing = repo.FindPlayerByKey(tx, key)) {
        working.record = std::move(*existing);
      } else {
        working.record.id            = util::NewId();
        working.record.name_key      = key;
        working.record.display_name  = name;
        working.record.first_seen_ms = now;
        ++out.new_players;
      }
      it = players.emplace(key, std::move(working)).first;
    }

    auto& p = it->second.record;
    if (p.display_name != name) {
      ++out.name_conflicts;
      CHESSDB_LOG_DEBUG("Player name variant resolved to existing identity",
                        {observability::StringField("key", key), observability::StringField("stored", p.display_name),
                         observability::StringField("seen", name)});
    }

    ++p.games_played;
    p.peak_rating = std::max(p.peak_rating, rating);
    if (p.title.empty() && !title.empty()) p.title = title;
    p.last_updated_ms = now;

    if (!p.last_game_at_ms || game.date_ms >= *p.last_game_at_ms) {
      p.current_rating  = rating;
      p.last_game_at_ms = game.date_ms;

      db::model::RatingPointRecord point;
      point.player_id    = p.id;
      point.timestamp_ms = game.date_ms;
      point.rating       = rating;
      point.seq          = p.games_played;
      point.time_control = game.time_control;
      out.rating_points.push_back(std::move(point));
    }
    return p.id;
  };

  for (auto idx : order) {
    const auto& game = *games[idx];

    db::model::GameRow row;
    row.game_key         = game.game_key;
    row.white_player_id  = resolve_player(game, game.white, game.white_rating, game.white_title);
    row.black_player_id  = resolve_player(game, game.black, game.black_rating, game.black_title);
    row.white_rating     = game.white_rating;
    row.black_rating     = game.black_rating;
    row.result           = game.result;
    row.date_ms          = game.date_ms;
    row.eco_code         = util::ToUpperAscii(util::Trim(game.eco_code));
    row.opening_name     = game.opening_name;
    row.time_control     = game.time_control;
    row.time_control_raw = game.time_control_raw;
    row.ply_count        = static_cast<uint32_t>(game.moves.size());
    row.event            = game.event;
    row.site             = game.site;
    for (const auto& move : game.moves) {
      if (!row.moves.empty()) row.moves.push_back(' ');
      row.moves += move;
    }

    auto op_it = openings.find(row.eco_code);
    if (op_it == openings.end()) {
      WorkingOpening working;
      working.order          = openings.size();
      working.delta.eco_code = row.eco_code;
      if (auto existing = repo.FindOpening(tx, row.eco_code)) {
        working.delta.name = existing->name;
      } else {
        ++out.new_openings;
      }
      op_it = openings.emplace(row.eco_code, std::move(working)).first;
    }

    auto& delta = op_it->second.delta;
    if (delta.name.empty()) delta.name = game.opening_name;
    ++delta.games;
    switch (game.result) {
      case v1::GAME_RESULT_WHITE_WIN:
        ++delta.white_wins;
        break;
      case v1::GAME_RESULT_BLACK_WIN:
        ++delta.black_wins;
        break;
      case v1::GAME_RESULT_DRAW:
        ++delta.draws;
        break;
      default:
        break;
    }
    delta.white_rating_sum += game.white_rating;
    delta.black_rating_sum += game.black_rating;

    out.games.push_back(std::move(row));
  }

  out.players.resize(players.size());
  for (auto& [_, working] : players) out.players[working.order] = std::move(working.record);
  out.openings.resize(openings.size());
  for (auto& [_, working] : openings) out.openings[working.order] = std::move(working.delta);

  return out;
}

} // namespace chessdb::ingest
