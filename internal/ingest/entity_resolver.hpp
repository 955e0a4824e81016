#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/game_record.hpp"

namespace chessdb::ingest {

struct ResolvedBatch {
  // upsert order = first touch within the batch
  std::vector<db::model::PlayerRecord>      players;
  std::vector<db::model::OpeningDelta>      openings;
  std::vector<db::model::GameRow>           games;
  std::vector<db::model::RatingPointRecord> rating_points;

  uint64_t new_players    = 0;
  uint64_t new_openings   = 0;
  uint64_t name_conflicts = 0;
};

/*
  EntityResolver

  Maps natural keys to identities inside the caller's write
  transaction. Games are visited in stable played-at order; a per-batch
  cache makes every occurrence of a key resolve to one identity, also
  when the player is new in this batch.

  Player merge:
    games_played += 1, peak = max(peak, rating)
    played_at >= last rated game: current rating moves, history point
    older game: counted only
  Opening merge: counters incremented by the batch contribution.

  A key seen with another spelling keeps the existing identity and is
  counted as a name conflict.
*/
class EntityResolver {
 public:
  using WallClock = std::function<int64_t()>;

  EntityResolver();
  explicit EntityResolver(WallClock now);

  // Reads through repo; throws db::DbError on read failure.
  ResolvedBatch Resolve(db::Repository& repo, db::Transaction& tx, const std::vector<const model::GameRecord*>& games) const;

 private:
  WallClock now_;
};

} // namespace chessdb::ingest
