#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chessdb::db::model {

struct PlayerRecord {
  std::string id;
  std::string name_key;
  std::string display_name;
  std::string title;

  int32_t  current_rating = 0;
  int32_t  peak_rating    = 0;
  uint64_t games_played   = 0;

  int64_t first_seen_ms   = 0;
  int64_t last_updated_ms = 0;

  // played-at of the newest game that moved current_rating
  std::optional<int64_t> last_game_at_ms;
};

} // namespace chessdb::db::model
