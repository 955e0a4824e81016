#pragma once

#include <cstdint>
#include <string>

#include "chessdb/v1.hpp"

namespace chessdb::db::model {

/*
  A committed game with resolved player and opening references.
*/
struct GameRow {
  std::string game_key;

  std::string white_player_id;
  std::string black_player_id;
  int32_t     white_rating = 0;
  int32_t     black_rating = 0;

  chessdb::v1::GameResult result = chessdb::v1::GAME_RESULT_UNSPECIFIED;
  int64_t                 date_ms = 0;

  std::string eco_code;
  std::string opening_name;

  chessdb::v1::TimeControlClass time_control = chessdb::v1::TIME_CONTROL_UNKNOWN;
  std::string                   time_control_raw;

  uint32_t    ply_count = 0;
  std::string event;
  std::string site;
  std::string moves;
};

} // namespace chessdb::db::model
