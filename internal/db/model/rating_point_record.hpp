#pragma once

#include <cstdint>
#include <string>

#include "chessdb/v1.hpp"

namespace chessdb::db::model {

struct RatingPointRecord {
  std::string player_id;
  int64_t     timestamp_ms = 0;
  int32_t     rating       = 0;

  // tie-break for equal timestamps, increasing per player
  uint64_t seq = 0;

  chessdb::v1::TimeControlClass time_control = chessdb::v1::TIME_CONTROL_UNKNOWN;
};

} // namespace chessdb::db::model
