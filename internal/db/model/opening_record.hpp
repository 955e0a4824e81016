#pragma once

#include <cstdint>
#include <string>

namespace chessdb::db::model {

struct OpeningRecord {
  std::string eco_code;
  std::string name;

  uint64_t games      = 0;
  uint64_t white_wins = 0;
  uint64_t black_wins = 0;
  uint64_t draws      = 0;

  int64_t white_rating_sum = 0;
  int64_t black_rating_sum = 0;
};

/*
  Per-batch contribution to one opening.
  Applied as an increment; name only fills an empty canonical name.
*/
struct OpeningDelta {
  std::string eco_code;
  std::string name;

  uint64_t games      = 0;
  uint64_t white_wins = 0;
  uint64_t black_wins = 0;
  uint64_t draws      = 0;

  int64_t white_rating_sum = 0;
  int64_t black_rating_sum = 0;
};

} // namespace chessdb::db::model
