#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "chessdb/v1.hpp"

namespace chessdb::model {

/*
  A parsed, validated game. Immutable once produced by the parser.
*/
struct GameRecord {
  std::string white;
  std::string black;
  int32_t     white_rating = 0;
  int32_t     black_rating = 0;

  chessdb::v1::GameResult result = chessdb::v1::GAME_RESULT_UNSPECIFIED;

  // UTC, from Date plus optional UTCTime
  int64_t date_ms = 0;

  std::string eco_code;
  std::string opening_name;

  chessdb::v1::TimeControlClass time_control = chessdb::v1::TIME_CONTROL_UNKNOWN;
  std::string                   time_control_raw;

  std::vector<std::string> moves; // SAN, annotations stripped

  std::string event;
  std::string site;
  std::string white_title;
  std::string black_title;

  // normalized white|black|date|plies|move hash
  std::string game_key;

  // 1-based position of the source block
  uint64_t ordinal = 0;

  std::size_t EstimatedBytes() const {
    std::size_t bytes = sizeof(GameRecord);
    for (const auto* s : {&white, &black, &eco_code, &opening_name, &time_control_raw, &event, &site, &white_title, &black_title, &game_key}) {
      bytes += s->capacity();
    }
    bytes += moves.capacity() * sizeof(std::string);
    for (const auto& m : moves) bytes += m.capacity();
    return bytes;
  }
};

struct Rejection {
  chessdb::v1::RejectReason reason = chessdb::v1::REJECT_REASON_UNSPECIFIED;
  std::string               detail;
  std::string               raw_block;
  uint64_t                  ordinal    = 0;
  uint64_t                  start_line = 0;
};

using ParseOutcome = std::variant<GameRecord, Rejection>;

} // namespace chessdb::model
