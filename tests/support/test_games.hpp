#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/ingest/record_parser.hpp"
#include "internal/model/game_record.hpp"

namespace chessdb::testing {

struct GameSpec {
  std::string white        = "Alice";
  std::string black        = "Bob";
  int         white_elo    = 1500;
  int         black_elo    = 1500;
  std::string result       = "1-0";
  std::string date         = "2024.01.15";
  std::string utc_time     = "12:00:00";
  std::string eco          = "C50";
  std::string opening      = "Italian Game";
  std::string time_control = "300+0";
  std::string moves        = "1. e4 e5 2. Nf3 Nc6 3. Bc4 Bc5";
};

inline std::string Pgn(const GameSpec& g) {
  std::string out;
  out += "[Event \"Rated Blitz game\"]\n";
  out += "[Site \"https://example.org/game\"]\n";
  out += "[Date \"" + g.date + "\"]\n";
  if (!g.utc_time.empty()) out += "[UTCTime \"" + g.utc_time + "\"]\n";
  out += "[White \"" + g.white + "\"]\n";
  out += "[Black \"" + g.black + "\"]\n";
  out += "[Result \"" + g.result + "\"]\n";
  out += "[WhiteElo \"" + std::to_string(g.white_elo) + "\"]\n";
  out += "[BlackElo \"" + std::to_string(g.black_elo) + "\"]\n";
  out += "[ECO \"" + g.eco + "\"]\n";
  out += "[Opening \"" + g.opening + "\"]\n";
  out += "[TimeControl \"" + g.time_control + "\"]\n";
  out += "\n";
  out += g.moves + " " + g.result + "\n";
  out += "\n";
  return out;
}

inline std::string Pgn(const std::vector<GameSpec>& games) {
  std::string out;
  for (const auto& g : games) out += Pgn(g);
  return out;
}

// Block that fails tag parsing.
inline std::string MalformedPgn() {
  return "[Event \"Broken\"\n"
         "[White \"Nobody\"]\n"
         "\n"
         "1. e4 e5 1-0\n"
         "\n";
}

// Tag section with no movetext, as left by a truncated export.
inline std::string TagsOnlyPgn() {
  return "[Event \"Truncated\"]\n"
         "[White \"Eve\"]\n"
         "[Black \"Mallory\"]\n"
         "[Result \"1-0\"]\n"
         "\n";
}

// Text between games that belongs to no tag section.
inline std::string StrayTextPgn() {
  return "this is not a game at all\n\n";
}

inline std::string CommentOnlyPgn() {
  return "{ annotated by the club archive }\n\n";
}

inline chessdb::v1::GameResult ResultOf(const std::string& tag) {
  if (tag == "1-0") return chessdb::v1::GAME_RESULT_WHITE_WIN;
  if (tag == "0-1") return chessdb::v1::GAME_RESULT_BLACK_WIN;
  return chessdb::v1::GAME_RESULT_DRAW;
}

// Parsed record without going through text.
inline model::GameRecord Record(const std::string& white, const std::string& black, int32_t white_elo, int32_t black_elo, int64_t date_ms,
                                const std::string& eco = "C50", const std::string& result = "1-0") {
  model::GameRecord r;
  r.white        = white;
  r.black        = black;
  r.white_rating = white_elo;
  r.black_rating = black_elo;
  r.result       = ResultOf(result);
  r.date_ms      = date_ms;
  r.eco_code     = eco;
  r.opening_name = eco + " opening";
  r.time_control = chessdb::v1::TIME_CONTROL_BLITZ;
  r.moves        = {"e4", "e5", "Nf3", "Nc6"};
  r.game_key     = ingest::BuildGameKey(r);
  return r;
}

constexpr int64_t kDay = 24LL * 3600 * 1000;

// 2024-01-01T00:00:00Z
constexpr int64_t kBaseMs = 1704067200000LL;

} // namespace chessdb::testing
