#include "internal/ingest/record_parser.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "support/test_games.hpp"

namespace {

using chessdb::ingest::RecordParser;
using chessdb::ingest::ValidationLimits;
using chessdb::model::GameRecord;
using chessdb::model::ParseOutcome;
using chessdb::model::Rejection;
using chessdb::testing::GameSpec;
using chessdb::testing::Pgn;

std::vector<ParseOutcome> ParseAll(const std::string& text, ValidationLimits limits = {}) {
  std::istringstream        in(text);
  RecordParser              parser(in, limits);
  std::vector<ParseOutcome> out;
  while (auto outcome = parser.Next()) out.push_back(std::move(*outcome));
  assert(parser.Counters().accepted + parser.Counters().rejected == parser.Counters().total);
  assert(parser.Counters().total == out.size());
  return out;
}

chessdb::v1::RejectReason ReasonOf(const std::string& text, ValidationLimits limits = {}) {
  auto outcomes = ParseAll(text, limits);
  assert(outcomes.size() == 1);
  const auto* rejection = std::get_if<Rejection>(&outcomes.front());
  assert(rejection != nullptr);
  return rejection->reason;
}

void TestValidGame() {
  GameSpec spec;
  spec.white        = "  GM_Magnus   Carlsen ";
  spec.time_control = "180+2";
  auto outcomes     = ParseAll(Pgn(spec));
  assert(outcomes.size() == 1);

  const auto& g = std::get<GameRecord>(outcomes.front());
  assert(g.white == "GM_Magnus Carlsen");
  assert(g.black == "Bob");
  assert(g.white_rating == 1500);
  assert(g.result == chessdb::v1::GAME_RESULT_WHITE_WIN);
  assert(g.eco_code == "C50");
  assert(g.opening_name == "Italian Game");
  assert(g.moves.size() == 6);
  assert(g.time_control == chessdb::v1::TIME_CONTROL_BLITZ);
  assert(g.white_title == "GM");
  assert(g.black_title.empty());
  // 2024-01-15T12:00:00Z
  assert(g.date_ms == 1705320000000LL);
  assert(g.ordinal == 1);
  assert(!g.game_key.empty());
}

void TestRejectReasons() {
  using namespace chessdb::v1;

  GameSpec missing_eco;
  missing_eco.eco = "";
  assert(ReasonOf(Pgn(missing_eco)) == REJECT_REASON_MISSING_TAG);

  GameSpec bad_result;
  bad_result.result = "2-0";
  bad_result.moves  = "1. e4 e5";
  {
    // movetext ends with the valid marker, tag carries the invalid result
    std::string text = Pgn(bad_result);
    const auto  pos  = text.find("e5 2-0");
    text.replace(pos, 6, "e5 1-0");
    assert(ReasonOf(text) == REJECT_REASON_INVALID_RESULT);
  }

  GameSpec high;
  high.white_elo = 4000;
  assert(ReasonOf(Pgn(high)) == REJECT_REASON_RATING_OUT_OF_RANGE);

  GameSpec zero;
  zero.black_elo = 0;
  assert(ReasonOf(Pgn(zero)) == REJECT_REASON_INVALID_RATING);

  GameSpec bad_date;
  bad_date.date = "2023.02.30";
  assert(ReasonOf(Pgn(bad_date)) == REJECT_REASON_INVALID_DATE);

  GameSpec unknown_year;
  unknown_year.date = "????.01.01";
  assert(ReasonOf(Pgn(unknown_year)) == REJECT_REASON_INVALID_DATE);

  GameSpec bad_eco;
  bad_eco.eco = "F12";
  assert(ReasonOf(Pgn(bad_eco)) == REJECT_REASON_INVALID_ECO);

  GameSpec short_game;
  short_game.moves = "1. e4";
  assert(ReasonOf(Pgn(short_game)) == REJECT_REASON_MOVE_COUNT_OUT_OF_RANGE);

  GameSpec same;
  same.black = "ALICE";
  assert(ReasonOf(Pgn(same)) == REJECT_REASON_SAME_PLAYER);

  GameSpec bad_moves;
  bad_moves.moves = "1. e4 e5 2. Zz9";
  assert(ReasonOf(Pgn(bad_moves)) == REJECT_REASON_MALFORMED_MOVETEXT);

  assert(ReasonOf(chessdb::testing::MalformedPgn()) == REJECT_REASON_MALFORMED_TAG);
}

void TestResultMismatch() {
  std::string text = Pgn(GameSpec{});
  const auto  pos  = text.find("Bc5 1-0");
  text.replace(pos, 7, "Bc5 0-1");
  assert(ReasonOf(text) == chessdb::v1::REJECT_REASON_RESULT_MISMATCH);

  std::string unfinished = Pgn(GameSpec{});
  unfinished.replace(unfinished.find("Bc5 1-0"), 7, "Bc5 *");
  assert(ReasonOf(unfinished) == chessdb::v1::REJECT_REASON_RESULT_MISMATCH);
}

void TestUnknownMonthAndDay() {
  GameSpec spec;
  spec.date     = "2024.??.??";
  spec.utc_time = "";
  auto outcomes = ParseAll(Pgn(spec));
  assert(std::get<GameRecord>(outcomes.front()).date_ms == 1704067200000LL);
}

void TestOversizedBlock() {
  GameSpec spec;
  spec.opening = std::string(4096, 'x');

  ValidationLimits limits;
  limits.max_block_bytes = 1024;

  auto outcomes = ParseAll(Pgn(spec) + Pgn(GameSpec{}), limits);
  assert(outcomes.size() == 2);
  const auto& rejection = std::get<Rejection>(outcomes[0]);
  assert(rejection.reason == chessdb::v1::REJECT_REASON_BLOCK_TOO_LARGE);
  assert(rejection.raw_block.size() <= 1024);
  assert(std::holds_alternative<GameRecord>(outcomes[1]));
}

void TestRecordTooLarge() {
  ValidationLimits limits;
  limits.max_record_bytes = 64;
  assert(ReasonOf(Pgn(GameSpec{}), limits) == chessdb::v1::REJECT_REASON_RECORD_TOO_LARGE);
}

void TestMixedStreamCounts() {
  GameSpec second;
  second.white = "Carol";
  GameSpec bad;
  bad.eco = "Z99";

  const std::string text = Pgn(GameSpec{}) + chessdb::testing::MalformedPgn() + Pgn(second) + Pgn(bad);

  std::istringstream in(text);
  RecordParser       parser(in, ValidationLimits{});
  std::vector<bool>  accepted;
  uint64_t           last_line = 0;
  while (auto outcome = parser.Next()) {
    accepted.push_back(std::holds_alternative<GameRecord>(*outcome));
    if (const auto* r = std::get_if<Rejection>(&*outcome)) {
      assert(r->start_line > last_line);
      last_line = r->start_line;
    }
  }

  assert((accepted == std::vector<bool>{true, false, true, false}));
  const auto& c = parser.Counters();
  assert(c.total == 4);
  assert(c.accepted == 2);
  assert(c.rejected == 2);
  assert(c.parse_errors == 1);
  assert(c.validation_errors == 1);
}

void TestIrregularBlocksAreSeparated() {
  using chessdb::testing::CommentOnlyPgn;
  using chessdb::testing::StrayTextPgn;
  using chessdb::testing::TagsOnlyPgn;

  GameSpec carol;
  carol.white = "Carol";
  GameSpec dave;
  dave.white = "Dave";

  // tags-only block followed by full games
  {
    auto outcomes = ParseAll(Pgn(GameSpec{}) + TagsOnlyPgn() + Pgn(carol) + Pgn(dave));
    assert(outcomes.size() == 4);
    assert(std::get<GameRecord>(outcomes[0]).white == "Alice");
    const auto& r = std::get<Rejection>(outcomes[1]);
    assert(r.reason == chessdb::v1::REJECT_REASON_MALFORMED_MOVETEXT);
    assert(r.raw_block.find("Mallory") != std::string::npos);
    assert(std::get<GameRecord>(outcomes[2]).white == "Carol");
    assert(std::get<GameRecord>(outcomes[3]).white == "Dave");
  }

  // stray text and a lone comment between games
  {
    auto outcomes = ParseAll(Pgn(GameSpec{}) + StrayTextPgn() + Pgn(carol) + CommentOnlyPgn() + Pgn(dave));
    assert(outcomes.size() == 5);
    assert(std::get<GameRecord>(outcomes[0]).white == "Alice");
    assert(std::get<Rejection>(outcomes[1]).reason == chessdb::v1::REJECT_REASON_MISSING_TAG);
    assert(std::get<Rejection>(outcomes[1]).ordinal == 2);
    assert(std::get<GameRecord>(outcomes[2]).white == "Carol");
    assert(std::get<Rejection>(outcomes[3]).reason == chessdb::v1::REJECT_REASON_MISSING_TAG);
    assert(std::get<GameRecord>(outcomes[4]).white == "Dave");
  }

  // stray text before the first game
  {
    auto outcomes = ParseAll(StrayTextPgn() + Pgn(GameSpec{}));
    assert(outcomes.size() == 2);
    assert(std::holds_alternative<Rejection>(outcomes[0]));
    assert(std::holds_alternative<GameRecord>(outcomes[1]));
  }
}

void TestDateFieldsMustBeDigits() {
  int64_t ms = 0;
  assert(chessdb::ingest::ParsePgnDate("2024.01.15", "", &ms));
  assert(!chessdb::ingest::ParsePgnDate("-100.01.01", "", &ms));
  assert(!chessdb::ingest::ParsePgnDate("+202.01.01", "", &ms));
  assert(!chessdb::ingest::ParsePgnDate("2024.-1.15", "", &ms));
  assert(!chessdb::ingest::ParsePgnDate("2024.01.15", "-1:00:00", &ms));

  GameSpec negative_year;
  negative_year.date = "-100.01.01";
  assert(ReasonOf(Pgn(negative_year)) == chessdb::v1::REJECT_REASON_INVALID_DATE);
}

void TestCommentedTagLinesStayInBlock() {
  std::string text = Pgn(GameSpec{});
  text.replace(text.find("1. e4"), 5, "1. e4 {\n[not a tag]\n}");
  auto outcomes = ParseAll(text);
  assert(outcomes.size() == 1);
  assert(std::holds_alternative<GameRecord>(outcomes.front()));
}

void TestTimeControlAndTitles() {
  using namespace chessdb::v1;
  assert(chessdb::ingest::ClassifyTimeControl("60+0") == TIME_CONTROL_BULLET);
  assert(chessdb::ingest::ClassifyTimeControl("120+2") == TIME_CONTROL_BLITZ);
  assert(chessdb::ingest::ClassifyTimeControl("600+0") == TIME_CONTROL_RAPID);
  assert(chessdb::ingest::ClassifyTimeControl("1800+20") == TIME_CONTROL_CLASSICAL);
  assert(chessdb::ingest::ClassifyTimeControl("-") == TIME_CONTROL_UNKNOWN);
  assert(chessdb::ingest::ClassifyTimeControl("") == TIME_CONTROL_UNKNOWN);
  assert(chessdb::ingest::ClassifyTimeControl("abc") == TIME_CONTROL_UNKNOWN);

  assert(chessdb::ingest::ExtractTitle("im_Someone") == "IM");
  assert(chessdb::ingest::ExtractTitle("someone-WGM") == "WGM");
  assert(chessdb::ingest::ExtractTitle("GMan").empty());
}

} // namespace

int main() {
  TestValidGame();
  TestRejectReasons();
  TestResultMismatch();
  TestUnknownMonthAndDay();
  TestOversizedBlock();
  TestRecordTooLarge();
  TestMixedStreamCounts();
  TestIrregularBlocksAreSeparated();
  TestDateFieldsMustBeDigits();
  TestCommentedTagLinesStayInBlock();
  TestTimeControlAndTitles();

  std::cout << "chessdb_unit_record_parser: pass\n";
  return 0;
}
