#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "chessdb/v1.hpp"
#include "internal/ingest/pgn_reader.hpp"
#include "internal/model/game_record.hpp"

namespace chessdb::runtime::config {
class ValidationConfig;
}

namespace chessdb::ingest {

struct ValidationLimits {
  int32_t     min_rating      = 1;
  int32_t     max_rating      = 3500;
  uint32_t    min_plies       = 2;
  uint32_t    max_plies       = 500;
  std::size_t max_block_bytes = 1024 * 1024;

  // Largest accepted record estimate; 0 disables the check.
  std::size_t max_record_bytes = 0;

  static ValidationLimits FromConfig(const chessdb::runtime::config::ValidationConfig& config, std::size_t max_record_bytes);
};

struct ParserCounters {
  uint64_t total             = 0;
  uint64_t accepted          = 0;
  uint64_t rejected          = 0;
  uint64_t parse_errors      = 0;
  uint64_t validation_errors = 0;
};

/*
  RecordParser

  Pulls raw blocks from a PgnReader and turns each into exactly one
  ParseOutcome. Record-level problems never throw; they become
  Rejections and are counted. accepted + rejected == total always holds.
*/
class RecordParser {
 public:
  RecordParser(std::istream& in, ValidationLimits limits);

  // nullopt at end of input.
  std::optional<model::ParseOutcome> Next();

  const ParserCounters& Counters() const {
    return counters_;
  }

  bool InputFailed() const {
    return reader_.Failed();
  }

  static model::ParseOutcome ParseBlock(const RawBlock& block, const ValidationLimits& limits);

 private:
  PgnReader        reader_;
  ValidationLimits limits_;
  ParserCounters   counters_;
};

using TagMap = std::map<std::string, std::string>;

// Parses one or more [Name "Value"] tags on a line into *tags.
bool ParseTagLine(std::string_view line, TagMap* tags, std::string* error);

// "180+2" -> blitz. base + 40 * increment seconds; missing, "-" or
// unparsable values are unknown.
chessdb::v1::TimeControlClass ClassifyTimeControl(std::string_view value);

// "GM_Somebody" / "somebody-im" -> "GM" / "IM"; empty when no title affix.
std::string ExtractTitle(std::string_view username);

// "YYYY.MM.DD" with "??" month/day read as 01, plus optional "HH:MM:SS".
bool ParsePgnDate(std::string_view date, std::string_view utc_time, int64_t* unix_ms);

std::string BuildGameKey(const model::GameRecord& record);

} // namespace chessdb::ingest
