#include "internal/ingest/record_parser.hpp"

#include <cctype>
#include <charconv>
#include <utility>

#include "config/config.pb.h"
#include "internal/ingest/move_text.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

namespace chessdb::ingest {

namespace {

using chessdb::v1::RejectReason;

constexpr const char* kRequiredTags[] = {"White", "Black", "Result", "Date", "ECO", "WhiteElo", "BlackElo"};

model::Rejection Reject(const RawBlock& block, RejectReason reason, std::string detail) {
  model::Rejection r;
  r.reason     = reason;
  r.detail     = std::move(detail);
  r.raw_block  = block.text;
  r.ordinal    = block.ordinal;
  r.start_line = block.start_line;
  return r;
}

bool ParseInt(std::string_view text, int64_t* out) {
  if (text.empty()) return false;
  const auto* first = text.data();
  const auto* last  = text.data() + text.size();
  auto [ptr, ec]    = std::from_chars(first, last, *out);
  return ec == std::errc() && ptr == last;
}

// Fixed-width unsigned field: every character must be a digit.
bool ParseDigits(std::string_view text, int64_t* out) {
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return ParseInt(text, out);
}

bool ParseTwoDigits(std::string_view text, unsigned* out) {
  if (text == "??") {
    *out = 1;
    return true;
  }
  int64_t v = 0;
  if (text.size() != 2 || !ParseDigits(text, &v)) return false;
  *out = static_cast<unsigned>(v);
  return true;
}

std::optional<chessdb::v1::GameResult> ResultFromTag(std::string_view value) {
  if (value == "1-0") return chessdb::v1::GAME_RESULT_WHITE_WIN;
  if (value == "0-1") return chessdb::v1::GAME_RESULT_BLACK_WIN;
  if (value == "1/2-1/2") return chessdb::v1::GAME_RESULT_DRAW;
  return std::nullopt;
}

bool IsEcoCode(std::string_view eco) {
  return eco.size() == 3 && eco[0] >= 'A' && eco[0] <= 'E' && eco[1] >= '0' && eco[1] <= '9' && eco[2] >= '0' && eco[2] <= '9';
}

std::string TagOr(const TagMap& tags, const char* name) {
  auto it = tags.find(name);
  return it == tags.end() ? std::string{} : it->second;
}

std::string TitleFor(const TagMap& tags, const char* tag, const std::string& username) {
  auto value = util::Trim(TagOr(tags, tag));
  if (!value.empty() && value != "-" && value != "?") return value;
  return ExtractTitle(username);
}

} // namespace

ValidationLimits ValidationLimits::FromConfig(const chessdb::runtime::config::ValidationConfig& config, std::size_t max_record_bytes) {
  ValidationLimits limits;
  limits.min_rating       = static_cast<int32_t>(config.min_rating());
  limits.max_rating       = static_cast<int32_t>(config.max_rating());
  limits.min_plies        = config.min_plies();
  limits.max_plies        = config.max_plies();
  limits.max_block_bytes  = static_cast<std::size_t>(config.max_block_bytes());
  limits.max_record_bytes = max_record_bytes;
  return limits;
}

bool ParseTagLine(std::string_view line, TagMap* tags, std::string* error) {
  std::size_t i = 0;
  auto        skip_ws = [&] {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
  };
  auto fail = [&](const char* msg) {
    if (error) *error = msg;
    return false;
  };

  skip_ws();
  if (i == line.size()) return fail("empty tag line");

  while (i < line.size()) {
    if (line[i] != '[') return fail("tag must start with '['");
    ++i;
    skip_ws();

    const std::size_t name_start = i;
    while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_')) ++i;
    if (i == name_start) return fail("missing tag name");
    std::string name(line.substr(name_start, i - name_start));

    skip_ws();
    if (i == line.size() || line[i] != '"') return fail("missing tag value");
    ++i;

    std::string value;
    bool        closed = false;
    while (i < line.size()) {
      const char c = line[i++];
      if (c == '\\') {
        if (i == line.size()) return fail("dangling escape in tag value");
        const char next = line[i++];
        if (next != '"' && next != '\\') return fail("invalid escape in tag value");
        value.push_back(next);
        continue;
      }
      if (c == '"') {
        closed = true;
        break;
      }
      value.push_back(c);
    }
    if (!closed) return fail("unterminated tag value");

    skip_ws();
    if (i == line.size() || line[i] != ']') return fail("tag must end with ']'");
    ++i;
    skip_ws();

    (*tags)[std::move(name)] = std::move(value);
  }
  return true;
}

chessdb::v1::TimeControlClass ClassifyTimeControl(std::string_view value) {
  const auto trimmed = util::Trim(value);
  if (trimmed.empty() || trimmed == "-") return chessdb::v1::TIME_CONTROL_UNKNOWN;

  int64_t    base      = 0;
  int64_t    increment = 0;
  const auto plus      = trimmed.find('+');
  if (plus == std::string::npos) {
    if (!ParseInt(trimmed, &base)) return chessdb::v1::TIME_CONTROL_UNKNOWN;
  } else {
    if (!ParseInt(std::string_view(trimmed).substr(0, plus), &base)) return chessdb::v1::TIME_CONTROL_UNKNOWN;
    if (!ParseInt(std::string_view(trimmed).substr(plus + 1), &increment)) return chessdb::v1::TIME_CONTROL_UNKNOWN;
  }
  if (base < 0 || increment < 0) return chessdb::v1::TIME_CONTROL_UNKNOWN;

  const int64_t estimated = base + 40 * increment;
  if (estimated < 180) return chessdb::v1::TIME_CONTROL_BULLET;
  if (estimated < 600) return chessdb::v1::TIME_CONTROL_BLITZ;
  if (estimated < 1500) return chessdb::v1::TIME_CONTROL_RAPID;
  return chessdb::v1::TIME_CONTROL_CLASSICAL;
}

std::string ExtractTitle(std::string_view username) {
  static constexpr const char* kTitles[] = {"GM", "IM", "FM", "CM", "WGM", "WIM", "WFM", "WCM"};

  const auto upper = util::ToUpperAscii(username);
  for (const char* title : kTitles) {
    const std::string t(title);
    for (const char sep : {'_', '-'}) {
      if (upper.rfind(t + sep, 0) == 0) return t;
      const auto suffix = std::string(1, sep) + t;
      if (upper.size() >= suffix.size() && upper.compare(upper.size() - suffix.size(), suffix.size(), suffix) == 0) return t;
    }
  }
  return {};
}

bool ParsePgnDate(std::string_view date, std::string_view utc_time, int64_t* unix_ms) {
  const auto d = util::Trim(date);
  if (d.size() != 10 || d[4] != '.' || d[7] != '.') return false;

  int64_t  year  = 0;
  unsigned month = 0;
  unsigned day   = 0;
  if (!ParseDigits(std::string_view(d).substr(0, 4), &year)) return false;
  if (!ParseTwoDigits(std::string_view(d).substr(5, 2), &month)) return false;
  if (!ParseTwoDigits(std::string_view(d).substr(8, 2), &day)) return false;
  if (!util::IsValidCivilDate(static_cast<int>(year), month, day)) return false;

  int64_t    seconds = 0;
  const auto t       = util::Trim(utc_time);
  if (!t.empty()) {
    int64_t h = 0, m = 0, s = 0;
    if (t.size() != 8 || t[2] != ':' || t[5] != ':') return false;
    if (!ParseDigits(std::string_view(t).substr(0, 2), &h) || !ParseDigits(std::string_view(t).substr(3, 2), &m) ||
        !ParseDigits(std::string_view(t).substr(6, 2), &s)) {
      return false;
    }
    if (h > 23 || m > 59 || s > 60) return false;
    seconds = h * 3600 + m * 60 + s;
  }

  *unix_ms = (util::DaysFromCivil(static_cast<int>(year), month, day) * 86400 + seconds) * 1000;
  return true;
}

std::string BuildGameKey(const model::GameRecord& record) {
  util::Fnv1a hash;
  for (const auto& move : record.moves) {
    hash.Update(move);
    hash.Update(" ");
  }
  return util::NormalizeName(record.white) + "|" + util::NormalizeName(record.black) + "|" + std::to_string(record.date_ms) + "|" +
         std::to_string(record.moves.size()) + "|" + util::ToHex(hash.Digest());
}

model::ParseOutcome RecordParser::ParseBlock(const RawBlock& block, const ValidationLimits& limits) {
  if (block.truncated) {
    return Reject(block, v1::REJECT_REASON_BLOCK_TOO_LARGE, "block of " + std::to_string(block.bytes) + " bytes exceeds " + std::to_string(limits.max_block_bytes));
  }

  // split tag section / movetext
  TagMap      tags;
  std::string movetext;
  bool        in_movetext = false;
  std::size_t pos         = 0;
  const auto& text        = block.text;

  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    std::string_view line(text.data() + pos, end - pos);
    pos = end + 1;

    if (!in_movetext) {
      const auto first = line.find_first_not_of(" \t");
      if (first == std::string_view::npos) continue;
      if (line[first] == '[') {
        std::string error;
        if (!ParseTagLine(line, &tags, &error)) return Reject(block, v1::REJECT_REASON_MALFORMED_TAG, error);
        continue;
      }
      in_movetext = true;
    }
    movetext.append(line);
    movetext.push_back('\n');
  }

  // stray text between games
  if (tags.empty()) return Reject(block, v1::REJECT_REASON_MISSING_TAG, "block has no tag section");
  if (util::Trim(movetext).empty()) return Reject(block, v1::REJECT_REASON_MALFORMED_MOVETEXT, "missing movetext");

  MoveText    parsed_moves;
  std::string move_error;
  if (!ParseMoveText(movetext, &parsed_moves, &move_error)) {
    return Reject(block, v1::REJECT_REASON_MALFORMED_MOVETEXT, move_error);
  }

  for (const char* tag : kRequiredTags) {
    if (util::Trim(TagOr(tags, tag)).empty()) return Reject(block, v1::REJECT_REASON_MISSING_TAG, std::string("missing tag ") + tag);
  }

  model::GameRecord record;
  record.ordinal      = block.ordinal;
  record.white        = util::CollapseWhitespace(tags["White"]);
  record.black        = util::CollapseWhitespace(tags["Black"]);
  record.eco_code     = util::ToUpperAscii(util::Trim(tags["ECO"]));
  record.opening_name = util::Trim(TagOr(tags, "Opening"));
  record.event        = TagOr(tags, "Event");
  record.site         = TagOr(tags, "Site");

  const auto result = ResultFromTag(util::Trim(tags["Result"]));
  if (!result) return Reject(block, v1::REJECT_REASON_INVALID_RESULT, "result '" + tags["Result"] + "'");
  record.result = *result;

  for (auto [tag, target] : {std::pair{"WhiteElo", &record.white_rating}, std::pair{"BlackElo", &record.black_rating}}) {
    int64_t rating = 0;
    if (!ParseInt(util::Trim(tags[tag]), &rating) || rating <= 0) {
      return Reject(block, v1::REJECT_REASON_INVALID_RATING, std::string(tag) + " '" + tags[tag] + "'");
    }
    if (rating < limits.min_rating || rating > limits.max_rating) {
      return Reject(block, v1::REJECT_REASON_RATING_OUT_OF_RANGE, std::string(tag) + " " + std::to_string(rating));
    }
    *target = static_cast<int32_t>(rating);
  }

  if (!ParsePgnDate(tags["Date"], TagOr(tags, "UTCTime"), &record.date_ms)) {
    return Reject(block, v1::REJECT_REASON_INVALID_DATE, "date '" + tags["Date"] + "'");
  }

  if (!IsEcoCode(record.eco_code)) return Reject(block, v1::REJECT_REASON_INVALID_ECO, "eco '" + tags["ECO"] + "'");

  if (!parsed_moves.termination || *parsed_moves.termination != record.result) {
    return Reject(block, v1::REJECT_REASON_RESULT_MISMATCH, "termination marker contradicts Result tag");
  }

  const auto plies = parsed_moves.moves.size();
  if (plies < limits.min_plies || plies > limits.max_plies) {
    return Reject(block, v1::REJECT_REASON_MOVE_COUNT_OUT_OF_RANGE, std::to_string(plies) + " plies");
  }

  if (util::NormalizeName(record.white) == util::NormalizeName(record.black)) {
    return Reject(block, v1::REJECT_REASON_SAME_PLAYER, "white and black are the same player");
  }

  record.time_control_raw = util::Trim(TagOr(tags, "TimeControl"));
  record.time_control     = ClassifyTimeControl(record.time_control_raw);
  record.white_title      = TitleFor(tags, "WhiteTitle", record.white);
  record.black_title      = TitleFor(tags, "BlackTitle", record.black);
  record.moves            = std::move(parsed_moves.moves);
  record.game_key         = BuildGameKey(record);

  if (limits.max_record_bytes > 0 && record.EstimatedBytes() > limits.max_record_bytes) {
    return Reject(block, v1::REJECT_REASON_RECORD_TOO_LARGE,
                  "record estimate " + std::to_string(record.EstimatedBytes()) + " exceeds batch ceiling " + std::to_string(limits.max_record_bytes));
  }

  return record;
}

RecordParser::RecordParser(std::istream& in, ValidationLimits limits) : reader_(in, limits.max_block_bytes), limits_(limits) {
}

std::optional<model::ParseOutcome> RecordParser::Next() {
  auto block = reader_.Next();
  if (!block) return std::nullopt;

  auto outcome = ParseBlock(*block, limits_);
  ++counters_.total;

  if (const auto* rejection = std::get_if<model::Rejection>(&outcome)) {
    ++counters_.rejected;
    if (v1::IsParseError(rejection->reason)) {
      ++counters_.parse_errors;
    } else {
      ++counters_.validation_errors;
    }
    CHESSDB_LOG_DEBUG("Record rejected", {observability::StringField("reason", v1::RejectReasonLabel(rejection->reason)),
                                          observability::UIntField("ordinal", rejection->ordinal),
                                          observability::UIntField("line", rejection->start_line),
                                          observability::StringField("detail", rejection->detail)});
  } else {
    ++counters_.accepted;
  }
  return outcome;
}

} // namespace chessdb::ingest
