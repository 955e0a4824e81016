#include "api/chessdb/v1.hpp"

#include <cctype>

namespace chessdb::v1 {

namespace {

// GAME_RESULT_WHITE_WIN -> white_win
std::string StripPrefix(const std::string& name, const std::string& prefix) {
  std::string out = name.rfind(prefix, 0) == 0 ? name.substr(prefix.size()) : name;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::string ToUpper(const std::string& value) {
  std::string out = value;
  for (auto& c : out) {
    c = c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace

std::string ResultLabel(GameResult result) {
  switch (result) {
    case GAME_RESULT_WHITE_WIN:
      return "1-0";
    case GAME_RESULT_BLACK_WIN:
      return "0-1";
    case GAME_RESULT_DRAW:
      return "1/2-1/2";
    default:
      return "*";
  }
}

std::string TimeControlLabel(TimeControlClass time_control) {
  return StripPrefix(TimeControlClass_Name(time_control), "TIME_CONTROL_");
}

std::string ColorLabel(Color color) {
  return StripPrefix(Color_Name(color), "COLOR_");
}

std::string RejectReasonLabel(RejectReason reason) {
  return StripPrefix(RejectReason_Name(reason), "REJECT_REASON_");
}

bool ParseTimeControlLabel(const std::string& label, TimeControlClass* out) {
  TimeControlClass parsed = TIME_CONTROL_UNSPECIFIED;
  if (!TimeControlClass_Parse("TIME_CONTROL_" + ToUpper(label), &parsed) || parsed == TIME_CONTROL_UNSPECIFIED) {
    return false;
  }
  *out = parsed;
  return true;
}

bool ParseColorLabel(const std::string& label, Color* out) {
  Color parsed = COLOR_UNSPECIFIED;
  if (!Color_Parse("COLOR_" + ToUpper(label), &parsed) || parsed == COLOR_UNSPECIFIED) {
    return false;
  }
  *out = parsed;
  return true;
}

bool IsParseError(RejectReason reason) {
  return reason == REJECT_REASON_MALFORMED_TAG || reason == REJECT_REASON_MALFORMED_MOVETEXT ||
         reason == REJECT_REASON_BLOCK_TOO_LARGE;
}

} // namespace chessdb::v1
