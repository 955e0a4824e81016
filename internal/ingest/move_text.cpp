#include "internal/ingest/move_text.hpp"

#include <cctype>

namespace chessdb::ingest {

namespace {

bool IsFile(char c) {
  return c >= 'a' && c <= 'h';
}

bool IsRank(char c) {
  return c >= '1' && c <= '8';
}

bool IsPiece(char c) {
  return c == 'K' || c == 'Q' || c == 'R' || c == 'B' || c == 'N';
}

bool IsPromotionPiece(char c) {
  return c == 'Q' || c == 'R' || c == 'B' || c == 'N';
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool IsTokenBreak(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == '{' || c == '}' || c == '(' || c == ')' || c == ';';
}

std::optional<std::optional<chessdb::v1::GameResult>> TerminationMarker(std::string_view token) {
  if (token == "1-0") return std::optional{chessdb::v1::GAME_RESULT_WHITE_WIN};
  if (token == "0-1") return std::optional{chessdb::v1::GAME_RESULT_BLACK_WIN};
  if (token == "1/2-1/2") return std::optional{chessdb::v1::GAME_RESULT_DRAW};
  if (token == "*") return std::optional<chessdb::v1::GameResult>{};
  return std::nullopt;
}

std::string_view StripSuffixes(std::string_view token) {
  while (!token.empty()) {
    const char c = token.back();
    if (c == '!' || c == '?' || c == '+' || c == '#') {
      token.remove_suffix(1);
      continue;
    }
    break;
  }
  return token;
}

bool IsCastling(std::string_view t) {
  return t == "O-O" || t == "O-O-O" || t == "0-0" || t == "0-0-0";
}

bool IsPieceMove(std::string_view t) {
  // [KQRBN][a-h]?[1-8]?x?[a-h][1-8]
  if (t.size() < 3 || !IsPiece(t[0])) return false;
  if (!IsFile(t[t.size() - 2]) || !IsRank(t[t.size() - 1])) return false;

  std::string_view middle = t.substr(1, t.size() - 3);
  if (!middle.empty() && middle.back() == 'x') middle.remove_suffix(1);
  if (middle.size() > 2) return false;
  if (middle.size() == 2) return IsFile(middle[0]) && IsRank(middle[1]);
  if (middle.size() == 1) return IsFile(middle[0]) || IsRank(middle[0]);
  return true;
}

bool IsPawnMove(std::string_view t) {
  // [a-h](x[a-h])?[1-8](=?[QRBN])?
  if (t.size() < 2 || !IsFile(t[0])) return false;
  std::size_t i = 1;
  if (t[i] == 'x') {
    if (t.size() < 4 || !IsFile(t[2])) return false;
    i = 3;
  }
  if (i >= t.size() || !IsRank(t[i])) return false;
  const char rank = t[i];
  ++i;

  const bool last_rank = rank == '1' || rank == '8';
  if (i == t.size()) return !last_rank;

  if (!last_rank) return false;
  if (t[i] == '=') ++i;
  return i + 1 == t.size() && IsPromotionPiece(t[i]);
}

// "12." "12..." "12.e4" "12...e5": strips the move number, returns the rest.
// Digits not followed by '.' are left alone ("0-0").
std::string_view StripMoveNumber(std::string_view token) {
  if (token.find_first_not_of('.') == std::string_view::npos) return {};
  std::size_t i = 0;
  while (i < token.size() && IsDigit(token[i])) ++i;
  if (i == 0 || i == token.size() || token[i] != '.') return token;
  while (i < token.size() && token[i] == '.') ++i;
  return token.substr(i);
}

} // namespace

bool IsSanMove(std::string_view token) {
  return IsCastling(token) || IsPieceMove(token) || IsPawnMove(token);
}

bool ParseMoveText(std::string_view text, MoveText* out, std::string* error) {
  out->moves.clear();
  out->termination.reset();
  out->has_termination = false;

  int         depth = 0;
  std::size_t i     = 0;
  bool        line_start = true;

  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };

  while (i < text.size()) {
    const char c = text[i];

    if (c == '\n') {
      line_start = true;
      ++i;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    if (line_start && c == '%') {
      while (i < text.size() && text[i] != '\n') ++i;
      continue;
    }
    line_start = false;

    if (c == '{') {
      const auto end = text.find('}', i + 1);
      if (end == std::string_view::npos) return fail("unterminated comment");
      i = end + 1;
      continue;
    }
    if (c == ';') {
      while (i < text.size() && text[i] != '\n') ++i;
      continue;
    }
    if (c == '}') return fail("unbalanced '}'");
    if (c == '(') {
      if (out->has_termination) return fail("variation after termination marker");
      ++depth;
      ++i;
      continue;
    }
    if (c == ')') {
      if (depth == 0) return fail("unbalanced ')'");
      --depth;
      ++i;
      continue;
    }

    std::size_t start = i;
    while (i < text.size() && !IsTokenBreak(text[i])) ++i;
    const std::string_view token = text.substr(start, i - start);

    if (token[0] == '$') {
      if (token.size() < 2) return fail("empty NAG");
      for (std::size_t k = 1; k < token.size(); ++k) {
        if (!IsDigit(token[k])) return fail("invalid NAG '" + std::string(token) + "'");
      }
      continue;
    }

    if (depth > 0) continue;

    if (out->has_termination) return fail("token after termination marker: '" + std::string(token) + "'");

    if (auto marker = TerminationMarker(token)) {
      out->termination     = *marker;
      out->has_termination = true;
      continue;
    }

    const auto rest = StripMoveNumber(token);
    if (rest.empty()) continue;

    const auto san = StripSuffixes(rest);
    if (!IsSanMove(san)) return fail("invalid move '" + std::string(rest) + "'");
    out->moves.emplace_back(san);
  }

  if (depth != 0) return fail("unbalanced '('");
  if (!out->has_termination) return fail("missing termination marker");
  return true;
}

} // namespace chessdb::ingest
