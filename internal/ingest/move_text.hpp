#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chessdb/v1.hpp"

namespace chessdb::ingest {

struct MoveText {
  std::vector<std::string> moves; // main line SAN, suffixes stripped
  // nullopt for "*"
  std::optional<chessdb::v1::GameResult> termination;
  bool                                   has_termination = false;
};

/*
  Syntax check of PGN movetext.

  Accepts move numbers ("1." "1..." and the glued "1.e4" form), SAN
  moves with check and annotation suffixes, NAGs, {} and ; comments,
  '%' escape lines, nested () variations, and requires one termination
  marker as the final token. Variation contents are skipped.

  Returns false and sets *error on the first problem.
*/
bool ParseMoveText(std::string_view text, MoveText* out, std::string* error);

// SAN syntax only; legality against a position is not checked.
// Check (+ #) and annotation (! ?) suffixes must already be removed.
bool IsSanMove(std::string_view token);

} // namespace chessdb::ingest
