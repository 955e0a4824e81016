#pragma once

#include <string>

#include "chessdb/v1/types.pb.h"

namespace chessdb::v1 {

// Short lowercase labels used in logs, CLI output and parsing.
std::string ResultLabel(GameResult result);
std::string TimeControlLabel(TimeControlClass time_control);
std::string ColorLabel(Color color);
std::string RejectReasonLabel(RejectReason reason);

// "blitz" -> TIME_CONTROL_BLITZ; returns false for unknown labels.
bool ParseTimeControlLabel(const std::string& label, TimeControlClass* out);
bool ParseColorLabel(const std::string& label, Color* out);

// True for the parse-error subset of reject reasons.
bool IsParseError(RejectReason reason);

} // namespace chessdb::v1
