#include "internal/ingest/pgn_reader.hpp"

namespace chessdb::ingest {

namespace {

constexpr std::size_t kDiagnosticHeadBytes = 512;

bool IsTagLine(const std::string& line) {
  for (char c : line) {
    if (c == ' ' || c == '\t') continue;
    return c == '[';
  }
  return false;
}

bool IsBlank(const std::string& line) {
  for (char c : line) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

// Tracks {...} comment nesting and ';' rest-of-line comments in movetext.
void ScanComments(const std::string& line, bool& in_brace) {
  for (char c : line) {
    if (in_brace) {
      if (c == '}') in_brace = false;
    } else if (c == '{') {
      in_brace = true;
    } else if (c == ';') {
      return;
    }
  }
}

} // namespace

PgnReader::PgnReader(std::istream& in, std::size_t max_block_bytes) : in_(in), max_block_bytes_(max_block_bytes) {
}

bool PgnReader::ReadLine(std::string& line) {
  if (!std::getline(in_, line)) return false;
  ++line_no_;
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return true;
}

std::optional<RawBlock> PgnReader::Next() {
  RawBlock    block;
  std::string line;
  bool        have_content  = false;
  bool        seen_tags     = false;
  bool        tags_closed   = false; // blank line after the tag section
  bool        seen_movetext = false;
  bool        in_brace      = false;

  auto append = [&](const std::string& l) {
    const std::size_t add = l.size() + 1;
    block.bytes += add;
    if (block.truncated) return;
    if (block.text.size() + add > max_block_bytes_) {
      block.truncated = true;
      if (block.text.size() < kDiagnosticHeadBytes) {
        block.text.append(l, 0, kDiagnosticHeadBytes - block.text.size());
      }
      return;
    }
    block.text += l;
    block.text += '\n';
  };

  if (pending_) {
    block.start_line = pending_line_;
    append(*pending_);
    have_content = true;
    seen_tags    = true;
    pending_.reset();
  }

  while (ReadLine(line)) {
    const bool blank = IsBlank(line);
    if (!have_content) {
      if (blank) continue;
      block.start_line = line_no_;
      have_content     = true;
    }

    if (in_brace) {
      ScanComments(line, in_brace);
      append(line);
      continue;
    }

    if (blank) {
      if (seen_movetext) break;
      if (seen_tags) tags_closed = true;
      append(line);
      continue;
    }

    if (IsTagLine(line)) {
      // tag after movetext, or a new tag section after a closed one
      if (seen_movetext || tags_closed) {
        pending_      = line;
        pending_line_ = line_no_;
        break;
      }
      seen_tags = true;
      append(line);
      continue;
    }

    seen_movetext = true;
    ScanComments(line, in_brace);
    append(line);
  }

  if (!have_content) return std::nullopt;

  block.ordinal = ++ordinal_;
  return block;
}

} // namespace chessdb::ingest
