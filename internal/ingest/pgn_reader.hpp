#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace chessdb::ingest {

struct RawBlock {
  std::string text;
  uint64_t    ordinal    = 0; // 1-based
  uint64_t    start_line = 0; // 1-based
  bool        truncated  = false;
  std::size_t bytes      = 0; // full size, also when truncated
};

/*
  PgnReader

  Splits a PGN stream into game blocks without loading the stream.
  A block is a tag section followed by movetext. Outside an open {...}
  comment a block ends at:
    - a blank line after movetext
    - a '[' line after movetext
    - a '[' line after the tag section was closed by a blank line
  so a tags-only block or stray text between games comes out as a
  block of its own.

  Blocks larger than max_block_bytes are not accumulated: the reader
  keeps only the head of the block (for diagnostics), skips to the
  next boundary and marks the block truncated.
*/
class PgnReader {
 public:
  PgnReader(std::istream& in, std::size_t max_block_bytes);

  std::optional<RawBlock> Next();

  // Stream failed for a reason other than end-of-file.
  bool Failed() const {
    return in_.bad();
  }

  uint64_t LinesRead() const {
    return line_no_;
  }

 private:
  bool ReadLine(std::string& line);

  std::istream& in_;
  std::size_t   max_block_bytes_;

  uint64_t                   line_no_ = 0;
  uint64_t                   ordinal_ = 0;
  std::optional<std::string> pending_; // first line of the next block
  uint64_t                   pending_line_ = 0;
};

} // namespace chessdb::ingest
