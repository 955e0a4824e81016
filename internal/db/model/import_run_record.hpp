#pragma once

#include <cstdint>
#include <string>

namespace chessdb::db::model {

struct ImportRunRecord {
  uint64_t    id = 0;
  std::string source;

  int64_t started_ms  = 0;
  int64_t finished_ms = 0;

  uint64_t records_processed  = 0;
  uint64_t records_accepted   = 0;
  uint64_t records_rejected   = 0;
  uint64_t games_committed    = 0;
  uint64_t duplicates_skipped = 0;
  uint64_t failed_batches     = 0;

  bool cancelled = false;
};

} // namespace chessdb::db::model
