#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/game_record.hpp"

namespace chessdb::ingest {

/*
  Ingestion-time grouping of records. seq increases by one per flush
  and fixes the commit order.
*/
struct Batch {
  uint64_t                       seq = 0;
  std::vector<model::GameRecord> records;
  std::size_t                    estimated_bytes = 0;
};

struct BatchOutcome {
  uint64_t batch_seq = 0;
  bool     committed = false;

  uint64_t games_committed    = 0;
  uint64_t duplicates_skipped = 0;
  uint64_t new_players        = 0;
  uint64_t new_openings       = 0;
  uint64_t name_conflicts     = 0;
  uint32_t attempts           = 0;

  // set when committed == false
  std::string error;
  // records of a failed batch, kept for the run summary
  std::vector<model::GameRecord> failed_records;
};

} // namespace chessdb::ingest
