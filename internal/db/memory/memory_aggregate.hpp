#pragma once

#include <optional>
#include <vector>

#include "internal/db/api/aggregation.hpp"
#include "memory_repository.hpp"

namespace chessdb::db::memory {

/*
  Interprets an aggregation pipeline over one snapshot.

  A leading match stage is evaluated against stored records and uses the
  hash indexes for its first equality predicate on an indexed field.
  The deadline is checked every kDeadlineCheckInterval rows.
*/

inline constexpr std::size_t kDeadlineCheckInterval = 1024;

std::vector<agg::Row> RunPipeline(const MemoryState& state, const agg::Pipeline& pipeline, std::optional<agg::Deadline> deadline);

} // namespace chessdb::db::memory
