#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "internal/ingest/batch.hpp"

namespace chessdb::ingest {

struct BufferLimits {
  std::size_t max_records = 1000;
  std::size_t max_bytes   = 8 * 1024 * 1024;
};

/*
  IngestBuffer

  Holds records until one of two independent thresholds trips:

    - byte ceiling: checked BEFORE appending; a record that would push
      the buffer past max_bytes first drains the current contents
    - record count: checked AFTER appending

  Each drain hands a Batch to on_flush. The estimated size held never
  exceeds max_bytes, so PeakBytes() <= max_bytes for any input.
  A record that cannot fit even in an empty buffer is refused; callers
  must reject it upstream.
*/
class IngestBuffer {
 public:
  using FlushCallback = std::function<void(Batch&&)>;

  IngestBuffer(BufferLimits limits, FlushCallback on_flush);

  bool CanHold(const model::GameRecord& record) const;

  // Returns false (and keeps nothing) when the record can never fit.
  bool Push(model::GameRecord record);

  // Flushes the trailing partial batch. No-op when empty.
  void Drain();

  // Drops buffered records without flushing; returns how many.
  std::size_t Discard();

  std::size_t Size() const {
    return batch_.records.size();
  }
  std::size_t EstimatedBytes() const {
    return batch_.estimated_bytes;
  }
  std::size_t PeakBytes() const {
    return peak_bytes_;
  }
  uint64_t BatchesFlushed() const {
    return next_seq_ - 1;
  }

 private:
  BufferLimits  limits_;
  FlushCallback on_flush_;

  Batch       batch_;
  std::size_t peak_bytes_ = 0;
  uint64_t    next_seq_   = 1;
};

} // namespace chessdb::ingest
