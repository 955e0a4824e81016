#include "internal/ingest/ingest_buffer.hpp"

#include <algorithm>
#include <utility>

namespace chessdb::ingest {

IngestBuffer::IngestBuffer(BufferLimits limits, FlushCallback on_flush) : limits_(limits), on_flush_(std::move(on_flush)) {
  if (limits_.max_records == 0) limits_.max_records = 1;
}

bool IngestBuffer::CanHold(const model::GameRecord& record) const {
  return record.EstimatedBytes() <= limits_.max_bytes;
}

bool IngestBuffer::Push(model::GameRecord record) {
  const std::size_t bytes = record.EstimatedBytes();
  if (bytes > limits_.max_bytes) return false;

  if (batch_.estimated_bytes + bytes > limits_.max_bytes) {
    Drain();
  }

  batch_.records.push_back(std::move(record));
  batch_.estimated_bytes += bytes;
  peak_bytes_ = std::max(peak_bytes_, batch_.estimated_bytes);

  if (batch_.records.size() >= limits_.max_records) {
    Drain();
  }
  return true;
}

void IngestBuffer::Drain() {
  if (batch_.records.empty()) return;

  Batch out;
  std::swap(out, batch_);
  out.seq = next_seq_++;
  on_flush_(std::move(out));
}

std::size_t IngestBuffer::Discard() {
  const std::size_t dropped = batch_.records.size();
  batch_                    = Batch{};
  return dropped;
}

} // namespace chessdb::ingest
