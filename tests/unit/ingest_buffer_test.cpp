#include "internal/ingest/ingest_buffer.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "internal/ingest/record_parser.hpp"
#include "support/test_games.hpp"

namespace {

using chessdb::ingest::Batch;
using chessdb::ingest::BufferLimits;
using chessdb::ingest::IngestBuffer;
using chessdb::testing::Record;

void TestRecordThreshold() {
  std::vector<Batch> flushed;
  IngestBuffer       buffer(BufferLimits{3, 1 << 20}, [&](Batch&& b) { flushed.push_back(std::move(b)); });

  for (int i = 0; i < 7; ++i) {
    assert(buffer.Push(Record("a", "b", 1500, 1500, i)));
  }
  assert(flushed.size() == 2);
  assert(buffer.Size() == 1);

  buffer.Drain();
  assert(flushed.size() == 3);
  assert(flushed[0].seq == 1 && flushed[1].seq == 2 && flushed[2].seq == 3);
  assert(flushed[0].records.size() == 3);
  assert(flushed[2].records.size() == 1);
  assert(buffer.Size() == 0);
  assert(buffer.BatchesFlushed() == 3);

  // empty drain is a no-op
  buffer.Drain();
  assert(flushed.size() == 3);
}

void TestByteCeilingFlushesBeforeAppend() {
  const auto        one   = Record("a", "b", 1500, 1500, 0).EstimatedBytes();
  const std::size_t limit = one * 2 + one / 2;

  std::vector<Batch> flushed;
  IngestBuffer       buffer(BufferLimits{1000, limit}, [&](Batch&& b) { flushed.push_back(std::move(b)); });

  for (int i = 0; i < 5; ++i) {
    assert(buffer.Push(Record("a", "b", 1500, 1500, i)));
    assert(buffer.EstimatedBytes() <= limit);
  }
  assert(flushed.size() == 2);
  for (const auto& b : flushed) {
    assert(b.records.size() == 2);
    assert(b.estimated_bytes <= limit);
  }
  assert(buffer.PeakBytes() <= limit);
}

void TestRecordThatCannotFitIsRefused() {
  int          flushes = 0;
  auto         record  = Record("a", "b", 1500, 1500, 0);
  IngestBuffer buffer(BufferLimits{10, record.EstimatedBytes() - 1}, [&](Batch&&) { ++flushes; });

  assert(!buffer.CanHold(record));
  assert(!buffer.Push(record));
  assert(buffer.Size() == 0);
  assert(flushes == 0);
}

void TestDiscard() {
  int          flushes = 0;
  IngestBuffer buffer(BufferLimits{10, 1 << 20}, [&](Batch&&) { ++flushes; });
  for (int i = 0; i < 4; ++i) buffer.Push(Record("a", "b", 1500, 1500, i));

  assert(buffer.Discard() == 4);
  assert(buffer.Size() == 0);
  assert(buffer.EstimatedBytes() == 0);
  buffer.Drain();
  assert(flushes == 0);
}

// Parsed stream of many games through a small byte ceiling.
void TestPeakStaysUnderCeilingOnLargeInput() {
  std::ostringstream text;
  for (int i = 0; i < 5000; ++i) {
    chessdb::testing::GameSpec spec;
    spec.white   = "player" + std::to_string(i % 97);
    spec.black   = "rival" + std::to_string(i % 89);
    spec.date    = "2023." + std::string(i % 12 < 9 ? "0" : "") + std::to_string(i % 12 + 1) + ".1" + std::to_string(i % 10);
    spec.opening = std::string(static_cast<std::size_t>(i % 300), 'o');
    text << chessdb::testing::Pgn(spec);
  }

  const BufferLimits limits{1000, 64 * 1024};

  std::istringstream           in(text.str());
  chessdb::ingest::ValidationLimits validation;
  validation.max_record_bytes = limits.max_bytes;
  chessdb::ingest::RecordParser parser(in, validation);

  uint64_t     flushed_records = 0;
  std::size_t  largest_batch   = 0;
  IngestBuffer buffer(limits, [&](Batch&& b) {
    flushed_records += b.records.size();
    largest_batch = std::max(largest_batch, b.estimated_bytes);
  });

  while (auto outcome = parser.Next()) {
    if (auto* g = std::get_if<chessdb::model::GameRecord>(&*outcome)) {
      assert(buffer.Push(std::move(*g)));
    }
  }
  buffer.Drain();

  assert(parser.Counters().accepted == 5000);
  assert(flushed_records == 5000);
  assert(buffer.PeakBytes() <= limits.max_bytes);
  assert(largest_batch <= limits.max_bytes);
  assert(buffer.BatchesFlushed() > 1);
}

} // namespace

int main() {
  TestRecordThreshold();
  TestByteCeilingFlushesBeforeAppend();
  TestRecordThatCannotFitIsRefused();
  TestDiscard();
  TestPeakStaysUnderCeilingOnLargeInput();

  std::cout << "chessdb_unit_ingest_buffer: pass\n";
  return 0;
}
