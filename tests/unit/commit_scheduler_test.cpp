#include "internal/ingest/commit_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/commit_worker.hpp"
#include "support/test_games.hpp"

namespace {

using chessdb::ingest::Batch;
using chessdb::ingest::CommitScheduler;

Batch MakeBatch(uint64_t seq) {
  Batch b;
  b.seq = seq;
  return b;
}

void TestFifoAndDrainAfterShutdown() {
  CommitScheduler scheduler(4);
  assert(scheduler.Enqueue(MakeBatch(1)));
  assert(scheduler.Enqueue(MakeBatch(2)));
  scheduler.Shutdown();

  assert(!scheduler.Enqueue(MakeBatch(3)));
  assert(scheduler.Pending() == 2);
  assert(scheduler.Dequeue()->seq == 1);
  assert(scheduler.Dequeue()->seq == 2);
  assert(!scheduler.Dequeue().has_value());
}

void TestEnqueueBlocksWhenFull() {
  CommitScheduler   scheduler(1);
  std::atomic<bool> second_enqueued{false};

  assert(scheduler.Enqueue(MakeBatch(1)));
  std::thread producer([&] {
    assert(scheduler.Enqueue(MakeBatch(2)));
    second_enqueued = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!second_enqueued.load());

  assert(scheduler.Dequeue()->seq == 1);
  producer.join();
  assert(second_enqueued.load());
  assert(scheduler.Dequeue()->seq == 2);
}

void TestShutdownReleasesBlockedProducer() {
  CommitScheduler scheduler(1);
  assert(scheduler.Enqueue(MakeBatch(1)));

  std::atomic<bool> result{true};
  std::thread       producer([&] { result = scheduler.Enqueue(MakeBatch(2)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  scheduler.Shutdown();
  producer.join();
  assert(!result.load());
}

void TestWorkerCommitsInOrder() {
  auto repo = std::make_shared<chessdb::db::memory::MemoryRepository>();
  repo->EnsureSchema();

  auto scheduler = std::make_shared<CommitScheduler>(1);
  auto committer = std::make_shared<chessdb::ingest::BatchCommitter>(repo, chessdb::ingest::CommitterOptions{});

  std::vector<uint64_t>         order;
  chessdb::ingest::CommitWorker worker(scheduler, committer, [&](const chessdb::ingest::BatchOutcome& o) {
    assert(o.committed);
    order.push_back(o.batch_seq);
  });
  worker.Start();

  for (uint64_t seq = 1; seq <= 5; ++seq) {
    Batch b = MakeBatch(seq);
    b.records.push_back(chessdb::testing::Record("p" + std::to_string(seq), "q" + std::to_string(seq), 1500, 1500,
                                                 chessdb::testing::kBaseMs + static_cast<int64_t>(seq) * chessdb::testing::kDay));
    assert(scheduler->Enqueue(std::move(b)));
  }
  worker.Stop();

  assert((order == std::vector<uint64_t>{1, 2, 3, 4, 5}));
  assert(!worker.Failed());

  auto tx = repo->BeginRead();
  assert(repo->Counts(*tx).games == 5);
}

} // namespace

int main() {
  TestFifoAndDrainAfterShutdown();
  TestEnqueueBlocksWhenFull();
  TestShutdownReleasesBlockedProducer();
  TestWorkerCommitsInOrder();

  std::cout << "chessdb_unit_commit_scheduler: pass\n";
  return 0;
}
