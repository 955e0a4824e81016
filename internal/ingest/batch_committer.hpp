#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/ingest/batch.hpp"
#include "internal/ingest/entity_resolver.hpp"

namespace chessdb::runtime::config {
class CommitConfig;
}

namespace chessdb::ingest {

struct CommitterOptions {
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds initial_backoff{50};
  std::chrono::milliseconds max_backoff{2000};
  double                    backoff_multiplier = 2.0;

  static CommitterOptions FromConfig(const chessdb::runtime::config::CommitConfig& config);
};

/*
  BatchCommitter

  One attempt = one write transaction:
    1. drop games already committed and intra-batch duplicates
    2. resolve players/openings inside the transaction
    3. write players, opening deltas, games, rating points
    4. commit
  Any error rolls the whole attempt back.

  Failed attempts are retried with exponential backoff. When retries run
  out:
    - unavailable store (busy, I/O, unreachable): throws
      util::StoreUnavailable
    - anything else: returns a failed outcome carrying the records
*/
class BatchCommitter {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  BatchCommitter(std::shared_ptr<db::Repository> repository, CommitterOptions options, SleepFn sleep = {}, EntityResolver resolver = {});

  BatchOutcome Commit(const Batch& batch);

 private:
  BatchOutcome Attempt(const Batch& batch);

  std::shared_ptr<db::Repository> repository_;
  CommitterOptions                options_;
  SleepFn                         sleep_;
  EntityResolver                  resolver_;
};

} // namespace chessdb::ingest
