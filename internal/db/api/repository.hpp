#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/aggregation.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/game_row.hpp"
#include "internal/db/model/import_run_record.hpp"
#include "internal/db/model/opening_record.hpp"
#include "internal/db/model/player_record.hpp"
#include "internal/db/model/rating_point_record.hpp"

namespace chessdb::db {

struct CollectionCounts {
  uint64_t players       = 0;
  uint64_t openings      = 0;
  uint64_t games         = 0;
  uint64_t rating_points = 0;
  uint64_t import_runs   = 0;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction from Begin()
  - Reads inside a transaction see its writes
  - BeginRead() transactions see one committed snapshot and never
    observe a partially committed batch
  - Players and openings are upserted by natural key; games and rating
    points are append-only
  - A rating point older than the player's latest point is rejected
    with ConstraintViolation
  - A game must reference existing players and an existing opening

  Writes return Result. Reads throw DbError on backend failure.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions / schema
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // Idempotent: creates collections and indexes when missing.
  virtual void EnsureSchema() = 0;

  // ---------------------------------------------------------------------
  // Players
  // ---------------------------------------------------------------------

  virtual std::optional<model::PlayerRecord> FindPlayerByKey(Transaction&, const std::string& name_key) = 0;

  virtual std::optional<model::PlayerRecord> FindPlayerById(Transaction&, const std::string& id) = 0;

  // Insert or update by id. peak_rating never decreases.
  virtual Result UpsertPlayer(Transaction&, const model::PlayerRecord&) = 0;

  // ---------------------------------------------------------------------
  // Openings
  // ---------------------------------------------------------------------

  virtual std::optional<model::OpeningRecord> FindOpening(Transaction&, const std::string& eco_code) = 0;

  // Ordered by eco_code.
  virtual std::vector<model::OpeningRecord> ListOpenings(Transaction&) = 0;

  // Creates the opening when missing, then increments its counters.
  virtual Result ApplyOpeningDelta(Transaction&, const model::OpeningDelta&) = 0;

  // ---------------------------------------------------------------------
  // Games
  // ---------------------------------------------------------------------

  virtual bool GameExists(Transaction&, const std::string& game_key) = 0;

  virtual Result InsertGame(Transaction&, const model::GameRow&) = 0;

  // ---------------------------------------------------------------------
  // Rating history
  // ---------------------------------------------------------------------

  virtual Result AppendRatingPoint(Transaction&, const model::RatingPointRecord&) = 0;

  // Ordered by (timestamp_ms, seq) ascending.
  virtual std::vector<model::RatingPointRecord> RatingHistory(Transaction&, const std::string& player_id) = 0;

  // ---------------------------------------------------------------------
  // Import runs
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result RecordImportRun(Transaction&, model::ImportRunRecord& record) = 0;

  virtual std::optional<model::ImportRunRecord> LastImportRun(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Analytics
  // ---------------------------------------------------------------------

  virtual CollectionCounts Counts(Transaction&) = 0;

  // Throws util::QueryTimeout once the deadline passes.
  virtual std::vector<agg::Row> Aggregate(Transaction&, const agg::Pipeline&, std::optional<agg::Deadline> deadline) = 0;
};

} // namespace chessdb::db
