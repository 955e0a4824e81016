#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace chessdb::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  void EnsureSchema() override;

  std::optional<model::PlayerRecord> FindPlayerByKey(Transaction&, const std::string& name_key) override;
  std::optional<model::PlayerRecord> FindPlayerById(Transaction&, const std::string& id) override;
  Result UpsertPlayer(Transaction&, const model::PlayerRecord&) override;

  std::optional<model::OpeningRecord> FindOpening(Transaction&, const std::string& eco_code) override;
  std::vector<model::OpeningRecord> ListOpenings(Transaction&) override;
  Result ApplyOpeningDelta(Transaction&, const model::OpeningDelta&) override;

  bool GameExists(Transaction&, const std::string& game_key) override;
  Result InsertGame(Transaction&, const model::GameRow&) override;

  Result AppendRatingPoint(Transaction&, const model::RatingPointRecord&) override;
  std::vector<model::RatingPointRecord> RatingHistory(Transaction&, const std::string& player_id) override;

  Result RecordImportRun(Transaction&, model::ImportRunRecord& record) override;
  std::optional<model::ImportRunRecord> LastImportRun(Transaction&) override;

  CollectionCounts Counts(Transaction&) override;
  std::vector<agg::Row> Aggregate(Transaction&, const agg::Pipeline&, std::optional<agg::Deadline> deadline) override;

private:
  static SqliteTransaction& TX(Transaction& t);

  // Runs one write statement; translates the step result.
  static Result ExecWrite(SqliteTransaction& tx, const char* sql, const sql::Params& params);

  std::shared_ptr<SqlitePool> pool_;
};

}
