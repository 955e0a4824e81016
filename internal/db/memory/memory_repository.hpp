#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace chessdb::db::memory {

class MemoryTransaction;

/*
  One immutable committed version of the store.
  Hash indexes hold positions into games / rating_points.
*/
struct MemoryState {
  std::unordered_map<std::string, model::PlayerRecord> players;
  std::unordered_map<std::string, std::string>         player_ids_by_key;

  std::map<std::string, model::OpeningRecord> openings;

  std::vector<model::GameRow>     games;
  std::unordered_set<std::string> game_keys;

  std::unordered_map<std::string, std::vector<std::size_t>> games_by_eco;
  std::unordered_map<std::string, std::vector<std::size_t>> games_by_white;
  std::unordered_map<std::string, std::vector<std::size_t>> games_by_black;
  std::unordered_map<int64_t, std::vector<std::size_t>>     games_by_time_control;

  std::vector<model::RatingPointRecord>                     rating_points;
  std::unordered_map<std::string, std::vector<std::size_t>> points_by_player;

  std::vector<model::ImportRunRecord> import_runs;
};

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  std::mutex                         mutex_;
  std::shared_ptr<const MemoryState> committed_;
  uint64_t                           committed_version_ = 0;
};

}
