#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/pipeline_sql.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace chessdb::db::sqlite {

namespace {

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return sqlite3_column_int64(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int32_t ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::PlayerRecord ReadPlayer(sqlite3_stmt* st) {
  model::PlayerRecord r;
  r.id              = ColText(st, 0);
  r.name_key        = ColText(st, 1);
  r.display_name    = ColText(st, 2);
  r.title           = ColText(st, 3);
  r.current_rating  = ColI32(st, 4);
  r.peak_rating     = ColI32(st, 5);
  r.games_played    = ColU64(st, 6);
  r.first_seen_ms   = ColI64(st, 7);
  r.last_updated_ms = ColI64(st, 8);
  if (sqlite3_column_type(st, 9) != SQLITE_NULL) r.last_game_at_ms = ColI64(st, 9);
  return r;
}

model::OpeningRecord ReadOpening(sqlite3_stmt* st) {
  model::OpeningRecord r;
  r.eco_code         = ColText(st, 0);
  r.name             = ColText(st, 1);
  r.games            = ColU64(st, 2);
  r.white_wins       = ColU64(st, 3);
  r.black_wins       = ColU64(st, 4);
  r.draws            = ColU64(st, 5);
  r.white_rating_sum = ColI64(st, 6);
  r.black_rating_sum = ColI64(st, 7);
  return r;
}

agg::Value ReadValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return ColI64(st, col);
    case SQLITE_FLOAT:
      return sqlite3_column_double(st, col);
    case SQLITE_TEXT:
      return ColText(st, col);
    default:
      return std::monostate{};
  }
}

struct ProgressContext {
  agg::Deadline deadline;
  bool          expired = false;
};

int OnProgress(void* arg) {
  auto* ctx = static_cast<ProgressContext*>(arg);
  if (std::chrono::steady_clock::now() >= ctx->deadline) {
    ctx->expired = true;
    return 1; // interrupts the running statement
  }
  return 0;
}

// Installs a progress handler for the lifetime of one query.
class ProgressScope {
 public:
  ProgressScope(sqlite3* db, ProgressContext* ctx) : db_(db) {
    if (ctx) sqlite3_progress_handler(db_, 1000, OnProgress, ctx);
  }
  ~ProgressScope() {
    sqlite3_progress_handler(db_, 0, nullptr, nullptr);
  }

 private:
  sqlite3* db_;
};

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& statement) override {
    db_.Exec(statement);
  }

 private:
  SqliteDB& db_;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

void SqliteRepository::EnsureSchema() {
  auto tx = Begin();
  auto& conn = TX(*tx).DB();

  SqliteMigrationExecutor executor(conn);
  sql::RunMigrations(executor, sql::SchemaStatements());

  auto res = ExecWrite(TX(*tx), sql::INSERT_SCHEMA_VERSION, {static_cast<int64_t>(sql::kSchemaVersion), util::NowMillis()});
  if (!res) throw DbError(res.code, "record schema version: " + res.message);

  tx->Commit();
}

Result SqliteRepository::ExecWrite(SqliteTransaction& tx, const char* sql, const sql::Params& params) {
  auto& conn = tx.DB();
  try {
    auto st = conn.Prepare(sql);
    conn.Bind(st.get(), params);
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();
    return Result::Err(TranslateCode(rc, sqlite3_extended_errcode(conn.Handle())), sqlite3_errmsg(conn.Handle()));
  } catch (const DbError& e) {
    return Result::Err(e.code(), e.what());
  }
}

// ------------------------------------------------------------------
// Players
// ------------------------------------------------------------------

std::optional<model::PlayerRecord> SqliteRepository::FindPlayerByKey(Transaction& t, const std::string& name_key) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_PLAYER_BY_KEY);
  conn.Bind(st.get(), {name_key});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw conn.LastError(rc, "find player by key");
  return ReadPlayer(st.get());
}

std::optional<model::PlayerRecord> SqliteRepository::FindPlayerById(Transaction& t, const std::string& id) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_PLAYER_BY_ID);
  conn.Bind(st.get(), {id});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw conn.LastError(rc, "find player by id");
  return ReadPlayer(st.get());
}

Result SqliteRepository::UpsertPlayer(Transaction& t, const model::PlayerRecord& r) {
  if (r.id.empty() || r.name_key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "player id and name key are required");

  sql::Param last_game = nullptr;
  if (r.last_game_at_ms) last_game = *r.last_game_at_ms;

  auto& tx  = TX(t);
  auto  res = ExecWrite(tx, sql::UPSERT_PLAYER,
                        {r.id, r.name_key, r.display_name, r.title, r.current_rating, r.peak_rating, r.games_played, r.first_seen_ms,
                         r.last_updated_ms, last_game});
  if (!res) return res;

  // the guarded DO UPDATE touches nothing when the key would change
  if (sqlite3_changes(tx.Handle()) == 0) {
    return Result::Err(ErrorCode::ConstraintViolation, "player name key is immutable");
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Openings
// ------------------------------------------------------------------

std::optional<model::OpeningRecord> SqliteRepository::FindOpening(Transaction& t, const std::string& eco_code) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_OPENING);
  conn.Bind(st.get(), {eco_code});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw conn.LastError(rc, "find opening");
  return ReadOpening(st.get());
}

std::vector<model::OpeningRecord> SqliteRepository::ListOpenings(Transaction& t) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_OPENINGS);

  std::vector<model::OpeningRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(ReadOpening(st.get()));
  if (rc != SQLITE_DONE) throw conn.LastError(rc, "list openings");
  return out;
}

Result SqliteRepository::ApplyOpeningDelta(Transaction& t, const model::OpeningDelta& d) {
  if (d.eco_code.empty()) return Result::Err(ErrorCode::ConstraintViolation, "opening code is required");
  return ExecWrite(TX(t), sql::APPLY_OPENING_DELTA,
                   {d.eco_code, d.name, d.games, d.white_wins, d.black_wins, d.draws, d.white_rating_sum, d.black_rating_sum});
}

// ------------------------------------------------------------------
// Games
// ------------------------------------------------------------------

bool SqliteRepository::GameExists(Transaction& t, const std::string& game_key) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_GAME_EXISTS);
  conn.Bind(st.get(), {game_key});

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw conn.LastError(rc, "game exists");
}

Result SqliteRepository::InsertGame(Transaction& t, const model::GameRow& g) {
  return ExecWrite(TX(t), sql::INSERT_GAME,
                   {g.game_key, g.white_player_id, g.black_player_id, g.white_rating, g.black_rating, static_cast<int64_t>(g.result),
                    g.date_ms, g.eco_code, g.opening_name, static_cast<int64_t>(g.time_control), g.time_control_raw,
                    static_cast<int64_t>(g.ply_count), g.event, g.site, g.moves});
}

// ------------------------------------------------------------------
// Rating history
// ------------------------------------------------------------------

Result SqliteRepository::AppendRatingPoint(Transaction& t, const model::RatingPointRecord& p) {
  auto res = ExecWrite(TX(t), sql::INSERT_RATING_POINT,
                       {p.player_id, p.timestamp_ms, p.rating, p.seq, static_cast<int64_t>(p.time_control)});
  // duplicate (player_id, seq) is a history violation, not an existing entity
  if (res.code == ErrorCode::AlreadyExists) res.code = ErrorCode::ConstraintViolation;
  return res;
}

std::vector<model::RatingPointRecord> SqliteRepository::RatingHistory(Transaction& t, const std::string& player_id) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_RATING_HISTORY);
  conn.Bind(st.get(), {player_id});

  std::vector<model::RatingPointRecord> out;
  int                                    rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::RatingPointRecord p;
    p.player_id    = ColText(st.get(), 0);
    p.timestamp_ms = ColI64(st.get(), 1);
    p.rating       = ColI32(st.get(), 2);
    p.seq          = ColU64(st.get(), 3);
    p.time_control = static_cast<chessdb::v1::TimeControlClass>(ColI32(st.get(), 4));
    out.push_back(std::move(p));
  }
  if (rc != SQLITE_DONE) throw conn.LastError(rc, "rating history");
  return out;
}

// ------------------------------------------------------------------
// Import runs
// ------------------------------------------------------------------

Result SqliteRepository::RecordImportRun(Transaction& t, model::ImportRunRecord& r) {
  auto& tx  = TX(t);
  auto  res = ExecWrite(tx, sql::INSERT_IMPORT_RUN,
                        {r.source, r.started_ms, r.finished_ms, r.records_processed, r.records_accepted, r.records_rejected, r.games_committed,
                         r.duplicates_skipped, r.failed_batches, static_cast<int32_t>(r.cancelled ? 1 : 0)});
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(tx.Handle()));
  return res;
}

std::optional<model::ImportRunRecord> SqliteRepository::LastImportRun(Transaction& t) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::SELECT_LAST_IMPORT_RUN);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw conn.LastError(rc, "last import run");

  model::ImportRunRecord r;
  r.id                 = ColU64(st.get(), 0);
  r.source             = ColText(st.get(), 1);
  r.started_ms         = ColI64(st.get(), 2);
  r.finished_ms        = ColI64(st.get(), 3);
  r.records_processed  = ColU64(st.get(), 4);
  r.records_accepted   = ColU64(st.get(), 5);
  r.records_rejected   = ColU64(st.get(), 6);
  r.games_committed    = ColU64(st.get(), 7);
  r.duplicates_skipped = ColU64(st.get(), 8);
  r.failed_batches     = ColU64(st.get(), 9);
  r.cancelled          = ColI32(st.get(), 10) != 0;
  return r;
}

// ------------------------------------------------------------------
// Analytics
// ------------------------------------------------------------------

CollectionCounts SqliteRepository::Counts(Transaction& t) {
  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(sql::COUNT_COLLECTIONS);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) throw conn.LastError(rc, "collection counts");

  CollectionCounts counts;
  counts.players       = ColU64(st.get(), 0);
  counts.openings      = ColU64(st.get(), 1);
  counts.games         = ColU64(st.get(), 2);
  counts.rating_points = ColU64(st.get(), 3);
  counts.import_runs   = ColU64(st.get(), 4);
  return counts;
}

std::vector<agg::Row> SqliteRepository::Aggregate(Transaction& t, const agg::Pipeline& pipeline, std::optional<agg::Deadline> deadline) {
  const auto query = sql::CompilePipeline(pipeline);

  if (deadline && std::chrono::steady_clock::now() >= *deadline) {
    throw util::QueryTimeout("aggregation exceeded its time budget");
  }

  auto& conn = TX(t).DB();
  auto  st   = conn.Prepare(query.sql);
  conn.Bind(st.get(), query.params);

  std::optional<ProgressContext> progress;
  if (deadline) progress.emplace(ProgressContext{*deadline});
  ProgressScope scope(conn.Handle(), progress ? &*progress : nullptr);

  const std::unordered_set<std::string> sqrt_columns(query.sqrt_columns.begin(), query.sqrt_columns.end());
  const int                             columns = sqlite3_column_count(st.get());

  std::vector<agg::Row> rows;
  int                   rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    agg::Row row;
    for (int c = 0; c < columns; ++c) {
      std::string name  = sqlite3_column_name(st.get(), c);
      agg::Value  value = ReadValue(st.get(), c);
      if (sqrt_columns.contains(name) && !agg::IsNull(value)) {
        const double variance = std::holds_alternative<double>(value) ? std::get<double>(value) : static_cast<double>(std::get<int64_t>(value));
        value                 = std::sqrt(std::max(0.0, variance));
      }
      row.emplace(std::move(name), std::move(value));
    }
    rows.push_back(std::move(row));
  }

  if (rc == SQLITE_INTERRUPT && progress && progress->expired) {
    throw util::QueryTimeout("aggregation exceeded its time budget");
  }
  if (rc != SQLITE_DONE) throw conn.LastError(rc, "aggregate");
  return rows;
}

} // namespace chessdb::db::sqlite
