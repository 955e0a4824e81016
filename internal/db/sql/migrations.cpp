#include "internal/db/sql/migrations.hpp"

namespace chessdb::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",

      "CREATE TABLE IF NOT EXISTS players ("
      " id TEXT PRIMARY KEY,"
      " name_key TEXT NOT NULL UNIQUE,"
      " display_name TEXT NOT NULL,"
      " title TEXT NOT NULL DEFAULT '',"
      " current_rating INTEGER NOT NULL,"
      " peak_rating INTEGER NOT NULL,"
      " games_played INTEGER NOT NULL,"
      " first_seen_ms INTEGER NOT NULL,"
      " last_updated_ms INTEGER NOT NULL,"
      " last_game_at_ms INTEGER);",

      "CREATE TABLE IF NOT EXISTS openings ("
      " eco_code TEXT PRIMARY KEY,"
      " name TEXT NOT NULL DEFAULT '',"
      " games INTEGER NOT NULL DEFAULT 0,"
      " white_wins INTEGER NOT NULL DEFAULT 0,"
      " black_wins INTEGER NOT NULL DEFAULT 0,"
      " draws INTEGER NOT NULL DEFAULT 0,"
      " white_rating_sum INTEGER NOT NULL DEFAULT 0,"
      " black_rating_sum INTEGER NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS games ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " game_key TEXT NOT NULL UNIQUE,"
      " white_player_id TEXT NOT NULL REFERENCES players(id),"
      " black_player_id TEXT NOT NULL REFERENCES players(id),"
      " white_rating INTEGER NOT NULL,"
      " black_rating INTEGER NOT NULL,"
      " result INTEGER NOT NULL,"
      " date_ms INTEGER NOT NULL,"
      " eco_code TEXT NOT NULL REFERENCES openings(eco_code),"
      " opening_name TEXT NOT NULL DEFAULT '',"
      " time_control INTEGER NOT NULL,"
      " time_control_raw TEXT NOT NULL DEFAULT '',"
      " ply_count INTEGER NOT NULL,"
      " event TEXT NOT NULL DEFAULT '',"
      " site TEXT NOT NULL DEFAULT '',"
      " moves TEXT NOT NULL DEFAULT '');",

      "CREATE INDEX IF NOT EXISTS idx_games_eco_code ON games(eco_code);",
      "CREATE INDEX IF NOT EXISTS idx_games_white_player ON games(white_player_id);",
      "CREATE INDEX IF NOT EXISTS idx_games_black_player ON games(black_player_id);",
      "CREATE INDEX IF NOT EXISTS idx_games_date ON games(date_ms);",
      "CREATE INDEX IF NOT EXISTS idx_games_time_control ON games(time_control);",

      "CREATE TABLE IF NOT EXISTS rating_history ("
      " player_id TEXT NOT NULL REFERENCES players(id),"
      " timestamp_ms INTEGER NOT NULL,"
      " rating INTEGER NOT NULL,"
      " seq INTEGER NOT NULL,"
      " time_control INTEGER NOT NULL,"
      " PRIMARY KEY (player_id, seq));",

      "CREATE INDEX IF NOT EXISTS idx_rating_history_player_ts ON rating_history(player_id, timestamp_ms, seq);",

      // append-only, non-decreasing per player
      "CREATE TRIGGER IF NOT EXISTS rating_history_monotonic BEFORE INSERT ON rating_history"
      " WHEN EXISTS (SELECT 1 FROM rating_history WHERE player_id = NEW.player_id AND timestamp_ms > NEW.timestamp_ms)"
      " BEGIN SELECT RAISE(ABORT, 'rating history timestamp regression'); END;",

      "CREATE TABLE IF NOT EXISTS import_runs ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " source TEXT NOT NULL,"
      " started_ms INTEGER NOT NULL,"
      " finished_ms INTEGER NOT NULL,"
      " records_processed INTEGER NOT NULL,"
      " records_accepted INTEGER NOT NULL,"
      " records_rejected INTEGER NOT NULL,"
      " games_committed INTEGER NOT NULL,"
      " duplicates_skipped INTEGER NOT NULL,"
      " failed_batches INTEGER NOT NULL,"
      " cancelled INTEGER NOT NULL);",
  };
  return kStatements;
}

} // namespace chessdb::db::sql
