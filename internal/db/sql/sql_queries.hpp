#pragma once

namespace chessdb::db::sql {

/*
  Canonical SQL for the repository.
  Written in the SQLite dialect; parameters bind in order.
*/

// players

static constexpr const char* SELECT_PLAYER_BY_KEY =
    "SELECT id,name_key,display_name,title,current_rating,peak_rating,games_played,"
    "first_seen_ms,last_updated_ms,last_game_at_ms"
    " FROM players WHERE name_key=?;";

static constexpr const char* SELECT_PLAYER_BY_ID =
    "SELECT id,name_key,display_name,title,current_rating,peak_rating,games_played,"
    "first_seen_ms,last_updated_ms,last_game_at_ms"
    " FROM players WHERE id=?;";

static constexpr const char* UPSERT_PLAYER =
    "INSERT INTO players(id,name_key,display_name,title,current_rating,peak_rating,games_played,"
    "first_seen_ms,last_updated_ms,last_game_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " display_name=excluded.display_name,"
    " title=excluded.title,"
    " current_rating=excluded.current_rating,"
    " peak_rating=MAX(players.peak_rating, excluded.peak_rating),"
    " games_played=excluded.games_played,"
    " last_updated_ms=excluded.last_updated_ms,"
    " last_game_at_ms=excluded.last_game_at_ms"
    " WHERE players.name_key=excluded.name_key;";

// openings

static constexpr const char* SELECT_OPENING =
    "SELECT eco_code,name,games,white_wins,black_wins,draws,white_rating_sum,black_rating_sum"
    " FROM openings WHERE eco_code=?;";

static constexpr const char* SELECT_OPENINGS =
    "SELECT eco_code,name,games,white_wins,black_wins,draws,white_rating_sum,black_rating_sum"
    " FROM openings ORDER BY eco_code;";

static constexpr const char* APPLY_OPENING_DELTA =
    "INSERT INTO openings(eco_code,name,games,white_wins,black_wins,draws,white_rating_sum,black_rating_sum)"
    " VALUES(?,?,?,?,?,?,?,?)"
    " ON CONFLICT(eco_code) DO UPDATE SET"
    " name=CASE WHEN openings.name='' THEN excluded.name ELSE openings.name END,"
    " games=openings.games+excluded.games,"
    " white_wins=openings.white_wins+excluded.white_wins,"
    " black_wins=openings.black_wins+excluded.black_wins,"
    " draws=openings.draws+excluded.draws,"
    " white_rating_sum=openings.white_rating_sum+excluded.white_rating_sum,"
    " black_rating_sum=openings.black_rating_sum+excluded.black_rating_sum;";

// games

static constexpr const char* SELECT_GAME_EXISTS =
    "SELECT 1 FROM games WHERE game_key=?;";

static constexpr const char* INSERT_GAME =
    "INSERT INTO games(game_key,white_player_id,black_player_id,white_rating,black_rating,result,date_ms,"
    "eco_code,opening_name,time_control,time_control_raw,ply_count,event,site,moves)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

// rating history

static constexpr const char* INSERT_RATING_POINT =
    "INSERT INTO rating_history(player_id,timestamp_ms,rating,seq,time_control)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_RATING_HISTORY =
    "SELECT player_id,timestamp_ms,rating,seq,time_control"
    " FROM rating_history WHERE player_id=? ORDER BY timestamp_ms, seq;";

// import runs

static constexpr const char* INSERT_IMPORT_RUN =
    "INSERT INTO import_runs(source,started_ms,finished_ms,records_processed,records_accepted,records_rejected,"
    "games_committed,duplicates_skipped,failed_batches,cancelled)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_LAST_IMPORT_RUN =
    "SELECT id,source,started_ms,finished_ms,records_processed,records_accepted,records_rejected,"
    "games_committed,duplicates_skipped,failed_batches,cancelled"
    " FROM import_runs ORDER BY id DESC LIMIT 1;";

// schema

static constexpr const char* INSERT_SCHEMA_VERSION =
    "INSERT OR IGNORE INTO schema_migrations(version,applied_at_ms) VALUES(?,?);";

static constexpr const char* COUNT_COLLECTIONS =
    "SELECT (SELECT COUNT(*) FROM players),"
    " (SELECT COUNT(*) FROM openings),"
    " (SELECT COUNT(*) FROM games),"
    " (SELECT COUNT(*) FROM rating_history),"
    " (SELECT COUNT(*) FROM import_runs);";

}
