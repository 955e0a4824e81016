#include "sqlite_db.hpp"

#include <type_traits>

namespace chessdb::db::sqlite {

ErrorCode TranslateCode(int rc, int extended_rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      if (extended_rc == SQLITE_CONSTRAINT_UNIQUE || extended_rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return ErrorCode::AlreadyExists;
      }
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CANTOPEN:
    case SQLITE_NOTADB:
    case SQLITE_READONLY:
      return ErrorCode::Unavailable;
    case SQLITE_CORRUPT:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(ErrorCode::Unavailable, "cannot open " + path_ + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(busy_timeout);
  } catch (const DbError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

DbError SqliteDB::LastError(int rc, const std::string& context) const {
  const int extended = db_ ? sqlite3_extended_errcode(db_) : rc;
  const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
  return DbError(TranslateCode(rc, extended), context + ": " + msg);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DbError(TranslateCode(rc, sqlite3_extended_errcode(db_)), msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    throw LastError(rc, "sqlite prepare");
  }
  return Statement(stmt);
}

void SqliteDB::Bind(sqlite3_stmt* st, const sql::Params& params) {
  int idx = 1;
  for (const auto& param : params) {
    int rc = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st, idx);
          } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(st, idx, v);
          } else {
            return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
          }
        },
        param);
    if (rc != SQLITE_OK) throw LastError(rc, "sqlite bind");
    ++idx;
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count()));
  if (rc != SQLITE_OK) throw LastError(rc, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace chessdb::db::sqlite
