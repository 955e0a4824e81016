#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace chessdb::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

// Maps sqlite primary/extended result codes to portable codes.
ErrorCode TranslateCode(int rc, int extended_rc);

/*
  Thin RAII wrapper around one sqlite3* connection.
  Not thread-safe: one connection per transaction.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/tx control).
  // Throws DbError.
  void Exec(const std::string& sql);

  // Throws DbError.
  Statement Prepare(const std::string& sql);

  // Binds ordered ? parameters starting at index 1.
  void Bind(sqlite3_stmt* st, const sql::Params& params);

  // DbError for the connection's last error.
  DbError LastError(int rc, const std::string& context) const;

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(std::chrono::milliseconds busy_timeout);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace chessdb::db::sqlite
