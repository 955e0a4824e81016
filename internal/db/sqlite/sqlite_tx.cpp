#include "sqlite_tx.hpp"

#include <sqlite3.h>

namespace chessdb::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only) : db_(std::move(db)), read_only_(read_only) {
  db_->Exec(read_only_ ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_ && sqlite3_get_autocommit(db_->Handle()) == 0) {
    // destructor: no throw
    (void)sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    db_->Exec("ROLLBACK;");
  }
}

} // namespace chessdb::db::sqlite
