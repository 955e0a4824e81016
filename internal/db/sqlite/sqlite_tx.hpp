#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chessdb::db::sqlite {

/*
  SQLite transaction wrapper. Owns its pooled connection.

  Write: BEGIN IMMEDIATE
    - grabs write lock early
    - avoids deadlock-y upgrades later
  Read: BEGIN DEFERRED
    - WAL snapshot taken at first read, held until the end
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return read_only_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool read_only_ = false;
  bool committed_ = false;
  bool finished_ = false;
};

}
