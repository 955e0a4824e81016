#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace chessdb::db::sqlite {

/*
  SqlitePool

  Connection factory used by SqliteRepository.

  - Each transaction gets its own connection.
  - sqlite3 connections are opened NOMUTEX: do not share.
  - Acquire blocks once max_connections are live.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction holds shared_ptr<SqliteDB>; dropping it returns the
    connection to the pool.
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  SqlitePool(std::string path, std::size_t max_connections, std::chrono::milliseconds busy_timeout);

  std::shared_ptr<SqliteDB> Acquire();

  const std::string& Path() const {
    return path_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string               path_;
  std::size_t               max_connections_;
  std::chrono::milliseconds busy_timeout_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace chessdb::db::sqlite
