#pragma once

#include <string>
#include <vector>

namespace chessdb::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Statements must be idempotent
  (IF NOT EXISTS) so re-running on an existing store is harmless.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Current schema: tables, indexes and the rating history guard.
const std::vector<std::string>& SchemaStatements();

inline constexpr int kSchemaVersion = 1;

} // namespace chessdb::db::sql
