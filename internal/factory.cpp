#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if CHESSDB_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace chessdb::factory {

using chessdb::observability::StringField;
using chessdb::observability::UIntField;

namespace {

std::shared_ptr<db::Repository> OpenBackend(const chessdb::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CHESSDB_DB_SQLITE
    const auto& sqlite = database.sqlite();
    CHESSDB_LOG_INFO("Opening sqlite store", {StringField("path", sqlite.path()), UIntField("max_connections", sqlite.max_connections())});
    auto pool = std::make_shared<db::sqlite::SqlitePool>(sqlite.path(), sqlite.max_connections(), util::FromProto(sqlite.busy_timeout()));
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  CHESSDB_LOG_INFO("Using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const chessdb::runtime::config::RuntimeConfig& config) {
  try {
    auto repository = OpenBackend(config);
    repository->EnsureSchema();
    return repository;
  } catch (const db::DbError& e) {
    if (db::IsUnavailable(e.code())) {
      throw util::StoreUnavailable(std::string("cannot open store: ") + e.what());
    }
    throw;
  }
}

Application Build(const chessdb::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository     = BuildRepository(config);
  app.analytics      = std::make_shared<analytics::AnalyticsEngine>(app.repository, analytics::AnalyticsDefaults::FromConfig(config.analytics()));
  app.import_options = ingest::ImportOptions::FromConfig(config);
  return app;
}

} // namespace chessdb::factory
