#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/analytics/analytics_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/import_pipeline.hpp"

namespace chessdb::factory {

/*
  Application

  Long-lived objects shared by every command of one process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<analytics::AnalyticsEngine> analytics;
  ingest::ImportOptions                       import_options;
};

/*
  BuildRepository

  Opens the configured backend and ensures its schema.

  NOTE:
  This is the ONLY place allowed to know concrete DB types.

  Throws util::StoreUnavailable when the store cannot be opened.
*/
std::shared_ptr<db::Repository> BuildRepository(const chessdb::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: repository, analytics engine and import options
  from one runtime config.
*/
Application Build(const chessdb::runtime::config::RuntimeConfig& config);

} // namespace chessdb::factory
