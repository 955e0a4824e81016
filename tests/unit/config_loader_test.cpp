#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "chessdb_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\chess\\\"quoted\"\\games.db"
    max_connections: 2
)");

  auto config = chessdb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\chess\\\"quoted\"\\games.db");
  assert(config.database().sqlite().max_connections() == 2);
}

void TestFullConfigAndDurations() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
database:
  memory: {}
validation:
  min_rating: 100
  max_rating: 3000
ingest:
  max_batch_records: 250
  max_batch_bytes: 65536
commit:
  max_retries: 5
  initial_backoff: "0.01s"
  max_backoff: 1s
analytics:
  default_min_games: 3
  query_timeout: "2.5s"
)");

  auto config = chessdb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_memory());
  assert(config.validation().min_rating() == 100);
  assert(config.validation().max_rating() == 3000);
  // unset fields get defaults
  assert(config.validation().max_plies() == 500);
  assert(config.ingest().max_batch_records() == 250);
  assert(config.ingest().max_batch_bytes() == 65536);
  assert(config.ingest().max_queued_batches() == 1);
  assert(config.commit().max_retries() == 5);
  assert(config.commit().initial_backoff().nanos() == 10000000);
  assert(config.commit().max_backoff().seconds() == 1);
  assert(config.commit().backoff_multiplier() == 2.0);
  assert(config.analytics().default_min_games() == 3);
  assert(config.analytics().query_timeout().seconds() == 2);
  assert(config.analytics().query_timeout().nanos() == 500000000);
}

void TestEmptyFileYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = chessdb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "chess_data.db");
  assert(config.database().sqlite().busy_timeout().seconds() == 5);
  assert(config.commit().max_retries() == 3);
  assert(config.commit().initial_backoff().nanos() == 50000000);
  assert(config.ingest().max_batch_records() == 1000);
  assert(config.ingest().max_batch_bytes() == 8 * 1024 * 1024);
  assert(config.analytics().result_limit() == 50);
  assert(!config.analytics().has_query_timeout());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)chessdb::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)chessdb::config::ConfigLoader::LoadFromYaml("/nonexistent/chessdb.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestFullConfigAndDurations();
  TestEmptyFileYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();

  std::cout << "chessdb_unit_config_loader: pass\n";
  return 0;
}
