#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace chessdb::config {

namespace {

constexpr const char* kDefaultSqlitePath = "chess_data.db";

void SetDuration(google::protobuf::Duration* d, int64_t millis) {
  d->set_seconds(millis / 1000);
  d->set_nanos(static_cast<int32_t>((millis % 1000) * 1000000));
}

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings: durations such as "0.05s"
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

chessdb::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  chessdb::runtime::config::RuntimeConfig config;

  // empty file: all defaults
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(chessdb::runtime::config::RuntimeConfig* config) {
  auto* logging = config->mutable_logging();
  if (logging->level().empty()) logging->set_level("info");

  auto* database = config->mutable_database();
  if (database->backend_case() == chessdb::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_sqlite()->set_path(kDefaultSqlitePath);
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) sqlite->set_path(kDefaultSqlitePath);
    if (sqlite->max_connections() == 0) sqlite->set_max_connections(4);
    if (IsUnset(sqlite->busy_timeout())) SetDuration(sqlite->mutable_busy_timeout(), 5000);
  }

  auto* validation = config->mutable_validation();
  if (validation->min_rating() == 0) validation->set_min_rating(1);
  if (validation->max_rating() == 0) validation->set_max_rating(3500);
  if (validation->min_plies() == 0) validation->set_min_plies(2);
  if (validation->max_plies() == 0) validation->set_max_plies(500);
  if (validation->max_block_bytes() == 0) validation->set_max_block_bytes(1024 * 1024);

  auto* ingest = config->mutable_ingest();
  if (ingest->max_batch_records() == 0) ingest->set_max_batch_records(1000);
  if (ingest->max_batch_bytes() == 0) ingest->set_max_batch_bytes(8 * 1024 * 1024);
  if (ingest->progress_interval_batches() == 0) ingest->set_progress_interval_batches(10);
  if (ingest->max_queued_batches() == 0) ingest->set_max_queued_batches(1);

  auto* commit = config->mutable_commit();
  if (commit->max_retries() == 0) commit->set_max_retries(3);
  if (IsUnset(commit->initial_backoff())) SetDuration(commit->mutable_initial_backoff(), 50);
  if (IsUnset(commit->max_backoff())) SetDuration(commit->mutable_max_backoff(), 2000);
  if (commit->backoff_multiplier() <= 0.0) commit->set_backoff_multiplier(2.0);

  auto* analytics = config->mutable_analytics();
  if (analytics->default_min_games() == 0) analytics->set_default_min_games(1);
  if (analytics->result_limit() == 0) analytics->set_result_limit(50);
}

chessdb::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  chessdb::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

} // namespace chessdb::config
