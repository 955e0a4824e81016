#pragma once

#include <string>

#include "config/config.pb.h"

namespace chessdb::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static chessdb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its built-in default.
  static void ApplyDefaults(chessdb::runtime::config::RuntimeConfig* config);

  // Built-in configuration: SQLite at chess_data.db plus all defaults.
  static chessdb::runtime::config::RuntimeConfig Defaults();
};

} // namespace chessdb::config
