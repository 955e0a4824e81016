#pragma once

#include <stdexcept>
#include <string>

namespace chessdb::util {

/*
  Run-level error types.

  Record-level problems (malformed or invalid games) are not exceptions;
  they travel as ingest::Rejection values and only show up in counters.
*/

// Store could not be reached, or stayed unreachable after all commit retries.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Import source could not be opened or read.
class InputUnreadable : public std::runtime_error {
 public:
  explicit InputUnreadable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Analytics query exceeded its time budget; no partial result exists.
class QueryTimeout : public std::runtime_error {
 public:
  explicit QueryTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace chessdb::util
