#pragma once

#include <stdexcept>
#include <string>

namespace chessdb::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  Unavailable,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Transient store conditions: the store may come back, so the
// operation is worth retrying and fatal once retries are exhausted.
inline bool IsUnavailable(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::Unavailable;
}

/*
  Thrown by read operations and transaction control on backend failure.
  Writes report through Result instead.
*/
class DbError : public std::runtime_error {
 public:
  DbError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

// Turns a failed write result into a DbError carrying the same code.
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }
  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw DbError(result.code, message);
}

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace chessdb::db
