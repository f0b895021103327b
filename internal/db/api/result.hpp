#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace deliveryiq::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
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

  Unsupported,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
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
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
    default:
      return "internal_error";
  }
}

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

// Converts a failed write into the matching util:: exception.
inline void ThrowIfError(const Result& result, std::string_view what) {
  if (result) {
    return;
  }

  std::string msg = std::string(what) + ": " + std::string(ToString(result.code));
  if (!result.message.empty()) {
    msg += " (" + result.message + ")";
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case ErrorCode::Conflict:
      throw util::InvalidState(msg);
    default:
      throw util::StorageError(msg);
  }
}

} // namespace deliveryiq::db
