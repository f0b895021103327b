#pragma once

#include <stdexcept>
#include <string>

namespace deliveryiq::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by repository reads and by services when a write Result is not OK.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace deliveryiq::util
