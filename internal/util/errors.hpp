#pragma once

#include <stdexcept>
#include <string>

namespace imc::util {

/*
  Central error types.

  Reconciliation code throws these; the controller wraps them with the key
  being synced and the admin adapter translates them to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
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

// Remote daemon or object store could not be reached.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace imc::util
