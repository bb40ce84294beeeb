#pragma once

#include <string>

namespace imc::datastore {

/*
  Portable store result codes.

  Backends translate their own errors into these. Conflict is the optimistic
  concurrency signal and must stay distinct from NotFound.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  Unavailable,
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

  bool IsConflict() const {
    return code == ErrorCode::Conflict;
  }

  bool IsNotFound() const {
    return code == ErrorCode::NotFound;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace imc::datastore
