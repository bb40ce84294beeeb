#include "internal/datastore/api/result.hpp"

namespace imc::datastore {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Unavailable:
      return "unavailable";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

} // namespace imc::datastore
