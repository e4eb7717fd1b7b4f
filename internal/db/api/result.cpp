#include "internal/db/api/result.hpp"

#include <stdexcept>

namespace lidar::db {

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
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }
  std::string message = context + ": " + ToString(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw std::runtime_error(message);
}

} // namespace lidar::db
