#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace phrase::db {

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
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfError(const Result& result, const std::string& context) {
  if (result) return;

  std::string message = context + ": " + ToString(result.code);
  if (!result.message.empty()) message += " (" + result.message + ")";

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case ErrorCode::Busy:
    case ErrorCode::IOError:
      throw util::StorageError(message, true);
    default:
      throw util::StorageError(message, false);
  }
}

} // namespace phrase::db
