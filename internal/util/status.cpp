#include "status.hpp"

#include "internal/util/errors.hpp"

namespace carelog::util {

const char* StatusCodeName(StatusCode code) {
  switch (code) {
    case StatusCode::kOk:
      return "OK";
    case StatusCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case StatusCode::kNotFound:
      return "NOT_FOUND";
    case StatusCode::kInvalidState:
      return "INVALID_STATE";
    case StatusCode::kUnsupportedFormat:
      return "UNSUPPORTED_FORMAT";
    case StatusCode::kMalformedResponse:
      return "MALFORMED_RESPONSE";
    case StatusCode::kUnavailable:
      return "UNAVAILABLE";
    case StatusCode::kDeadlineExceeded:
      return "DEADLINE_EXCEEDED";
    case StatusCode::kCancelled:
      return "CANCELLED";
    case StatusCode::kStorageError:
      return "STORAGE_ERROR";
    case StatusCode::kInternal:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

std::string Status::ToString() const {
  if (message.empty()) return StatusCodeName(code);
  return std::string(StatusCodeName(code)) + ": " + message;
}

Status ToStatus(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) return Status::Err(StatusCode::kNotFound, e.what());
  if (dynamic_cast<const AlreadyExists*>(&e)) return Status::Err(StatusCode::kInvalidState, e.what());
  if (dynamic_cast<const InvalidState*>(&e)) return Status::Err(StatusCode::kInvalidState, e.what());
  if (dynamic_cast<const StorageError*>(&e)) return Status::Err(StatusCode::kStorageError, e.what());
  if (dynamic_cast<const std::invalid_argument*>(&e)) return Status::Err(StatusCode::kInvalidArgument, e.what());

  return Status::Err(StatusCode::kInternal, e.what());
}

} // namespace carelog::util
