#include "grpc_status.hpp"

#include <string>

namespace carelog::grpc {

util::Status FromGrpcStatus(const ::grpc::Status& status, std::string_view action) {
  using util::StatusCode;

  if (status.ok()) return util::Status::Ok();

  const auto message = std::string(action) + " failed: " + status.error_message();

  switch (status.error_code()) {
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::INTERNAL:
    case ::grpc::StatusCode::UNKNOWN:
    case ::grpc::StatusCode::ABORTED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return util::Status::Err(StatusCode::kUnavailable, message);
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return util::Status::Err(StatusCode::kDeadlineExceeded, message);
    case ::grpc::StatusCode::CANCELLED:
      return util::Status::Err(StatusCode::kCancelled, message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return util::Status::Err(StatusCode::kInvalidArgument, message);
    default:
      return util::Status::Err(StatusCode::kInternal, message);
  }
}

} // namespace carelog::grpc
