#pragma once

#include <grpcpp/support/status.h>

#include <string_view>

#include "internal/util/status.hpp"

namespace carelog::grpc {

/*
  Converts a gRPC call status into a pipeline Status.

  Connectivity and server-side failures are transient (kUnavailable), so the
  import pipeline queues the report for a later retry.
*/
util::Status FromGrpcStatus(const ::grpc::Status& status, std::string_view action);

} // namespace carelog::grpc
