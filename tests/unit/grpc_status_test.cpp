#include <cassert>
#include <iostream>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_status.hpp"

namespace {

using carelog::grpc::FromGrpcStatus;
using carelog::util::StatusCode;

StatusCode Mapped(::grpc::StatusCode code) {
  return FromGrpcStatus(::grpc::Status(code, "boom"), "ExtractEvents").code;
}

void TestOkStatusMapsToOk() {
  assert(FromGrpcStatus(::grpc::Status::OK, "RecognizeText").ok());
}

void TestConnectivityFailuresAreTransient() {
  for (auto code : {::grpc::StatusCode::UNAVAILABLE, ::grpc::StatusCode::INTERNAL, ::grpc::StatusCode::UNKNOWN,
                    ::grpc::StatusCode::ABORTED, ::grpc::StatusCode::RESOURCE_EXHAUSTED}) {
    auto status = FromGrpcStatus(::grpc::Status(code, "down"), "ExtractEvents");
    assert(status.code == StatusCode::kUnavailable);
    assert(status.IsTransient());
  }

  auto timeout = FromGrpcStatus(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "slow"), "ExtractEvents");
  assert(timeout.code == StatusCode::kDeadlineExceeded);
  assert(timeout.IsTransient());
}

void TestCallerSideFailuresArePermanent() {
  assert(Mapped(::grpc::StatusCode::CANCELLED) == StatusCode::kCancelled);
  assert(Mapped(::grpc::StatusCode::INVALID_ARGUMENT) == StatusCode::kInvalidArgument);
  assert(Mapped(::grpc::StatusCode::PERMISSION_DENIED) == StatusCode::kInternal);
  assert(Mapped(::grpc::StatusCode::UNIMPLEMENTED) == StatusCode::kInternal);
}

void TestMessageNamesTheCall() {
  auto status = FromGrpcStatus(::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "connection refused"), "RecognizeText");
  assert(status.message.find("RecognizeText") != std::string::npos);
  assert(status.message.find("connection refused") != std::string::npos);
}

} // namespace

int main() {
  TestOkStatusMapsToOk();
  TestConnectivityFailuresAreTransient();
  TestCallerSideFailuresArePermanent();
  TestMessageNamesTheCall();

  std::cout << "carelog_unit_grpc_status: pass\n";
  return 0;
}
