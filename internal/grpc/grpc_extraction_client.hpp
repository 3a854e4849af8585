#pragma once

#include <grpcpp/channel.h>

#include <memory>
#include <string>

#include "carelog/v1/extraction_service.grpc.pb.h"
#include "internal/extraction/extraction_service.hpp"

namespace carelog::grpc {

/*
  ExtractionService backed by a remote carelog.v1.ExtractionService.

  Each call gets its own ClientContext carrying the caller's deadline; a
  cancellation of the caller's token cancels the in-flight RPC.
*/
class GrpcExtractionClient final : public extraction::ExtractionService {
 public:
  explicit GrpcExtractionClient(std::shared_ptr<::grpc::Channel> channel);

  // Channel to endpoint ("host:port"), TLS with default roots when use_tls.
  static std::shared_ptr<GrpcExtractionClient> Connect(const std::string& endpoint, bool use_tls);

  util::StatusOr<v1::RecognizeTextResponse> RecognizeText(const v1::RecognizeTextRequest& request,
                                                           const extraction::CallOptions&  options) override;

  util::StatusOr<v1::ExtractEventsResponse> ExtractEvents(const v1::ExtractEventsRequest& request,
                                                           const extraction::CallOptions&  options) override;

 private:
  std::unique_ptr<v1::ExtractionService::Stub> stub_;
};

} // namespace carelog::grpc
