#include "grpc_extraction_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <string>

#include "internal/grpc/grpc_status.hpp"

namespace carelog::grpc {

namespace {

template <typename Response, typename Call>
util::StatusOr<Response> Invoke(const extraction::CallOptions& options, std::string_view action, Call&& call) {
  if (options.cancellation.IsCancelled()) {
    return util::Status::Err(util::StatusCode::kCancelled, std::string(action) + " cancelled");
  }

  ::grpc::ClientContext ctx;
  if (options.deadline != std::chrono::system_clock::time_point::max()) {
    ctx.set_deadline(options.deadline);
  }
  // declared after ctx so it is released first
  auto registration = options.cancellation.OnCancel([&ctx] { ctx.TryCancel(); });

  Response response;
  auto     status = call(&ctx, &response);
  if (!status.ok()) return FromGrpcStatus(status, action);
  return response;
}

} // namespace

GrpcExtractionClient::GrpcExtractionClient(std::shared_ptr<::grpc::Channel> channel)
    : stub_(v1::ExtractionService::NewStub(std::move(channel))) {
}

std::shared_ptr<GrpcExtractionClient> GrpcExtractionClient::Connect(const std::string& endpoint, bool use_tls) {
  auto credentials = use_tls ? ::grpc::SslCredentials(::grpc::SslCredentialsOptions()) : ::grpc::InsecureChannelCredentials();
  return std::make_shared<GrpcExtractionClient>(::grpc::CreateChannel(endpoint, credentials));
}

util::StatusOr<v1::RecognizeTextResponse> GrpcExtractionClient::RecognizeText(const v1::RecognizeTextRequest& request,
                                                                              const extraction::CallOptions&  options) {
  return Invoke<v1::RecognizeTextResponse>(options, "RecognizeText",
                                           [&](::grpc::ClientContext* ctx, v1::RecognizeTextResponse* response) {
                                             return stub_->RecognizeText(ctx, request, response);
                                           });
}

util::StatusOr<v1::ExtractEventsResponse> GrpcExtractionClient::ExtractEvents(const v1::ExtractEventsRequest& request,
                                                                              const extraction::CallOptions&  options) {
  return Invoke<v1::ExtractEventsResponse>(options, "ExtractEvents",
                                           [&](::grpc::ClientContext* ctx, v1::ExtractEventsResponse* response) {
                                             return stub_->ExtractEvents(ctx, request, response);
                                           });
}

} // namespace carelog::grpc
