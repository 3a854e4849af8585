#pragma once

#include <chrono>
#include <memory>

#include "carelog/v1.hpp"
#include "internal/extraction/cancellation.hpp"
#include "internal/util/status.hpp"

namespace carelog::extraction {

struct CallOptions {
  std::chrono::system_clock::time_point deadline = std::chrono::system_clock::time_point::max();
  CancellationToken                     cancellation;
};

/*
  OCR and generative extraction, hosted outside this process.

  Implementations must honour options.deadline (kDeadlineExceeded) and
  options.cancellation (kCancelled), and classify connectivity failures as
  kUnavailable. The returned model output is untrusted.

  Implementations:
    GrpcExtractionClient -> remote ExtractionService
*/
class ExtractionService {
 public:
  virtual ~ExtractionService() = default;

  virtual util::StatusOr<v1::RecognizeTextResponse> RecognizeText(const v1::RecognizeTextRequest& request,
                                                                   const CallOptions&              options) = 0;

  virtual util::StatusOr<v1::ExtractEventsResponse> ExtractEvents(const v1::ExtractEventsRequest& request,
                                                                   const CallOptions&              options) = 0;
};

using ExtractionServicePtr = std::shared_ptr<ExtractionService>;

} // namespace carelog::extraction
