#pragma once

#include <chrono>
#include <vector>

#include "internal/extraction/cancellation.hpp"
#include "internal/extraction/extraction_service.hpp"
#include "internal/model/candidate_event.hpp"
#include "internal/model/source_document.hpp"
#include "internal/util/status.hpp"

namespace carelog::extraction {

struct ExtractorOptions {
  // Covers OCR and extraction together.
  std::chrono::milliseconds timeout{30000};
};

/*
  Turns one source document into detected candidates.

    image -> RecognizeText -> ExtractEvents -> ParseModelOutput
    text  ->                  ExtractEvents -> ParseModelOutput

  Failures keep their class: transient (kUnavailable, kDeadlineExceeded),
  kCancelled, kMalformedResponse or kUnsupportedFormat. No internal retries.
*/
class ReportExtractor {
 public:
  ReportExtractor(ExtractionServicePtr service, ExtractorOptions options = {});

  util::StatusOr<std::vector<model::CandidateEvent>> Extract(const model::SourceDocument& document,
                                                             const CancellationToken&     token = {});

 private:
  ExtractionServicePtr service_;
  ExtractorOptions     options_;
};

} // namespace carelog::extraction
