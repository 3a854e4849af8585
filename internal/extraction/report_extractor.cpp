#include "report_extractor.hpp"

#include "internal/extraction/extraction_parser.hpp"
#include "internal/extraction/input_format.hpp"
#include "internal/extraction/prompt.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace carelog::extraction {

using observability::IntField;
using observability::StringField;
using util::Status;
using util::StatusCode;

namespace {

Status CheckCallable(const CallOptions& options) {
  if (options.cancellation.IsCancelled()) {
    return Status::Err(StatusCode::kCancelled, "extraction cancelled");
  }
  if (std::chrono::system_clock::now() >= options.deadline) {
    return Status::Err(StatusCode::kDeadlineExceeded, "extraction timed out");
  }
  return Status::Ok();
}

void LogFailure(const model::SourceDocument& document, const char* step, const Status& status) {
  CARELOG_LOG_WARN("extraction failed",
                   {StringField("source", document.name), StringField("step", step),
                    StringField("code", util::StatusCodeName(status.code)), StringField("error", status.message)});
}

} // namespace

ReportExtractor::ReportExtractor(ExtractionServicePtr service, ExtractorOptions options)
    : service_(std::move(service)), options_(options) {
}

util::StatusOr<std::vector<model::CandidateEvent>> ReportExtractor::Extract(const model::SourceDocument& document,
                                                                            const CancellationToken&     token) {
  if (!service_) return Status::Err(StatusCode::kInvalidState, "no extraction service configured");
  if (!document.bytes) return Status::Err(StatusCode::kInvalidArgument, "report has no content");

  CallOptions options;
  options.deadline     = std::chrono::system_clock::now() + options_.timeout;
  options.cancellation = token;

  std::string text;
  if (document.format == model::SourceFormat::kImage) {
    if (auto status = CheckCallable(options); !status.ok()) return status;

    v1::RecognizeTextRequest request;
    request.set_image(document.bytes->data(), static_cast<std::size_t>(document.bytes->size()));
    request.set_source_name(document.name);

    auto response = service_->RecognizeText(request, options);
    if (!response.ok()) {
      LogFailure(document, "ocr", response.status());
      return response.status();
    }
    text = response->text();

    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
      return Status::Err(StatusCode::kMalformedResponse, "no text detected in image");
    }
  } else {
    auto view = storage::common::AsStringView(*document.bytes);
    if (!IsValidUtf8(view)) {
      return Status::Err(StatusCode::kUnsupportedFormat, document.name + " is not valid UTF-8 text");
    }
    text.assign(view);
  }

  if (auto status = CheckCallable(options); !status.ok()) return status;

  v1::ExtractEventsRequest request;
  request.set_text(std::move(text));
  request.set_reference_date(util::FormatDate(document.reference_day));
  request.set_source_context(SourceContext(document));
  request.set_instructions(ExtractionInstructions());

  auto response = service_->ExtractEvents(request, options);
  if (!response.ok()) {
    LogFailure(document, "extract", response.status());
    return response.status();
  }

  // a reply that arrives after Cancel() is discarded
  if (token.IsCancelled()) return Status::Err(StatusCode::kCancelled, "extraction cancelled");

  auto parsed = ParseModelOutput(response->model_output(), document.reference_day);
  if (!parsed.ok()) {
    LogFailure(document, "parse", parsed.status());
    return parsed.status();
  }

  CARELOG_LOG_INFO("report extracted",
                   {StringField("source", document.name),
                    IntField("candidates", static_cast<int64_t>(parsed->candidates.size())),
                    IntField("dropped", static_cast<int64_t>(parsed->dropped.size()))});
  return std::move(parsed->candidates);
}

} // namespace carelog::extraction
